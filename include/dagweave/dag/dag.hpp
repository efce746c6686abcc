#pragma once

#include "dagweave/core/error.hpp"
#include "dagweave/util/id.hpp"

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <utility>
#include <vector>

namespace dagweave {

class ITask;

using NodeIndex = std::uint32_t;
constexpr NodeIndex kInvalidNode = UINT32_MAX;

using TaskIdSet = ankerl::unordered_dense::set<TaskId>;
using Levels = std::vector<std::vector<TaskId>>;

// Task graph. Edges point from an upstream task to the task that depends on
// it. Acyclicity is not enforced on insertion; levels() and is_valid() report
// Error::CycleDetected.
class DAG {
public:
  DAG();
  ~DAG();
  DAG(DAG &&) noexcept;
  DAG &operator=(DAG &&) noexcept;
  DAG(const DAG &) = delete;
  DAG &operator=(const DAG &) = delete;

  // Re-adding an existing id keeps its edges and replaces the runnable.
  [[nodiscard]] auto add_node(TaskId task_id,
                              std::unique_ptr<ITask> runnable = nullptr)
      -> Result<NodeIndex>;
  [[nodiscard]] auto add_task(std::unique_ptr<ITask> runnable)
      -> Result<NodeIndex>;

  [[nodiscard]] auto add_edge(const TaskId &upstream,
                              const TaskId &downstream) -> Result<void>;
  [[nodiscard]] auto add_edge(NodeIndex upstream, NodeIndex downstream)
      -> Result<void>;

  [[nodiscard]] auto has_node(const TaskId &task_id) const -> bool;
  [[nodiscard]] auto has_edge(const TaskId &upstream,
                              const TaskId &downstream) const -> bool;
  [[nodiscard]] auto is_valid() const -> Result<void>;

  // Kahn's algorithm in waves: every level holds the nodes whose upstream
  // tasks all sit in earlier levels. Same-level order follows insertion.
  [[nodiscard]] auto levels() const -> Result<Levels>;

  [[nodiscard]] auto downstream_closure(const TaskId &task_id) const
      -> TaskIdSet;
  [[nodiscard]] auto upstream_closure(const TaskId &task_id) const
      -> TaskIdSet;
  [[nodiscard]] auto direct_upstream_of(const TaskId &task_id) const
      -> std::vector<TaskId>;
  [[nodiscard]] auto direct_downstream_of(const TaskId &task_id) const
      -> std::vector<TaskId>;

  [[nodiscard]] auto get_deps_view(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex>;
  [[nodiscard]] auto get_dependents_view(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex>;

  [[nodiscard]] auto get_index(const TaskId &task_id) const -> NodeIndex;
  [[nodiscard]] auto get_key(NodeIndex idx) const -> const TaskId &;

  [[nodiscard]] auto task(const TaskId &task_id) const -> ITask *;
  [[nodiscard]] auto task(NodeIndex idx) const -> ITask *;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return nodes_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return nodes_.empty(); }

  [[nodiscard]] auto all_nodes() const -> std::vector<TaskId> { return keys_; }
  [[nodiscard]] auto edges() const -> std::vector<std::pair<TaskId, TaskId>>;

  // Deep copy: every runnable is cloned.
  [[nodiscard]] auto clone() const -> DAG;

private:
  [[nodiscard]] auto has_edge(NodeIndex from, NodeIndex to) const noexcept
      -> bool;
  [[nodiscard]] auto closure(NodeIndex start, bool follow_dependents) const
      -> TaskIdSet;

  static constexpr std::size_t kMaxNodes = 1'000'000;

  struct Node {
    std::vector<NodeIndex> deps;
    std::vector<NodeIndex> dependents;
    std::unique_ptr<ITask> runnable;
  };

  std::vector<Node> nodes_;
  std::vector<TaskId> keys_;
  ankerl::unordered_dense::map<TaskId, NodeIndex> key_to_idx_;
};

using DependencyGraph = DAG;

// Must build a new, independent graph on every call.
using GraphFactory = std::function<Result<DAG>()>;

} // namespace dagweave
