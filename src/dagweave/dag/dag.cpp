#include "dagweave/dag/dag.hpp"

#include "dagweave/scheduler/task.hpp"
#include "dagweave/util/log.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace dagweave {

DAG::DAG() = default;
DAG::~DAG() = default;
DAG::DAG(DAG &&) noexcept = default;
DAG &DAG::operator=(DAG &&) noexcept = default;

auto DAG::add_node(TaskId task_id, std::unique_ptr<ITask> runnable)
    -> Result<NodeIndex> {
  if (!is_valid_id(task_id.value())) {
    return fail(Error::InvalidArgument);
  }

  if (const auto existing = get_index(task_id); existing != kInvalidNode) {
    log::warn("Task '{}' added twice; replacing its runnable", task_id);
    nodes_[existing].runnable = std::move(runnable);
    return ok(existing);
  }
  if (nodes_.size() >= kMaxNodes) {
    log::error("Graph is full ({} tasks); cannot add '{}'", kMaxNodes,
               task_id);
    return fail(Error::InvalidArgument);
  }

  const auto idx = static_cast<NodeIndex>(nodes_.size());
  nodes_.push_back(Node{.deps = {}, .dependents = {},
                        .runnable = std::move(runnable)});
  keys_.push_back(task_id);
  key_to_idx_.emplace(std::move(task_id), idx);
  return ok(idx);
}

auto DAG::add_task(std::unique_ptr<ITask> runnable) -> Result<NodeIndex> {
  if (!runnable) {
    return fail(Error::InvalidArgument);
  }
  auto task_id = runnable->id();
  return add_node(std::move(task_id), std::move(runnable));
}

auto DAG::add_edge(const TaskId &upstream, const TaskId &downstream)
    -> Result<void> {
  NodeIndex from_idx = get_index(upstream);
  NodeIndex to_idx = get_index(downstream);
  if (from_idx == kInvalidNode || to_idx == kInvalidNode) [[unlikely]] {
    log::error("Edge {} -> {} references an unknown task", upstream,
               downstream);
    return fail(Error::UnknownNode);
  }
  return add_edge(from_idx, to_idx);
}

auto DAG::add_edge(NodeIndex upstream, NodeIndex downstream) -> Result<void> {
  if (upstream >= nodes_.size() || downstream >= nodes_.size()) [[unlikely]] {
    return fail(Error::UnknownNode);
  }
  if (has_edge(upstream, downstream)) {
    return ok();
  }

  nodes_[downstream].deps.emplace_back(upstream);
  nodes_[upstream].dependents.emplace_back(downstream);
  return ok();
}

auto DAG::has_edge(NodeIndex from, NodeIndex to) const noexcept -> bool {
  if (from >= nodes_.size() || to >= nodes_.size()) {
    return false;
  }
  return std::ranges::contains(nodes_[from].dependents, to);
}

auto DAG::has_edge(const TaskId &upstream, const TaskId &downstream) const
    -> bool {
  return has_edge(get_index(upstream), get_index(downstream));
}

auto DAG::has_node(const TaskId &task_id) const -> bool {
  return key_to_idx_.contains(task_id);
}

auto DAG::is_valid() const -> Result<void> {
  return levels().transform([](const Levels &) {});
}

auto DAG::levels() const -> Result<Levels> {
  std::vector<std::size_t> in_degree;
  in_degree.reserve(nodes_.size());
  for (const auto &node : nodes_) {
    in_degree.emplace_back(node.deps.size());
  }

  std::vector<NodeIndex> current;
  for (NodeIndex i = 0; i < nodes_.size(); ++i) {
    if (in_degree[i] == 0) {
      current.emplace_back(i);
    }
  }

  Levels result;
  std::size_t placed = 0;
  std::vector<NodeIndex> next;
  while (!current.empty()) {
    std::ranges::sort(current);

    auto &level = result.emplace_back();
    level.reserve(current.size());
    next.clear();
    for (NodeIndex idx : current) {
      level.emplace_back(keys_[idx]);
      for (NodeIndex dep : nodes_[idx].dependents) {
        if (--in_degree[dep] == 0) {
          next.emplace_back(dep);
        }
      }
    }
    placed += current.size();
    std::swap(current, next);
  }

  if (placed < nodes_.size()) {
    log::error("Dependency graph has a cycle: placed {} of {} tasks", placed,
               nodes_.size());
    return fail(Error::CycleDetected);
  }
  return ok(std::move(result));
}

auto DAG::closure(NodeIndex start, bool follow_dependents) const
    -> TaskIdSet {
  TaskIdSet out;
  if (start >= nodes_.size()) {
    return out;
  }

  std::vector<bool> seen(nodes_.size(), false);
  std::vector<NodeIndex> queue{start};
  seen[start] = true;
  std::size_t head = 0;
  while (head < queue.size()) {
    NodeIndex current = queue[head++];
    const auto &next = follow_dependents ? nodes_[current].dependents
                                         : nodes_[current].deps;
    for (NodeIndex n : next) {
      if (!seen[n]) {
        seen[n] = true;
        queue.emplace_back(n);
        out.emplace(keys_[n]);
      }
    }
  }
  // A self-loop reaches the start node again; the closure never includes it.
  out.erase(keys_[start]);
  return out;
}

auto DAG::downstream_closure(const TaskId &task_id) const -> TaskIdSet {
  return closure(get_index(task_id), true);
}

auto DAG::upstream_closure(const TaskId &task_id) const -> TaskIdSet {
  return closure(get_index(task_id), false);
}

auto DAG::direct_upstream_of(const TaskId &task_id) const
    -> std::vector<TaskId> {
  std::vector<TaskId> out;
  for (NodeIndex dep : get_deps_view(get_index(task_id))) {
    out.emplace_back(keys_[dep]);
  }
  return out;
}

auto DAG::direct_downstream_of(const TaskId &task_id) const
    -> std::vector<TaskId> {
  std::vector<TaskId> out;
  for (NodeIndex dep : get_dependents_view(get_index(task_id))) {
    out.emplace_back(keys_[dep]);
  }
  return out;
}

auto DAG::get_deps_view(NodeIndex idx) const noexcept
    -> std::span<const NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].deps;
}

auto DAG::get_dependents_view(NodeIndex idx) const noexcept
    -> std::span<const NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].dependents;
}

auto DAG::get_index(const TaskId &task_id) const -> NodeIndex {
  auto it = key_to_idx_.find(task_id);
  return it != key_to_idx_.end() ? it->second : kInvalidNode;
}

auto DAG::get_key(NodeIndex idx) const -> const TaskId & {
  static const TaskId kEmpty;
  if (idx >= keys_.size()) {
    return kEmpty;
  }
  return keys_[idx];
}

auto DAG::task(const TaskId &task_id) const -> ITask * {
  return task(get_index(task_id));
}

auto DAG::task(NodeIndex idx) const -> ITask * {
  if (idx >= nodes_.size()) {
    return nullptr;
  }
  return nodes_[idx].runnable.get();
}

auto DAG::edges() const -> std::vector<std::pair<TaskId, TaskId>> {
  std::vector<std::pair<TaskId, TaskId>> out;
  for (NodeIndex i = 0; i < nodes_.size(); ++i) {
    for (NodeIndex dep : nodes_[i].dependents) {
      out.emplace_back(keys_[i], keys_[dep]);
    }
  }
  return out;
}

auto DAG::clone() const -> DAG {
  DAG copy;
  copy.keys_ = keys_;
  copy.key_to_idx_ = key_to_idx_;
  copy.nodes_.reserve(nodes_.size());
  for (const auto &node : nodes_) {
    Node n;
    n.deps = node.deps;
    n.dependents = node.dependents;
    if (node.runnable) {
      n.runnable = node.runnable->clone();
    }
    copy.nodes_.emplace_back(std::move(n));
  }
  return copy;
}

} // namespace dagweave
