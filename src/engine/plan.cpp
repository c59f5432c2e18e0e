#include "engine/plan.hpp"

#include <utility>

namespace dwas::engine {

auto to_string(Phase phase) -> std::string_view {
  switch (phase) {
    case Phase::Full:
      return "full";
    case Phase::SetupOnly:
      return "setup-only";
    case Phase::RunOnly:
      return "run-only";
  }
  return "full";
}

auto ExecutionPlan::index_of(std::string_view key) const -> int {
  auto it = index.find(std::string(key));
  if (it == index.end()) {
    return -1;
  }
  return it->second;
}

auto ExecutionPlan::find(std::string_view key) const -> const PlanNode* {
  int node = index_of(key);
  if (node < 0) {
    return nullptr;
  }
  return &nodes[static_cast<std::size_t>(node)];
}

auto ExecutionPlan::keys() const -> std::vector<std::string> {
  std::vector<std::string> out;
  out.reserve(nodes.size());
  for (const auto& node : nodes) {
    out.push_back(node.node->key);
  }
  return out;
}

auto make_plan(const Graph& graph, const std::vector<char>& selected, Phase phase, const PlanFlags& flags)
  -> ExecutionPlan {
  ExecutionPlan plan;
  plan.graph = &graph;
  std::vector<int> local(graph.nodes.size(), -1);

  for (int graph_index : graph.topo_order) {
    auto position = static_cast<std::size_t>(graph_index);
    if (position >= selected.size() || !selected[position]) {
      continue;
    }
    PlanNode node;
    node.node = &graph.nodes[position];
    node.graph_index = graph_index;
    node.phase = phase;
    node.excluded_but_required =
      position < flags.excluded_but_required.size() && flags.excluded_but_required[position];
    local[position] = static_cast<int>(plan.nodes.size());
    plan.index.emplace(node.node->key, static_cast<int>(plan.nodes.size()));
    plan.nodes.push_back(std::move(node));
  }

  plan.dependents.assign(plan.nodes.size(), {});
  plan.pending_counts.assign(plan.nodes.size(), 0);
  for (std::size_t i = 0; i < plan.nodes.size(); ++i) {
    auto& node = plan.nodes[i];
    for (int requirement : graph.requirements[static_cast<std::size_t>(node.graph_index)]) {
      int mapped = local[static_cast<std::size_t>(requirement)];
      if (mapped < 0) {
        continue;
      }
      node.requirements.push_back(mapped);
      plan.dependents[static_cast<std::size_t>(mapped)].push_back(static_cast<int>(i));
    }
    plan.pending_counts[i] = static_cast<int>(node.requirements.size());
  }
  return plan;
}

}  // namespace dwas::engine
