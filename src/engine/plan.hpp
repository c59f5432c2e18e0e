#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "engine/error.hpp"
#include "engine/graph.hpp"
#include "engine/step.hpp"

namespace dwas::engine {

enum class Phase {
  Full,
  SetupOnly,
  RunOnly,
};

auto to_string(Phase phase) -> std::string_view;

struct PlanNode {
  const Node* node = nullptr;
  int graph_index = -1;
  Phase phase = Phase::Full;
  bool excluded_but_required = false;
  std::vector<int> requirements;
};

/// Selected nodes in topological order. Plan-local indices refer into `nodes`.
struct ExecutionPlan {
  const Graph* graph = nullptr;
  std::vector<PlanNode> nodes;
  std::vector<std::vector<int>> dependents;
  std::vector<int> pending_counts;
  std::unordered_map<std::string, int> index;

  auto size() const -> std::size_t { return nodes.size(); }
  auto index_of(std::string_view key) const -> int;
  auto find(std::string_view key) const -> const PlanNode*;
  auto keys() const -> std::vector<std::string>;
};

struct PlanFlags {
  std::vector<char> excluded_but_required;
};

/// Requirements pointing outside the selection are dropped. The graph must
/// outlive the plan.
auto make_plan(const Graph& graph, const std::vector<char>& selected, Phase phase, const PlanFlags& flags = {})
  -> ExecutionPlan;

}  // namespace dwas::engine
