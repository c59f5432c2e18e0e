#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "engine/error.hpp"
#include "engine/registry.hpp"
#include "engine/step.hpp"

namespace dwas::engine {

struct Graph {
  std::vector<Node> nodes;
  std::unordered_map<std::string, int> index;
  std::vector<std::vector<int>> requirements;
  std::vector<std::vector<int>> dependents;
  std::vector<int> topo_order;

  auto index_of(std::string_view key) const -> int;
  auto find(std::string_view key) const -> const Node*;
  /// Step members of a group, or the node itself for a step.
  auto members(int node) const -> std::vector<int>;
};

auto build_graph(const StepRegistry& registry) -> Expected<Graph>;

}  // namespace dwas::engine
