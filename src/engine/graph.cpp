#include "engine/graph.hpp"

#include <algorithm>
#include <format>
#include <functional>
#include <queue>
#include <unordered_set>

namespace dwas::engine {
namespace {

struct GraphBuilder {
  const StepRegistry& registry;

  std::vector<Node> nodes;
  std::unordered_map<std::string, int> node_index;
  std::vector<std::vector<int>> edges;

  auto add_node(Node node) -> Expected<void> {
    if (node_index.contains(node.key)) {
      return tl::unexpected(make_error(ErrorCode::DuplicateStep,
                                       std::format("A step with the name '{}' has already been registered", node.key)));
    }
    node_index.emplace(node.key, static_cast<int>(nodes.size()));
    nodes.push_back(std::move(node));
    return {};
  }

  auto build_steps() -> Expected<void> {
    for (const auto& spec : registry.steps()) {
      auto variants = expand(spec);
      if (!variants) {
        return tl::unexpected(variants.error());
      }

      Node group;
      group.key = spec.name;
      group.name = spec.name;
      group.kind = NodeKind::Group;
      group.description = spec.description.value_or("");
      group.run_by_default = true;
      const bool synthesize_group = variants->size() > 1;

      for (auto& variant : *variants) {
        if (synthesize_group) {
          group.requirements.push_back(variant.key);
          group.run_by_default = group.run_by_default && variant.run_by_default;
        }
        if (auto added = add_node(std::move(variant)); !added) {
          return tl::unexpected(added.error());
        }
      }
      if (synthesize_group) {
        if (auto added = add_node(std::move(group)); !added) {
          return tl::unexpected(added.error());
        }
      }
    }
    return {};
  }

  auto build_groups() -> Expected<void> {
    for (const auto& group : registry.groups()) {
      if (auto added = add_node(make_group_node(group)); !added) {
        return tl::unexpected(added.error());
      }
    }
    return {};
  }

  auto flatten_group(const std::string& key, std::vector<std::string>& path,
                     std::unordered_map<std::string, std::vector<std::string>>& memo)
    -> Expected<std::vector<std::string>> {
    const auto& node = nodes[static_cast<std::size_t>(node_index.at(key))];
    if (node.kind == NodeKind::Step) {
      return std::vector<std::string>{key};
    }
    if (auto it = memo.find(key); it != memo.end()) {
      return it->second;
    }
    if (auto it = std::find(path.begin(), path.end(), key); it != path.end()) {
      std::vector<std::string> cycle(it, path.end());
      cycle.push_back(key);
      return tl::unexpected(make_error(
        ErrorCode::CyclicGraph,
        std::format("Cyclic dependencies between steps: {}", join_keys(cycle, " --> "))));
    }

    path.push_back(key);
    std::vector<std::string> flattened;
    std::unordered_set<std::string> seen;
    for (const auto& member : node.requirements) {
      if (!node_index.contains(member)) {
        return tl::unexpected(
          make_error(ErrorCode::UnknownStep, std::format("Unknown steps: {} (required by {})", member, key)));
      }
      auto expanded = flatten_group(member, path, memo);
      if (!expanded) {
        return tl::unexpected(expanded.error());
      }
      for (auto& entry : *expanded) {
        if (seen.insert(entry).second) {
          flattened.push_back(std::move(entry));
        }
      }
    }
    path.pop_back();
    memo.emplace(key, flattened);
    return flattened;
  }

  auto flatten_groups() -> Expected<void> {
    std::unordered_map<std::string, std::vector<std::string>> memo;
    for (const auto& group : registry.groups()) {
      std::vector<std::string> path;
      auto flattened = flatten_group(group.name, path, memo);
      if (!flattened) {
        return tl::unexpected(flattened.error());
      }
      nodes[static_cast<std::size_t>(node_index.at(group.name))].requirements = std::move(*flattened);
    }
    return {};
  }

  auto resolve_edges() -> Expected<void> {
    edges.assign(nodes.size(), {});
    std::vector<std::string> unknown;
    for (std::size_t i = 0; i < nodes.size(); ++i) {
      for (const auto& requirement : nodes[i].requirements) {
        auto it = node_index.find(requirement);
        if (it == node_index.end()) {
          unknown.push_back(std::format("{} (required by {})", requirement, nodes[i].key));
          continue;
        }
        auto& out = edges[i];
        if (std::find(out.begin(), out.end(), it->second) == out.end()) {
          out.push_back(it->second);
        }
      }
    }
    if (!unknown.empty()) {
      return tl::unexpected(
        make_error(ErrorCode::UnknownStep, std::format("Unknown steps: {}", join_keys(unknown, ", "))));
    }
    return {};
  }

  auto check_cycles() -> Expected<void> {
    std::vector<int> color(nodes.size(), 0);
    std::vector<int> path;

    std::function<Expected<void>(int)> visit = [&](int node) -> Expected<void> {
      color[static_cast<std::size_t>(node)] = 1;
      path.push_back(node);
      for (int next : edges[static_cast<std::size_t>(node)]) {
        if (color[static_cast<std::size_t>(next)] == 1) {
          auto start = std::find(path.begin(), path.end(), next);
          std::vector<std::string> cycle;
          for (auto it = start; it != path.end(); ++it) {
            cycle.push_back(nodes[static_cast<std::size_t>(*it)].key);
          }
          cycle.push_back(nodes[static_cast<std::size_t>(next)].key);
          return tl::unexpected(make_error(
            ErrorCode::CyclicGraph,
            std::format("Cyclic dependencies between steps: {}", join_keys(cycle, " --> "))));
        }
        if (color[static_cast<std::size_t>(next)] == 0) {
          if (auto result = visit(next); !result) {
            return result;
          }
        }
      }
      path.pop_back();
      color[static_cast<std::size_t>(node)] = 2;
      return {};
    };

    for (std::size_t i = 0; i < nodes.size(); ++i) {
      if (color[i] == 0) {
        if (auto result = visit(static_cast<int>(i)); !result) {
          return result;
        }
      }
    }
    return {};
  }

  auto build(std::vector<int> topo) -> Graph {
    Graph graph;
    graph.dependents.assign(nodes.size(), {});
    for (std::size_t i = 0; i < edges.size(); ++i) {
      for (int requirement : edges[i]) {
        graph.dependents[static_cast<std::size_t>(requirement)].push_back(static_cast<int>(i));
      }
    }
    graph.nodes = std::move(nodes);
    graph.index = std::move(node_index);
    graph.requirements = std::move(edges);
    graph.topo_order = std::move(topo);
    return graph;
  }

  auto topo_sort() -> std::vector<int> {
    std::vector<int> indegree(nodes.size(), 0);
    std::vector<std::vector<int>> dependents(nodes.size());
    for (std::size_t i = 0; i < edges.size(); ++i) {
      indegree[i] = static_cast<int>(edges[i].size());
      for (int requirement : edges[i]) {
        dependents[static_cast<std::size_t>(requirement)].push_back(static_cast<int>(i));
      }
    }

    // Registration order breaks ties between independent nodes.
    std::priority_queue<int, std::vector<int>, std::greater<>> ready;
    for (std::size_t i = 0; i < indegree.size(); ++i) {
      if (indegree[i] == 0) {
        ready.push(static_cast<int>(i));
      }
    }

    std::vector<int> topo;
    topo.reserve(nodes.size());
    while (!ready.empty()) {
      int node = ready.top();
      ready.pop();
      topo.push_back(node);
      for (int next : dependents[static_cast<std::size_t>(node)]) {
        if (--indegree[static_cast<std::size_t>(next)] == 0) {
          ready.push(next);
        }
      }
    }
    return topo;
  }

  static auto join_keys(const std::vector<std::string>& keys, std::string_view separator) -> std::string {
    std::string out;
    for (std::size_t i = 0; i < keys.size(); ++i) {
      if (i != 0) {
        out += separator;
      }
      out += keys[i];
    }
    return out;
  }
};

}  // namespace

auto Graph::index_of(std::string_view key) const -> int {
  auto it = index.find(std::string(key));
  if (it == index.end()) {
    return -1;
  }
  return it->second;
}

auto Graph::find(std::string_view key) const -> const Node* {
  int node = index_of(key);
  if (node < 0) {
    return nullptr;
  }
  return &nodes[static_cast<std::size_t>(node)];
}

auto Graph::members(int node) const -> std::vector<int> {
  if (nodes[static_cast<std::size_t>(node)].kind == NodeKind::Step) {
    return {node};
  }
  std::vector<int> out;
  for (int requirement : requirements[static_cast<std::size_t>(node)]) {
    for (int member : members(requirement)) {
      if (std::find(out.begin(), out.end(), member) == out.end()) {
        out.push_back(member);
      }
    }
  }
  return out;
}

auto build_graph(const StepRegistry& registry) -> Expected<Graph> {
  GraphBuilder builder{registry};
  if (auto result = builder.build_steps(); !result) {
    return tl::unexpected(result.error());
  }
  if (auto result = builder.build_groups(); !result) {
    return tl::unexpected(result.error());
  }
  if (auto result = builder.flatten_groups(); !result) {
    return tl::unexpected(result.error());
  }
  if (auto result = builder.resolve_edges(); !result) {
    return tl::unexpected(result.error());
  }
  if (auto result = builder.check_cycles(); !result) {
    return tl::unexpected(result.error());
  }
  auto topo = builder.topo_sort();
  return builder.build(std::move(topo));
}

}  // namespace dwas::engine
