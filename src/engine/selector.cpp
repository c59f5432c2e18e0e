#include "engine/selector.hpp"

#include <format>
#include <functional>
#include <utility>

#include "common/logging/log.hpp"

namespace dwas::engine {
namespace {

enum class Reach : char {
  None,
  Soft,
  Hard,
};

auto resolve_names(const Graph& graph, const std::vector<std::string>& names, std::vector<int>& out,
                   std::vector<std::string>& unknown) -> void {
  for (const auto& name : names) {
    int node = graph.index_of(name);
    if (node < 0) {
      unknown.push_back(name);
      continue;
    }
    out.push_back(node);
  }
}

auto join(const std::vector<std::string>& parts) -> std::string {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i != 0) {
      out += ", ";
    }
    out += parts[i];
  }
  return out;
}

}  // namespace

auto select(const Graph& graph, const SelectOptions& options) -> Expected<ExecutionPlan> {
  if (!options.only.empty() && !options.except_steps.empty()) {
    return tl::unexpected(make_error(ErrorCode::InvalidSelection, "--only and --except cannot be used together"));
  }
  if (options.setup_only && options.no_setup) {
    return tl::unexpected(
      make_error(ErrorCode::InvalidSelection, "--setup-only and --no-setup cannot be used together"));
  }

  std::vector<int> named;
  std::vector<int> excluded_roots;
  std::vector<std::string> unknown;
  resolve_names(graph, options.steps, named, unknown);
  resolve_names(graph, options.only, named, unknown);
  resolve_names(graph, options.except_steps, excluded_roots, unknown);
  if (!unknown.empty()) {
    return tl::unexpected(make_error(ErrorCode::UnknownStep, std::format("Unknown steps: {}", join(unknown))));
  }

  const auto count = graph.nodes.size();
  std::vector<char> excluded(count, 0);
  for (int node : excluded_roots) {
    excluded[static_cast<std::size_t>(node)] = 1;
    for (int member : graph.members(node)) {
      excluded[static_cast<std::size_t>(member)] = 1;
    }
  }

  std::vector<int> roots;
  if (!named.empty()) {
    roots = std::move(named);
  } else {
    for (std::size_t i = 0; i < count; ++i) {
      if (graph.nodes[i].run_by_default) {
        roots.push_back(static_cast<int>(i));
      }
    }
  }

  std::vector<Reach> reach(count, Reach::None);
  std::vector<char> selected(count, 0);
  PlanFlags flags;
  flags.excluded_but_required.assign(count, 0);

  // A soft visit comes from a selection root and honours the exclusions. A
  // hard visit comes from a requirement edge and always includes the node.
  std::function<void(int, int, bool)> visit = [&](int node, int parent, bool hard) {
    auto position = static_cast<std::size_t>(node);
    const auto wanted = hard ? Reach::Hard : Reach::Soft;
    if (reach[position] >= wanted) {
      return;
    }
    reach[position] = wanted;
    selected[position] = 1;

    if (hard && excluded[position] && !flags.excluded_but_required[position]) {
      flags.excluded_but_required[position] = 1;
      log::warn("Step {} was excluded but is required by {}", graph.nodes[position].key,
                graph.nodes[static_cast<std::size_t>(parent)].key);
    }

    const bool is_group = graph.nodes[position].kind == NodeKind::Group;
    for (int requirement : graph.requirements[position]) {
      if (is_group && !hard && excluded[static_cast<std::size_t>(requirement)]) {
        continue;
      }
      visit(requirement, node, is_group ? hard : true);
    }
  };

  for (int root : roots) {
    if (excluded[static_cast<std::size_t>(root)]) {
      continue;
    }
    visit(root, root, false);
  }

  auto phase = Phase::Full;
  if (options.setup_only) {
    phase = Phase::SetupOnly;
  } else if (options.no_setup) {
    phase = Phase::RunOnly;
  }

  auto plan = make_plan(graph, selected, phase, flags);
  log::debug("Selected {} of {} nodes ({})", plan.size(), count, to_string(phase));
  return plan;
}

}  // namespace dwas::engine
