#pragma once

#include <string>
#include <vector>

#include "engine/error.hpp"
#include "engine/graph.hpp"
#include "engine/plan.hpp"

namespace dwas::engine {

struct SelectOptions {
  /// Like `only`, but may be combined with `except_steps`.
  std::vector<std::string> steps;
  std::vector<std::string> only;
  std::vector<std::string> except_steps;
  bool setup_only = false;
  bool no_setup = false;
};

/// Nodes named in `except_steps` are dropped unless a selected node still
/// requires them, in which case they are kept and flagged
/// `excluded_but_required`.
auto select(const Graph& graph, const SelectOptions& options) -> Expected<ExecutionPlan>;

}  // namespace dwas::engine
