#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "engine/graph.hpp"
#include "engine/plan.hpp"
#include "runtime/executor.hpp"

namespace dwas::engine {

/// h:mm:ss
auto format_duration(std::chrono::milliseconds duration) -> std::string;

struct Chain {
  /// Keys from the first node to run to the last one.
  std::vector<std::string> keys;
  std::chrono::milliseconds duration{0};
};

/// Longest path through the plan, weighted by node durations.
auto slowest_chain(const ExecutionPlan& plan, const ExecutionReport& report) -> Chain;

/// "N jobs failed, M could not run, K were cancelled"
auto describe_outcome(const ExecutionReport& report) -> std::string;

auto log_summary(const ExecutionPlan& plan, const ExecutionReport& report) -> void;

struct ListOptions {
  bool show_dependencies = false;
  bool verbose = false;
};

/// One line per node sorted by key. `*` marks nodes in `selected`, `-` the
/// others; a null plan marks nothing.
auto render_listing(const Graph& graph, const ExecutionPlan* selected, const ListOptions& options)
  -> std::vector<std::string>;

}  // namespace dwas::engine
