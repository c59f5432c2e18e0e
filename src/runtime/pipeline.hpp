#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "engine/environment.hpp"
#include "engine/error.hpp"
#include "engine/graph.hpp"
#include "engine/plan.hpp"
#include "engine/registry.hpp"
#include "engine/selector.hpp"
#include "runtime/executor.hpp"
#include "runtime/process.hpp"
#include "runtime/report.hpp"

namespace dwas::engine {

/// Configuration of one invocation.
struct PipelineConfig {
  ExecutorConfig executor;
  /// Root of everything dwas writes to disk.
  std::filesystem::path cache_path = ".dwas";
  /// Command provisioning an environment, see EnvironmentCacheConfig.
  std::string install_command;
  /// Time given to processes between SIGTERM and SIGKILL.
  std::chrono::milliseconds termination_grace{std::chrono::seconds(5)};
  /// Replaces the directory backed cache when set.
  std::shared_ptr<EnvironmentCache> environments;
  /// Install SIGINT/SIGTERM handlers for the duration of execute().
  bool handle_interrupts = true;
};

struct RunOptions {
  SelectOptions selection;
  /// Passed verbatim to every selected step.
  std::vector<std::string> user_args;
  /// Call the clean hooks and drop the environments of the selected steps
  /// before running.
  bool clean = false;
};

/// High-level facade that owns the registry, the environment cache, the
/// process manager and the executor.
class Pipeline {
 public:
  explicit Pipeline(PipelineConfig config = {});
  ~Pipeline();

  Pipeline(const Pipeline&) = delete;
  auto operator=(const Pipeline&) -> Pipeline& = delete;

  /// Mutable access to the registry. Drops the cached graph.
  auto registry() -> StepRegistry&;
  auto registry() const -> const StepRegistry&;

  auto load(const std::filesystem::path& path) -> Expected<void>;

  auto graph() const -> Expected<std::shared_ptr<const Graph>>;
  /// Resolve a selection against the graph. The plan refers to the graph
  /// and stays valid until the registry is modified.
  auto plan(const SelectOptions& options) const -> Expected<ExecutionPlan>;

  /// Run the selected steps and log the summary. Definition, selection and
  /// configuration errors are returned before anything runs.
  auto execute(const RunOptions& options) -> Expected<ExecutionReport>;

  /// Listing lines for --list. Selection errors only produce a warning.
  auto list(const SelectOptions& options, const ListOptions& list_options) const
    -> Expected<std::vector<std::string>>;

  auto environments() -> EnvironmentCache& { return *environments_; }

 private:
  /// Run the step's clean hook, then drop its environment.
  auto clean_node(const Node& node, InvocationContext& ctx, const Graph* graph) -> Expected<void>;

  PipelineConfig config_;
  StepRegistry registry_;
  mutable std::shared_ptr<const Graph> graph_;
  ProcessManager processes_;
  std::shared_ptr<EnvironmentCache> environments_;
  Executor executor_;
};

}  // namespace dwas::engine
