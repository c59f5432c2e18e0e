#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "engine/environment.hpp"
#include "engine/error.hpp"
#include "engine/step.hpp"
#include "engine/types.hpp"

namespace dwas::engine {

struct Graph;

/// State shared by every node of one invocation.
struct InvocationContext {
  EnvironmentCache* environments = nullptr;
  std::vector<std::string> user_args;
  /// Number of interrupts received so far. Polled by the executor.
  std::function<int()> interrupts;
  std::function<void()> on_cancel;
  /// Called on a second interrupt to kill whatever is still running.
  std::function<void()> on_abort;
  std::atomic<bool> cancelled{false};

  auto cancel() -> void { cancelled.store(true, std::memory_order_release); }

  auto is_cancelled() const -> bool {
    return cancelled.load(std::memory_order_acquire);
  }
};

/// Handle given to step bodies. Owned by the worker running the node; the
/// output collected here is logged as one unit once the node completes.
class RunContext {
 public:
  RunContext(const Node& node, InvocationContext& invocation, EnvironmentHandle environment,
             const Graph* graph = nullptr);

  auto key() const -> const std::string& { return node_->key; }
  auto name() const -> const std::string& { return node_->name; }
  auto parameters() const -> const ParameterList& { return node_->parameters; }
  auto parameter(std::string_view name) const -> const Json*;
  auto user_args() const -> const std::vector<std::string>& { return invocation_->user_args; }
  auto environment() const -> const EnvironmentHandle& { return environment_; }
  auto cache_dir() const -> const std::filesystem::path& { return environment_.root; }
  auto cancelled() const -> bool { return invocation_->is_cancelled(); }

  /// A non-zero exit status is an error. Nothing is started once the
  /// invocation is cancelled.
  auto run(std::vector<std::string> argv, std::string cwd = {}) -> Expected<ProcessResult>;

  auto log(std::string_view text) -> void;
  auto output() const -> const std::string& { return output_; }
  auto take_output() -> std::string { return std::move(output_); }

  /// Step nodes this node requires, groups replaced by their members.
  auto requirement_steps() const -> std::vector<const Node*>;

  /// Context of another node, attached to its environment without setting it up.
  auto attach(const Node& other) const -> Expected<RunContext>;

  auto setup_from_requirements() -> Expected<void>;

  /// Values published under `key` by the requirements, in requirement order.
  auto artifacts(std::string_view key) const -> Expected<std::vector<Json>>;

 private:
  auto command_environment() const -> EnvironmentVariables;

  const Node* node_;
  InvocationContext* invocation_;
  EnvironmentHandle environment_;
  const Graph* graph_;
  std::string output_;
};

auto render_command(const std::vector<std::string>& argv) -> std::string;

}  // namespace dwas::engine
