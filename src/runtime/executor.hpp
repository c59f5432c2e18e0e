#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "engine/context.hpp"
#include "engine/plan.hpp"

namespace dwas::engine {

enum class NodeStatus {
  Success,
  Failure,
  Skipped,
  Cancelled,
};

auto to_string(NodeStatus status) -> std::string_view;

struct NodeResult {
  NodeStatus status = NodeStatus::Cancelled;
  std::string cause;
  /// Key of the predecessor that prevented a Skipped node from running.
  std::string blocked_by;
  std::chrono::milliseconds duration{0};
  std::string output;
};

/// One result per plan node, in plan order.
struct ExecutionReport {
  std::vector<std::string> order;
  std::vector<NodeResult> results;
  bool interrupted = false;
  std::chrono::milliseconds elapsed{0};

  auto count(NodeStatus status) const -> std::size_t;
  auto succeeded() const -> bool;
  auto exit_code() const -> int;
  auto at(std::string_view key) const -> const NodeResult*;
};

struct ExecutorConfig {
  /// 0 picks the host parallelism.
  int max_parallelism = 0;
  bool fail_fast = false;
};

/// Runs an ExecutionPlan on a bounded worker pool.
///
/// A node becomes ready once every requirement succeeded. A failing or
/// skipped node marks its pending dependents as skipped. With fail_fast, or
/// once the invocation is cancelled, pending and queued nodes are cancelled
/// while running nodes are allowed to finish.
class Executor {
 public:
  explicit Executor(ExecutorConfig config = {});
  ~Executor();

  Executor(const Executor&) = delete;
  Executor(Executor&&) = delete;
  auto operator=(const Executor&) -> Executor& = delete;
  auto operator=(Executor&&) -> Executor& = delete;

  auto run(const ExecutionPlan& plan, InvocationContext& ctx) const -> ExecutionReport;

 private:
  struct Pools;
  struct Dispatcher;
  std::shared_ptr<Pools> pools_;
  std::shared_ptr<Dispatcher> dispatcher_;
  ExecutorConfig config_;
  int workers_ = 0;
};

}  // namespace dwas::engine
