#include "runtime/executor.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <format>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include <exec/static_thread_pool.hpp>
#include <stdexec/execution.hpp>

#include "common/logging/log.hpp"

namespace dwas::engine {
namespace {

using Clock = std::chrono::steady_clock;

constexpr auto kInterruptPoll = std::chrono::milliseconds(50);

auto elapsed_since(Clock::time_point start) -> std::chrono::milliseconds {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

auto parameters_json(const ParameterList& parameters) -> Json {
  auto out = Json::object();
  for (const auto& parameter : parameters) {
    out[parameter.name] = parameter.value;
  }
  return out;
}

auto invoke_body(const Node& node, Phase phase, RunContext& run_ctx) -> Expected<void> {
  static const StepBody kEmptyBody;
  const auto& body = node.body ? *node.body : kEmptyBody;
  try {
    if (phase != Phase::RunOnly && body.setup) {
      if (auto setup = body.setup(run_ctx); !setup) {
        return setup;
      }
    }
    if (phase == Phase::SetupOnly) {
      return {};
    }
    if (auto injected = run_ctx.setup_from_requirements(); !injected) {
      return injected;
    }
    if (body.run) {
      return body.run(run_ctx);
    }
  } catch (const std::exception& ex) {
    return tl::unexpected(make_error(ErrorCode::Execution, ex.what()));
  } catch (...) {
    return tl::unexpected(make_error(ErrorCode::Execution, "unknown exception"));
  }
  return {};
}

enum class NodeState : char {
  Pending,
  Queued,
  Running,
  Done,
};

struct Dispatcher;

struct ExecutionState {
  const ExecutionPlan* plan = nullptr;
  InvocationContext* ctx = nullptr;
  Dispatcher* dispatcher = nullptr;
  bool fail_fast = false;

  std::mutex mutex;
  std::condition_variable cv;
  std::vector<NodeState> states;
  std::vector<int> pending;
  std::vector<NodeResult> results;
  std::size_t remaining = 0;
  // Work items still referencing this state, the state must outlive them.
  std::size_t outstanding = 0;
  bool stopping = false;

  auto prepare(const ExecutionPlan& plan_ref, InvocationContext& ctx_ref, Dispatcher& dispatcher_ref) -> void;
  auto schedule_initial_nodes() -> void;
  auto schedule_locked(int node_index) -> void;
  auto execute_node(int node_index) -> void;
  auto run_node(int node_index) -> NodeResult;
  auto complete_node(int node_index, NodeResult result) -> void;
  auto resolve_locked(int node_index, NodeResult result) -> void;
  auto skip_dependents_locked(int node_index) -> void;
  auto cancel_dependents_locked(int node_index) -> void;
  auto stop_locked() -> void;
  auto done_locked() const -> bool { return remaining == 0 && outstanding == 0; }
  auto wait_for_completion(bool& interrupted) -> void;
};

struct WorkItem {
  ExecutionState* state = nullptr;
  int node_index = -1;
};

struct WorkQueue {
  std::mutex mutex;
  std::condition_variable cv;
  std::deque<WorkItem> items;
  bool stopped = false;

  auto push(WorkItem item) -> void {
    std::lock_guard<std::mutex> lock(mutex);
    items.push_back(item);
    cv.notify_one();
  }

  auto pop(WorkItem& out) -> bool {
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait(lock, [&]() { return stopped || !items.empty(); });
    if (items.empty()) {
      return false;
    }
    out = items.front();
    items.pop_front();
    return true;
  }

  auto stop() -> void {
    {
      std::lock_guard<std::mutex> lock(mutex);
      if (stopped) {
        return;
      }
      stopped = true;
    }
    cv.notify_all();
  }
};

struct Dispatcher {
  WorkQueue queue;
  int workers = 0;
  std::atomic<int> alive{0};
  std::atomic<bool> started{false};

  explicit Dispatcher(int workers) : workers(workers) {}

  auto enqueue(WorkItem item) -> void { queue.push(item); }

  auto start(exec::static_thread_pool& pool) -> void {
    bool expected = false;
    if (!started.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
      return;
    }
    alive.store(workers, std::memory_order_release);

    auto scheduler = pool.get_scheduler();
    for (int i = 0; i < workers; ++i) {
      auto task = stdexec::schedule(scheduler) | stdexec::then([this]() { this->worker_loop(); });
      stdexec::start_detached(std::move(task));
    }
  }

  auto stop() -> void {
    if (!started.load(std::memory_order_acquire)) {
      return;
    }
    queue.stop();
    int count = alive.load(std::memory_order_acquire);
    while (count != 0) {
      alive.wait(count, std::memory_order_relaxed);
      count = alive.load(std::memory_order_acquire);
    }
  }

 private:
  auto worker_loop() -> void {
    WorkItem item{};
    while (queue.pop(item)) {
      item.state->execute_node(item.node_index);
    }
    if (alive.fetch_sub(1, std::memory_order_acq_rel) == 1) {
      alive.notify_all();
    }
  }
};

auto ExecutionState::prepare(const ExecutionPlan& plan_ref, InvocationContext& ctx_ref, Dispatcher& dispatcher_ref)
  -> void {
  plan = &plan_ref;
  ctx = &ctx_ref;
  dispatcher = &dispatcher_ref;

  const std::size_t node_count = plan_ref.nodes.size();
  states.assign(node_count, NodeState::Pending);
  pending = plan_ref.pending_counts;
  results.assign(node_count, NodeResult{});
  remaining = node_count;
  outstanding = 0;
  stopping = false;
}

auto ExecutionState::schedule_initial_nodes() -> void {
  std::lock_guard<std::mutex> lock(mutex);
  if (ctx->is_cancelled()) {
    stop_locked();
    return;
  }
  for (std::size_t node_index = 0; node_index < states.size(); ++node_index) {
    if (pending[node_index] == 0) {
      schedule_locked(static_cast<int>(node_index));
    }
  }
}

auto ExecutionState::schedule_locked(int node_index) -> void {
  auto& state = states[static_cast<std::size_t>(node_index)];
  if (state != NodeState::Pending) {
    return;
  }
  state = NodeState::Queued;
  outstanding += 1;
  dispatcher->enqueue(WorkItem{this, node_index});
}

auto ExecutionState::execute_node(int node_index) -> void {
  {
    std::lock_guard<std::mutex> lock(mutex);
    auto& state = states[static_cast<std::size_t>(node_index)];
    if (state != NodeState::Queued) {
      // Cancelled while waiting in the queue.
      outstanding -= 1;
      cv.notify_all();
      return;
    }
    state = NodeState::Running;
  }

  auto result = run_node(node_index);
  complete_node(node_index, std::move(result));
}

auto ExecutionState::run_node(int node_index) -> NodeResult {
  const auto& plan_node = plan->nodes[static_cast<std::size_t>(node_index)];
  const auto& node = *plan_node.node;
  const auto start = Clock::now();

  NodeResult result;
  if (node.kind == NodeKind::Group) {
    result.status = NodeStatus::Success;
    return result;
  }
  if (ctx->is_cancelled()) {
    result.status = NodeStatus::Cancelled;
    return result;
  }
  if (ctx->environments == nullptr) {
    result.status = NodeStatus::Failure;
    result.cause = "no environment cache configured";
    return result;
  }

  log::debug("{}: starting ({})", node.key, to_string(plan_node.phase));
  const auto identity = node_identity(node.key);
  Expected<EnvironmentHandle> handle;
  if (plan_node.phase == Phase::RunOnly) {
    handle = ctx->environments->open(identity);
  } else {
    handle = ctx->environments->ensure(identity, DependencySpec{node.dependencies, parameters_json(node.parameters)});
  }
  if (!handle) {
    result.status = ctx->is_cancelled() ? NodeStatus::Cancelled : NodeStatus::Failure;
    result.cause = handle.error().message;
    result.duration = elapsed_since(start);
    return result;
  }

  RunContext run_ctx(node, *ctx, std::move(*handle), plan->graph);
  auto outcome = invoke_body(node, plan_node.phase, run_ctx);
  result.output = run_ctx.take_output();
  result.duration = elapsed_since(start);
  if (outcome) {
    result.status = NodeStatus::Success;
  } else if (outcome.error().code == ErrorCode::Cancelled || ctx->is_cancelled()) {
    result.status = NodeStatus::Cancelled;
    result.cause = outcome.error().message;
  } else {
    result.status = NodeStatus::Failure;
    result.cause = outcome.error().message;
  }
  return result;
}

auto ExecutionState::complete_node(int node_index, NodeResult result) -> void {
  const auto& key = plan->nodes[static_cast<std::size_t>(node_index)].node->key;
  const bool is_group = plan->nodes[static_cast<std::size_t>(node_index)].node->kind == NodeKind::Group;

  // The output of a node is logged as a single record so that parallel nodes
  // never interleave.
  std::string trailer;
  if (!result.output.empty()) {
    trailer = "\n" + result.output;
    if (trailer.back() == '\n') {
      trailer.pop_back();
    }
  }
  switch (result.status) {
    case NodeStatus::Success:
      if (is_group) {
        log::debug("{}: success", key);
      } else {
        log::info("{}: success{}", key, trailer);
      }
      break;
    case NodeStatus::Failure:
      log::error("{}: error: {}{}", key, result.cause, trailer);
      break;
    case NodeStatus::Skipped:
    case NodeStatus::Cancelled:
      log::warn("{}: {}{}", key, to_string(result.status), trailer);
      break;
  }

  std::lock_guard<std::mutex> lock(mutex);
  outstanding -= 1;
  const auto status = result.status;
  resolve_locked(node_index, std::move(result));

  switch (status) {
    case NodeStatus::Success:
      for (int dependent : plan->dependents[static_cast<std::size_t>(node_index)]) {
        auto& count = pending[static_cast<std::size_t>(dependent)];
        count -= 1;
        if (count == 0 && !stopping) {
          schedule_locked(dependent);
        }
      }
      break;
    case NodeStatus::Failure:
      skip_dependents_locked(node_index);
      if (fail_fast && !stopping) {
        log::warn("Stopping after the failure of {} (fail fast)", key);
        stop_locked();
      }
      break;
    case NodeStatus::Skipped:
      skip_dependents_locked(node_index);
      break;
    case NodeStatus::Cancelled:
      cancel_dependents_locked(node_index);
      break;
  }
  cv.notify_all();
}

auto ExecutionState::resolve_locked(int node_index, NodeResult result) -> void {
  auto& state = states[static_cast<std::size_t>(node_index)];
  if (state == NodeState::Done) {
    return;
  }
  state = NodeState::Done;
  results[static_cast<std::size_t>(node_index)] = std::move(result);
  remaining -= 1;
}

auto ExecutionState::skip_dependents_locked(int node_index) -> void {
  std::vector<int> stack{node_index};
  while (!stack.empty()) {
    int current = stack.back();
    stack.pop_back();
    const auto& blocker = plan->nodes[static_cast<std::size_t>(current)].node->key;
    for (int dependent : plan->dependents[static_cast<std::size_t>(current)]) {
      if (states[static_cast<std::size_t>(dependent)] != NodeState::Pending) {
        continue;
      }
      NodeResult skipped;
      skipped.status = NodeStatus::Skipped;
      skipped.blocked_by = blocker;
      log::warn("{}: blocked by {}", plan->nodes[static_cast<std::size_t>(dependent)].node->key, blocker);
      resolve_locked(dependent, std::move(skipped));
      stack.push_back(dependent);
    }
  }
}

auto ExecutionState::cancel_dependents_locked(int node_index) -> void {
  std::vector<int> stack{node_index};
  while (!stack.empty()) {
    int current = stack.back();
    stack.pop_back();
    for (int dependent : plan->dependents[static_cast<std::size_t>(current)]) {
      if (states[static_cast<std::size_t>(dependent)] != NodeState::Pending) {
        continue;
      }
      resolve_locked(dependent, NodeResult{NodeStatus::Cancelled, {}, {}, {}, {}});
      stack.push_back(dependent);
    }
  }
}

auto ExecutionState::stop_locked() -> void {
  stopping = true;
  for (std::size_t node_index = 0; node_index < states.size(); ++node_index) {
    auto state = states[node_index];
    if (state == NodeState::Pending || state == NodeState::Queued) {
      resolve_locked(static_cast<int>(node_index), NodeResult{NodeStatus::Cancelled, {}, {}, {}, {}});
    }
  }
}

auto ExecutionState::wait_for_completion(bool& interrupted) -> void {
  int handled = 0;
  while (true) {
    {
      std::unique_lock<std::mutex> lock(mutex);
      if (cv.wait_for(lock, kInterruptPoll, [&]() { return done_locked(); })) {
        return;
      }
    }

    int received = ctx->interrupts ? ctx->interrupts() : 0;
    if (received > handled) {
      interrupted = true;
      if (handled == 0) {
        log::warn("Interrupted, waiting for running steps to stop. Interrupt again to kill them");
        ctx->cancel();
        if (ctx->on_cancel) {
          ctx->on_cancel();
        }
      }
      if (received >= 2 && handled < 2) {
        log::warn("Interrupted again, killing running steps");
        if (ctx->on_abort) {
          ctx->on_abort();
        }
      }
      handled = received;
    }

    if (ctx->is_cancelled()) {
      std::lock_guard<std::mutex> lock(mutex);
      if (!stopping) {
        stop_locked();
        cv.notify_all();
      }
    }
  }
}

}  // namespace

auto to_string(NodeStatus status) -> std::string_view {
  switch (status) {
    case NodeStatus::Success:
      return "success";
    case NodeStatus::Failure:
      return "failure";
    case NodeStatus::Skipped:
      return "skipped";
    case NodeStatus::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

auto ExecutionReport::count(NodeStatus status) const -> std::size_t {
  std::size_t total = 0;
  for (const auto& result : results) {
    if (result.status == status) {
      total += 1;
    }
  }
  return total;
}

auto ExecutionReport::succeeded() const -> bool {
  return count(NodeStatus::Success) == results.size();
}

auto ExecutionReport::exit_code() const -> int {
  return succeeded() ? 0 : 1;
}

auto ExecutionReport::at(std::string_view key) const -> const NodeResult* {
  for (std::size_t i = 0; i < order.size(); ++i) {
    if (order[i] == key) {
      return &results[i];
    }
  }
  return nullptr;
}

struct Executor::Pools {
  explicit Pools(int threads) : pool(static_cast<std::size_t>(threads)) {}
  exec::static_thread_pool pool;
};

struct Executor::Dispatcher {
  std::shared_ptr<::dwas::engine::Dispatcher> impl;

  ~Dispatcher() {
    if (impl) {
      impl->stop();
    }
  }
};

Executor::Executor(ExecutorConfig config) : config_(config) {
  int threads = config.max_parallelism;
  if (threads <= 0) {
    threads = static_cast<int>(std::thread::hardware_concurrency());
    if (threads <= 0) {
      threads = 4;
    }
  }
  workers_ = threads;
  pools_ = std::make_shared<Pools>(threads);
  dispatcher_ = std::make_shared<Dispatcher>();
  dispatcher_->impl = std::make_shared<::dwas::engine::Dispatcher>(threads);
  dispatcher_->impl->start(pools_->pool);
}

Executor::~Executor() = default;

auto Executor::run(const ExecutionPlan& plan, InvocationContext& ctx) const -> ExecutionReport {
  const auto start = Clock::now();
  auto state = std::make_unique<ExecutionState>();
  state->prepare(plan, ctx, *dispatcher_->impl);
  state->fail_fast = config_.fail_fast;

  ExecutionReport report;
  report.order = plan.keys();
  if (!plan.nodes.empty()) {
    log::debug("Running {} nodes on {} workers", plan.nodes.size(), workers_);
    state->schedule_initial_nodes();
    state->wait_for_completion(report.interrupted);
  }

  std::lock_guard<std::mutex> lock(state->mutex);
  report.results = std::move(state->results);
  report.elapsed = elapsed_since(start);
  return report;
}

}  // namespace dwas::engine
