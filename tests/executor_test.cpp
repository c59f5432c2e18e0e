#include "runtime/executor.hpp"
#include "runtime/interrupt.hpp"
#include "runtime/pipeline.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <future>
#include <stdexcept>

using namespace dwas::engine;

namespace {

/// Thread-safe log of the order in which step bodies ran.
struct Trace {
  std::mutex mutex;
  std::vector<std::string> keys;

  auto record() -> StepFn {
    return [this](RunContext& ctx) -> Expected<void> {
      std::lock_guard<std::mutex> lock(mutex);
      keys.push_back(ctx.key());
      return {};
    };
  }

  auto snapshot() -> std::vector<std::string> {
    std::lock_guard<std::mutex> lock(mutex);
    return keys;
  }
};

auto register_package_and_pytest(StepRegistry& registry, StepFn package, StepFn pytest_run) -> void {
  ASSERT_TRUE(registry.register_step("package", std::move(package)));
  auto pytest = make_step("pytest", {"package"}, std::move(pytest_run));
  pytest.parameters.push_back(Parametrization::single("python", {"3.8", "3.9"}));
  ASSERT_TRUE(registry.register_step(std::move(pytest)));
}

}  // namespace

TEST(Executor, RunsRequirementsBeforeDependents) {
  auto cache = std::make_shared<FakeEnvironmentCache>();
  Pipeline pipeline(make_config(cache));
  Trace trace;
  register_package_and_pytest(pipeline.registry(), trace.record(), trace.record());

  auto report = pipeline.execute({});
  ASSERT_TRUE(report) << report.error().message;
  EXPECT_TRUE(report->succeeded());
  EXPECT_EQ(report->exit_code(), 0);
  EXPECT_EQ(report->order.back(), "pytest");

  auto ran = trace.snapshot();
  ASSERT_EQ(ran.size(), 3u);
  EXPECT_EQ(ran.front(), "package");
  EXPECT_GT(position_of(ran, "pytest[3.8]"), position_of(ran, "package"));
  EXPECT_GT(position_of(ran, "pytest[3.9]"), position_of(ran, "package"));
}

TEST(Executor, FailureBlocksDependentsOnly) {
  auto cache = std::make_shared<FakeEnvironmentCache>();
  Pipeline pipeline(make_config(cache));
  Trace trace;
  register_package_and_pytest(pipeline.registry(), fail("build broke"), trace.record());
  ASSERT_TRUE(pipeline.registry().register_step("lint", trace.record()));

  auto report = pipeline.execute({});
  ASSERT_TRUE(report);
  EXPECT_EQ(report->exit_code(), 1);

  EXPECT_EQ(report->at("package")->status, NodeStatus::Failure);
  EXPECT_EQ(report->at("package")->cause, "build broke");
  for (const auto* key : {"pytest[3.8]", "pytest[3.9]"}) {
    const auto* result = report->at(key);
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(result->status, NodeStatus::Skipped);
    EXPECT_EQ(result->blocked_by, "package");
  }
  EXPECT_EQ(report->at("pytest")->status, NodeStatus::Skipped);
  EXPECT_EQ(report->at("lint")->status, NodeStatus::Success);
  EXPECT_EQ(trace.snapshot(), std::vector<std::string>{"lint"});
  EXPECT_EQ(describe_outcome(*report), "1 jobs failed, 3 could not run, 0 were cancelled");
}

TEST(Executor, FailFastCancelsQueuedNodes) {
  auto cache = std::make_shared<FakeEnvironmentCache>();
  Pipeline pipeline(make_config(cache, 1, true));
  Trace trace;
  ASSERT_TRUE(pipeline.registry().register_step("first", fail()));
  ASSERT_TRUE(pipeline.registry().register_step("second", trace.record()));
  ASSERT_TRUE(pipeline.registry().register_step("third", trace.record()));

  auto report = pipeline.execute({});
  ASSERT_TRUE(report);
  EXPECT_EQ(report->at("first")->status, NodeStatus::Failure);
  EXPECT_EQ(report->at("second")->status, NodeStatus::Cancelled);
  EXPECT_EQ(report->at("third")->status, NodeStatus::Cancelled);
  EXPECT_TRUE(trace.snapshot().empty());
  EXPECT_EQ(report->exit_code(), 1);
}

TEST(Executor, RespectsParallelismBound) {
  auto cache = std::make_shared<FakeEnvironmentCache>();
  Pipeline pipeline(make_config(cache, 2));
  std::atomic<int> running{0};
  std::atomic<int> peak{0};
  auto body = [&](RunContext&) -> Expected<void> {
    int now = running.fetch_add(1) + 1;
    int seen = peak.load();
    while (now > seen && !peak.compare_exchange_weak(seen, now)) {
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    running.fetch_sub(1);
    return {};
  };
  for (int i = 0; i < 8; ++i) {
    ASSERT_TRUE(pipeline.registry().register_step(std::format("job{}", i), body));
  }

  auto report = pipeline.execute({});
  ASSERT_TRUE(report);
  EXPECT_TRUE(report->succeeded());
  EXPECT_LE(peak.load(), 2);
  EXPECT_GE(peak.load(), 1);
}

TEST(Executor, ExceptionsBecomeFailures) {
  auto cache = std::make_shared<FakeEnvironmentCache>();
  Pipeline pipeline(make_config(cache));
  ASSERT_TRUE(pipeline.registry().register_step(
    "explode", [](RunContext&) -> Expected<void> { throw std::runtime_error("kaboom"); }));
  ASSERT_TRUE(pipeline.registry().register_step("after", succeed(), {"explode"}));

  auto report = pipeline.execute({});
  ASSERT_TRUE(report);
  EXPECT_EQ(report->at("explode")->status, NodeStatus::Failure);
  EXPECT_EQ(report->at("explode")->cause, "kaboom");
  EXPECT_EQ(report->at("after")->status, NodeStatus::Skipped);
}

TEST(Executor, SetupFailureFailsTheNode) {
  auto cache = std::make_shared<FakeEnvironmentCache>();
  cache->failing.insert(node_identity("package"));
  Pipeline pipeline(make_config(cache));
  Trace trace;
  ASSERT_TRUE(pipeline.registry().register_step("package", trace.record()));

  auto report = pipeline.execute({});
  ASSERT_TRUE(report);
  EXPECT_EQ(report->at("package")->status, NodeStatus::Failure);
  EXPECT_EQ(report->at("package")->cause, "setup failed");
  EXPECT_TRUE(trace.snapshot().empty());
}

TEST(Executor, SetupOnlyRunsSetupHooks) {
  auto cache = std::make_shared<FakeEnvironmentCache>();
  Pipeline pipeline(make_config(cache));
  Trace setups;
  Trace runs;
  auto spec = make_step("package", {}, runs.record());
  spec.body.setup = setups.record();
  ASSERT_TRUE(pipeline.registry().register_step(std::move(spec)));

  RunOptions options;
  options.selection.setup_only = true;
  auto report = pipeline.execute(options);
  ASSERT_TRUE(report);
  EXPECT_TRUE(report->succeeded());
  EXPECT_EQ(setups.snapshot(), std::vector<std::string>{"package"});
  EXPECT_TRUE(runs.snapshot().empty());
  EXPECT_EQ(cache->ensured, std::vector<std::string>{node_identity("package")});
}

TEST(Executor, NoSetupReusesTheEnvironment) {
  auto cache = std::make_shared<FakeEnvironmentCache>();
  Pipeline pipeline(make_config(cache));
  Trace setups;
  Trace runs;
  auto spec = make_step("package", {}, runs.record());
  spec.body.setup = setups.record();
  ASSERT_TRUE(pipeline.registry().register_step(std::move(spec)));

  RunOptions options;
  options.selection.no_setup = true;
  auto report = pipeline.execute(options);
  ASSERT_TRUE(report);
  EXPECT_TRUE(report->succeeded());
  EXPECT_TRUE(setups.snapshot().empty());
  EXPECT_EQ(runs.snapshot(), std::vector<std::string>{"package"});
  EXPECT_TRUE(cache->ensured.empty());
  EXPECT_EQ(cache->opened, std::vector<std::string>{node_identity("package")});
}

TEST(Executor, UserArgumentsReachEverySelectedStep) {
  auto cache = std::make_shared<FakeEnvironmentCache>();
  Pipeline pipeline(make_config(cache));
  std::mutex mutex;
  std::vector<std::vector<std::string>> received;
  auto body = [&](RunContext& ctx) -> Expected<void> {
    std::lock_guard<std::mutex> lock(mutex);
    received.push_back(ctx.user_args());
    return {};
  };
  ASSERT_TRUE(pipeline.registry().register_step("a", body));
  ASSERT_TRUE(pipeline.registry().register_step("b", body));

  RunOptions options;
  options.user_args = {"-k", "smoke"};
  auto report = pipeline.execute(options);
  ASSERT_TRUE(report);
  ASSERT_EQ(received.size(), 2u);
  for (const auto& args : received) {
    EXPECT_EQ(args, (std::vector<std::string>{"-k", "smoke"}));
  }
}

TEST(Executor, CommandsRunInsideTheEnvironment) {
  auto cache = std::make_shared<FakeEnvironmentCache>();
  Pipeline pipeline(make_config(cache));
  ASSERT_TRUE(pipeline.registry().register_step("echo", [](RunContext& ctx) -> Expected<void> {
    auto result = ctx.run({"echo", "hello"});
    if (!result) {
      return tl::unexpected(result.error());
    }
    return {};
  }));
  ASSERT_TRUE(pipeline.registry().register_step("broken", [](RunContext& ctx) -> Expected<void> {
    auto result = ctx.run({"false"});
    if (!result) {
      return tl::unexpected(result.error());
    }
    return {};
  }));

  auto report = pipeline.execute({});
  ASSERT_TRUE(report);
  EXPECT_EQ(report->at("echo")->status, NodeStatus::Success);
  EXPECT_NE(report->at("echo")->output.find("echo hello"), std::string::npos);
  EXPECT_EQ(report->at("broken")->status, NodeStatus::Failure);
  EXPECT_EQ(report->at("broken")->cause, "Command 'false' returned exit status 1");
}

TEST(Executor, CancellationStopsPendingNodes) {
  StepRegistry registry;
  InvocationContext ctx;
  ASSERT_TRUE(registry.register_step("a", [&ctx](RunContext&) -> Expected<void> {
    ctx.cancel();
    return {};
  }));
  ASSERT_TRUE(registry.register_step("b", succeed(), {"a"}));

  auto graph = build_graph(registry);
  ASSERT_TRUE(graph);
  auto plan = select(*graph, {});
  ASSERT_TRUE(plan);

  FakeEnvironmentCache cache;
  ctx.environments = &cache;
  Executor executor(ExecutorConfig{2, false});
  auto report = executor.run(*plan, ctx);
  EXPECT_EQ(report.at("a")->status, NodeStatus::Success);
  EXPECT_EQ(report.at("b")->status, NodeStatus::Cancelled);
  EXPECT_FALSE(report.interrupted);
}

TEST(Executor, CancelledInvocationRunsNothing) {
  StepRegistry registry;
  Trace trace;
  ASSERT_TRUE(registry.register_step("a", trace.record()));
  ASSERT_TRUE(registry.register_step("b", trace.record()));
  auto graph = build_graph(registry);
  ASSERT_TRUE(graph);
  auto plan = select(*graph, {});
  ASSERT_TRUE(plan);

  FakeEnvironmentCache cache;
  InvocationContext ctx;
  ctx.environments = &cache;
  ctx.cancel();
  Executor executor(ExecutorConfig{2, false});
  auto report = executor.run(*plan, ctx);
  EXPECT_EQ(report.count(NodeStatus::Cancelled), 2u);
  EXPECT_TRUE(trace.snapshot().empty());
}

TEST(Executor, InterruptCancelsAndCallsHook) {
  StepRegistry registry;
  std::atomic<bool> release{false};
  ASSERT_TRUE(registry.register_step("slow", [&release](RunContext& ctx) -> Expected<void> {
    while (!release.load() && !ctx.cancelled()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return {};
  }));
  ASSERT_TRUE(registry.register_step("next", succeed(), {"slow"}));
  auto graph = build_graph(registry);
  ASSERT_TRUE(graph);
  auto plan = select(*graph, {});
  ASSERT_TRUE(plan);

  FakeEnvironmentCache cache;
  InvocationContext ctx;
  ctx.environments = &cache;
  std::atomic<int> interrupts{1};
  std::atomic<int> cancel_calls{0};
  std::atomic<int> abort_calls{0};
  ctx.interrupts = [&interrupts]() { return interrupts.load(); };
  ctx.on_cancel = [&cancel_calls]() { cancel_calls.fetch_add(1); };
  ctx.on_abort = [&abort_calls]() { abort_calls.fetch_add(1); };

  Executor executor(ExecutorConfig{2, false});
  auto report = executor.run(*plan, ctx);
  EXPECT_TRUE(report.interrupted);
  EXPECT_EQ(cancel_calls.load(), 1);
  EXPECT_EQ(abort_calls.load(), 0);
  // The running body returned normally after noticing the cancellation.
  EXPECT_EQ(report.at("slow")->status, NodeStatus::Success);
  EXPECT_EQ(report.at("next")->status, NodeStatus::Cancelled);
  EXPECT_FALSE(report.succeeded());
}

TEST(Executor, SecondInterruptCallsAbortHook) {
  StepRegistry registry;
  std::atomic<int> abort_calls{0};
  ASSERT_TRUE(registry.register_step("slow", [&abort_calls](RunContext&) -> Expected<void> {
    while (abort_calls.load() == 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return tl::unexpected(make_error(ErrorCode::Execution, "killed"));
  }));
  ASSERT_TRUE(registry.register_step("next", succeed(), {"slow"}));
  auto graph = build_graph(registry);
  ASSERT_TRUE(graph);
  auto plan = select(*graph, {});
  ASSERT_TRUE(plan);

  FakeEnvironmentCache cache;
  InvocationContext ctx;
  ctx.environments = &cache;
  std::atomic<int> cancel_calls{0};
  ctx.interrupts = []() { return 2; };
  ctx.on_cancel = [&cancel_calls]() { cancel_calls.fetch_add(1); };
  ctx.on_abort = [&abort_calls]() { abort_calls.fetch_add(1); };

  Executor executor(ExecutorConfig{2, false});
  auto report = executor.run(*plan, ctx);
  EXPECT_TRUE(report.interrupted);
  EXPECT_EQ(cancel_calls.load(), 1);
  EXPECT_EQ(abort_calls.load(), 1);
  EXPECT_EQ(report.at("slow")->status, NodeStatus::Cancelled);
  EXPECT_EQ(report.at("slow")->cause, "killed");
  EXPECT_EQ(report.at("next")->status, NodeStatus::Cancelled);
}

TEST(Executor, InterruptsReachRunningCommands) {
  TempDir dir;
  PipelineConfig config;
  config.cache_path = dir.path / ".dwas";
  config.executor.max_parallelism = 2;
  // Long enough that only a second interrupt can stop the command in time.
  config.termination_grace = std::chrono::seconds(60);
  config.handle_interrupts = true;
  Pipeline pipeline(std::move(config));

  const auto marker = dir.path / "started";
  ASSERT_TRUE(pipeline.registry().register_step("slow", [marker](RunContext& ctx) -> Expected<void> {
    auto result = ctx.run({"/bin/sh", "-c", "trap '' TERM; touch '" + marker.string() + "'; sleep 30"});
    if (!result) {
      return tl::unexpected(result.error());
    }
    return {};
  }));
  ASSERT_TRUE(pipeline.registry().register_step("after", succeed(), {"slow"}));

  const auto start = std::chrono::steady_clock::now();
  auto pending = std::async(std::launch::async, [&pipeline]() { return pipeline.execute({}); });
  ASSERT_TRUE(wait_for_condition([&]() { return std::filesystem::exists(marker); }, std::chrono::seconds(10)));

  InterruptGuard::raise();
  // SIGTERM is ignored by the command, so the first interrupt leaves it running.
  EXPECT_EQ(pending.wait_for(std::chrono::milliseconds(500)), std::future_status::timeout);

  InterruptGuard::raise();
  ASSERT_EQ(pending.wait_for(std::chrono::seconds(10)), std::future_status::ready);
  auto report = pending.get();
  ASSERT_TRUE(report) << report.error().message;
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(20));
  EXPECT_TRUE(report->interrupted);
  EXPECT_EQ(report->at("slow")->status, NodeStatus::Cancelled);
  EXPECT_EQ(report->at("after")->status, NodeStatus::Cancelled);
  EXPECT_NE(report->exit_code(), 0);
}

TEST(Executor, SecondRunReusesEnvironments) {
  auto cache = std::make_shared<FakeEnvironmentCache>();
  Pipeline pipeline(make_config(cache));
  register_package_and_pytest(pipeline.registry(), succeed(), succeed());

  auto first = pipeline.execute({});
  ASSERT_TRUE(first);
  EXPECT_EQ(cache->rebuilds, 3);

  auto second = pipeline.execute({});
  ASSERT_TRUE(second);
  EXPECT_TRUE(second->succeeded());
  EXPECT_EQ(cache->rebuilds, 3);
}

TEST(Executor, CleanDropsSelectedEnvironments) {
  auto cache = std::make_shared<FakeEnvironmentCache>();
  Pipeline pipeline(make_config(cache));
  register_package_and_pytest(pipeline.registry(), succeed(), succeed());

  RunOptions options;
  options.clean = true;
  options.selection.only = {"package"};
  auto report = pipeline.execute(options);
  ASSERT_TRUE(report);
  EXPECT_EQ(cache->cleaned, std::vector<std::string>{node_identity("package")});
}

TEST(Executor, SelectionErrorsAreReturnedBeforeRunning) {
  auto cache = std::make_shared<FakeEnvironmentCache>();
  Pipeline pipeline(make_config(cache));
  Trace trace;
  ASSERT_TRUE(pipeline.registry().register_step("a", trace.record()));

  RunOptions options;
  options.selection.only = {"missing"};
  auto report = pipeline.execute(options);
  ASSERT_FALSE(report);
  EXPECT_EQ(report.error().code, ErrorCode::UnknownStep);
  EXPECT_TRUE(trace.snapshot().empty());
}

TEST(Executor, RequirementsSetUpTheirDependents) {
  auto cache = std::make_shared<FakeEnvironmentCache>();
  Pipeline pipeline(make_config(cache));
  Trace trace;
  auto record_setup = [&trace](RunContext& origin, RunContext& dependent) -> Expected<void> {
    std::lock_guard<std::mutex> lock(trace.mutex);
    trace.keys.push_back(origin.key() + " -> " + dependent.key());
    return {};
  };

  auto package = make_step("package", {}, trace.record());
  package.body.setup_dependent = record_setup;
  ASSERT_TRUE(pipeline.registry().register_step(std::move(package)));
  auto pytest = make_step("pytest", {"package"}, trace.record());
  pytest.parameters.push_back(Parametrization::single("python", {"3.8", "3.9"}));
  pytest.body.setup_dependent = record_setup;
  ASSERT_TRUE(pipeline.registry().register_step(std::move(pytest)));
  // Requires the group, which forwards to every variant.
  ASSERT_TRUE(pipeline.registry().register_step("coverage", trace.record(), {"pytest"}));

  auto report = pipeline.execute({});
  ASSERT_TRUE(report) << report.error().message;
  EXPECT_TRUE(report->succeeded());

  auto ran = trace.snapshot();
  for (const std::string variant : {"pytest[3.8]", "pytest[3.9]"}) {
    auto injected = position_of(ran, "package -> " + variant);
    ASSERT_GE(injected, 0) << variant;
    EXPECT_LT(injected, position_of(ran, variant));
    auto forwarded = position_of(ran, variant + " -> coverage");
    ASSERT_GE(forwarded, 0) << variant;
    EXPECT_LT(forwarded, position_of(ran, "coverage"));
  }
  EXPECT_EQ(position_of(ran, "package -> coverage"), -1);
  EXPECT_EQ(ran.size(), 8u);
}

TEST(Executor, SetupOnlySkipsDependentSetup) {
  auto cache = std::make_shared<FakeEnvironmentCache>();
  Pipeline pipeline(make_config(cache));
  std::atomic<int> calls{0};
  auto package = make_step("package", {}, succeed());
  package.body.setup_dependent = [&calls](RunContext&, RunContext&) -> Expected<void> {
    calls.fetch_add(1);
    return {};
  };
  ASSERT_TRUE(pipeline.registry().register_step(std::move(package)));
  ASSERT_TRUE(pipeline.registry().register_step("pytest", succeed(), {"package"}));

  RunOptions options;
  options.selection.setup_only = true;
  ASSERT_TRUE(pipeline.execute(options));
  EXPECT_EQ(calls.load(), 0);

  options.selection.setup_only = false;
  options.selection.no_setup = true;
  ASSERT_TRUE(pipeline.execute(options));
  EXPECT_EQ(calls.load(), 1);
}

TEST(Executor, FailedDependentSetupFailsTheDependent) {
  auto cache = std::make_shared<FakeEnvironmentCache>();
  Pipeline pipeline(make_config(cache));
  Trace runs;
  auto package = make_step("package", {}, runs.record());
  package.body.setup_dependent = [](RunContext&, RunContext&) -> Expected<void> {
    return tl::unexpected(make_error(ErrorCode::Execution, "no wheel was built"));
  };
  ASSERT_TRUE(pipeline.registry().register_step(std::move(package)));
  ASSERT_TRUE(pipeline.registry().register_step("pytest", runs.record(), {"package"}));

  auto report = pipeline.execute({});
  ASSERT_TRUE(report);
  EXPECT_EQ(report->at("package")->status, NodeStatus::Success);
  EXPECT_EQ(report->at("pytest")->status, NodeStatus::Failure);
  EXPECT_EQ(report->at("pytest")->cause, "setup from package failed: no wheel was built");
  EXPECT_EQ(runs.snapshot(), std::vector<std::string>{"package"});
}

TEST(Executor, ArtifactsAreGatheredThroughGroups) {
  auto cache = std::make_shared<FakeEnvironmentCache>();
  Pipeline pipeline(make_config(cache));
  ASSERT_TRUE(pipeline.registry().register_step("lint", succeed()));
  auto pytest = make_step("pytest", {}, succeed());
  pytest.parameters.push_back(Parametrization::single("python", {"3.8", "3.9"}));
  pytest.body.gather_artifacts = [](RunContext& ctx) -> Expected<Json> {
    return Json{{"coverage", Json::array({"cov-" + ctx.key()})}};
  };
  ASSERT_TRUE(pipeline.registry().register_step(std::move(pytest)));

  std::vector<Json> coverage;
  std::vector<Json> missing;
  ASSERT_TRUE(pipeline.registry().register_step(
    "combine",
    [&](RunContext& ctx) -> Expected<void> {
      auto found = ctx.artifacts("coverage");
      if (!found) {
        return tl::unexpected(found.error());
      }
      coverage = std::move(*found);
      auto none = ctx.artifacts("junit");
      if (!none) {
        return tl::unexpected(none.error());
      }
      missing = std::move(*none);
      return {};
    },
    {"pytest", "lint"}));

  auto report = pipeline.execute({});
  ASSERT_TRUE(report) << report.error().message;
  EXPECT_TRUE(report->succeeded());
  EXPECT_EQ(coverage, (std::vector<Json>{"cov-pytest[3.8]", "cov-pytest[3.9]"}));
  EXPECT_TRUE(missing.empty());
}

TEST(Executor, CleanHookRunsBeforeTheEnvironmentIsDropped) {
  auto cache = std::make_shared<FakeEnvironmentCache>();
  Pipeline pipeline(make_config(cache));
  std::vector<std::string> hooks;
  std::size_t dropped_before_hook = 0;
  auto package = make_step("package", {}, succeed());
  package.body.clean = [&](RunContext& ctx) -> Expected<void> {
    hooks.push_back(ctx.key());
    dropped_before_hook = cache->cleaned.size();
    return {};
  };
  ASSERT_TRUE(pipeline.registry().register_step(std::move(package)));
  ASSERT_TRUE(pipeline.registry().register_step("lint", succeed()));

  RunOptions options;
  options.clean = true;
  options.selection.only = {"package"};
  auto report = pipeline.execute(options);
  ASSERT_TRUE(report);
  EXPECT_EQ(hooks, std::vector<std::string>{"package"});
  EXPECT_EQ(dropped_before_hook, 0u);
  EXPECT_EQ(cache->cleaned, std::vector<std::string>{node_identity("package")});
}

TEST(Executor, FailingCleanHookStopsTheInvocation) {
  auto cache = std::make_shared<FakeEnvironmentCache>();
  Pipeline pipeline(make_config(cache));
  Trace runs;
  auto package = make_step("package", {}, runs.record());
  package.body.clean = [](RunContext&) -> Expected<void> {
    return tl::unexpected(make_error(ErrorCode::Io, "dist is busy"));
  };
  ASSERT_TRUE(pipeline.registry().register_step(std::move(package)));

  RunOptions options;
  options.clean = true;
  auto report = pipeline.execute(options);
  ASSERT_FALSE(report);
  EXPECT_EQ(report.error().message, "cleaning package failed: dist is busy");
  EXPECT_TRUE(cache->cleaned.empty());
  EXPECT_TRUE(runs.snapshot().empty());
}
