#include "runtime/process.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

#include <csignal>
#include <cstdlib>
#include <future>

using namespace dwas::engine;

namespace {

auto shell(std::string script) -> Command {
  Command command;
  command.argv = {"/bin/sh", "-c", std::move(script)};
  command.env = {{"PATH", "/usr/local/bin:/usr/bin:/bin"}};
  return command;
}

}  // namespace

TEST(ProcessManager, ReportsExitCode) {
  ProcessManager processes;
  auto result = processes.run(shell("exit 3"));
  ASSERT_TRUE(result) << result.error().message;
  EXPECT_EQ(result->exit_code, 3);
  EXPECT_EQ(processes.running(), 0u);
}

TEST(ProcessManager, CapturesStdoutAndStderr) {
  ProcessManager processes;
  auto result = processes.run(shell("echo out; echo err >&2"));
  ASSERT_TRUE(result);
  EXPECT_EQ(result->exit_code, 0);
  EXPECT_NE(result->output.find("out\n"), std::string::npos);
  EXPECT_NE(result->output.find("err\n"), std::string::npos);
}

TEST(ProcessManager, UsesOnlyTheGivenEnvironment) {
  ::setenv("DWAS_TEST_LEAK", "leaked", 1);
  ProcessManager processes;
  auto command = shell("echo \"[$DWAS_TEST_VALUE][$DWAS_TEST_LEAK]\"");
  command.env.emplace_back("DWAS_TEST_VALUE", "42");
  auto result = processes.run(command);
  ::unsetenv("DWAS_TEST_LEAK");
  ASSERT_TRUE(result);
  EXPECT_EQ(result->output, "[42][]\n");
}

TEST(ProcessManager, RunsInTheWorkingDirectory) {
  TempDir dir;
  ProcessManager processes;
  auto command = shell("pwd");
  command.cwd = dir.path.string();
  auto result = processes.run(command);
  ASSERT_TRUE(result);
  EXPECT_EQ(result->output, std::filesystem::canonical(dir.path).string() + "\n");
}

TEST(ProcessManager, MissingExecutableExitsWith127) {
  ProcessManager processes;
  Command command;
  command.argv = {"/nonexistent/dwas-binary"};
  auto result = processes.run(command);
  ASSERT_TRUE(result);
  EXPECT_EQ(result->exit_code, 127);
  EXPECT_NE(result->output.find("failed to execute command"), std::string::npos);
}

TEST(ProcessManager, RejectsEmptyCommand) {
  ProcessManager processes;
  auto result = processes.run(Command{});
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code, ErrorCode::Execution);
}

TEST(ProcessManager, TerminateStopsRunningProcesses) {
  ProcessManager processes(std::chrono::seconds(5));
  auto pending = std::async(std::launch::async, [&processes]() { return processes.run(shell("sleep 30")); });
  ASSERT_TRUE(wait_for_condition([&]() { return processes.running() == 1; }, std::chrono::seconds(5)));

  processes.terminate_all();
  auto result = pending.get();
  ASSERT_TRUE(result);
  EXPECT_EQ(result->exit_code, 128 + SIGTERM);
  EXPECT_EQ(processes.running(), 0u);
}

TEST(ProcessManager, EscalatesToKillAfterGracePeriod) {
  ProcessManager processes(std::chrono::milliseconds(200));
  auto pending =
    std::async(std::launch::async, [&processes]() { return processes.run(shell("trap '' TERM; sleep 30")); });
  ASSERT_TRUE(wait_for_condition([&]() { return processes.running() == 1; }, std::chrono::seconds(5)));
  // Give the shell time to install its trap.
  std::this_thread::sleep_for(std::chrono::milliseconds(100));

  processes.terminate_all();
  auto result = pending.get();
  ASSERT_TRUE(result);
  EXPECT_EQ(result->exit_code, 128 + SIGKILL);
}

TEST(ProcessManager, CommandsStartedAfterTerminateAreStopped) {
  ProcessManager processes(std::chrono::seconds(5));
  processes.terminate_all();
  auto start = std::chrono::steady_clock::now();
  auto result = processes.run(shell("sleep 30"));
  ASSERT_TRUE(result);
  EXPECT_NE(result->exit_code, 0);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
}

TEST(ProcessManager, KillAllStopsImmediately) {
  ProcessManager processes(std::chrono::seconds(30));
  auto pending =
    std::async(std::launch::async, [&processes]() { return processes.run(shell("trap '' TERM; sleep 30")); });
  ASSERT_TRUE(wait_for_condition([&]() { return processes.running() == 1; }, std::chrono::seconds(5)));

  processes.kill_all();
  auto result = pending.get();
  ASSERT_TRUE(result);
  EXPECT_EQ(result->exit_code, 128 + SIGKILL);
}

TEST(ProcessManager, ChildInheritsOnlyStandardDescriptors) {
  ProcessManager processes;
  // Lists descriptors above stderr that still point at /dev/null.
  auto result = processes.run(shell(
    "for f in /proc/$$/fd/*; do n=${f##*/}; "
    "if [ \"$n\" -gt 2 ] && [ \"$(readlink \"$f\")\" = /dev/null ]; then echo \"leaked $n\"; fi; done; true"));
  ASSERT_TRUE(result) << result.error().message;
  EXPECT_EQ(result->exit_code, 0);
  EXPECT_EQ(result->output, "");
}
