#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

#include <gflags/gflags.h>

#include "cli/options.hpp"
#include "common/logging/log.hpp"
#include "runtime/pipeline.hpp"

DECLARE_string(only);
DECLARE_string(except);
DECLARE_bool(setup_only);
DECLARE_bool(no_setup);
DECLARE_bool(fail_fast);
DECLARE_bool(list);
DECLARE_bool(list_dependencies);
DECLARE_bool(verbose);
DECLARE_bool(clean);
DECLARE_int32(jobs);
DECLARE_string(config);
DECLARE_string(cache_path);
DECLARE_string(install_command);
DECLARE_string(log_level);

namespace {

auto run(const dwas::cli::CommandLine& command_line, const std::vector<std::string>& positional) -> int {
  using namespace dwas::engine;

  PipelineConfig config;
  config.executor.max_parallelism = FLAGS_jobs;
  config.executor.fail_fast = FLAGS_fail_fast;
  config.cache_path = FLAGS_cache_path;
  config.install_command = FLAGS_install_command;

  const bool listing = FLAGS_list || FLAGS_list_dependencies;

  Pipeline pipeline(std::move(config));
  if (auto loaded = pipeline.load(FLAGS_config); !loaded) {
    dwas::log::error("{}", loaded.error().message);
    return dwas::cli::exit_status(loaded.error(), listing);
  }

  SelectOptions selection;
  selection.steps = dwas::cli::split_list(positional);
  selection.only = dwas::cli::split_list(FLAGS_only);
  selection.except_steps = dwas::cli::split_list(FLAGS_except);
  selection.setup_only = FLAGS_setup_only;
  selection.no_setup = FLAGS_no_setup;

  if (listing) {
    ListOptions list_options;
    list_options.show_dependencies = FLAGS_list_dependencies;
    list_options.verbose = FLAGS_verbose;
    auto lines = pipeline.list(selection, list_options);
    if (!lines) {
      dwas::log::error("{}", lines.error().message);
      return dwas::cli::exit_status(lines.error(), listing);
    }
    for (const auto& line : *lines) {
      dwas::log::info("{}", line);
    }
    return 0;
  }

  RunOptions options;
  options.selection = std::move(selection);
  options.user_args = command_line.user_args;
  options.clean = FLAGS_clean;

  auto report = pipeline.execute(options);
  if (!report) {
    dwas::log::error("{}", report.error().message);
    return dwas::cli::exit_status(report.error(), false);
  }
  return report->exit_code();
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage("dwas [flags] [steps...] [-- arguments for the steps]");

  auto command_line = dwas::cli::parse_command_line(std::vector<std::string>(argv, argv + argc),
                                                    std::getenv("DWAS_ADDOPTS"));
  if (!command_line) {
    dwas::log::error("{}", command_line.error().message);
    return 2;
  }

  std::vector<char*> args;
  args.reserve(command_line->flags.size() + 1);
  for (auto& arg : command_line->flags) {
    args.push_back(arg.data());
  }
  args.push_back(nullptr);
  int flag_count = static_cast<int>(command_line->flags.size());
  char** flag_values = args.data();
  gflags::ParseCommandLineFlags(&flag_count, &flag_values, true);

  dwas::log::init();
  if (FLAGS_verbose && FLAGS_log_level == "info") {
    dwas::log::set_level("debug");
  }

  std::vector<std::string> positional(flag_values + 1, flag_values + flag_count);
  int status = run(*command_line, positional);

  dwas::log::shutdown();
  gflags::ShutDownCommandLineFlags();
  return status;
}
