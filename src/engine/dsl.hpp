#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "engine/error.hpp"
#include "engine/registry.hpp"
#include "engine/types.hpp"

namespace dwas::engine {

/// argv template. `{param}` and `{cache_dir}` placeholders are formatted for
/// the node running it. An argument equal to `{user_args}` expands to the
/// pass-through arguments, one equal to `{artifacts:KEY}` to the artifacts the
/// node's requirements publish under KEY.
using CommandTemplate = std::vector<std::string>;

struct CommandSet {
  std::vector<CommandTemplate> setup;
  std::vector<CommandTemplate> run;
  /// Formatted for this step, run inside each dependent's environment.
  std::vector<CommandTemplate> setup_dependent;
  std::vector<CommandTemplate> clean;
  /// Artifact key to a list of argument templates.
  Json artifacts = Json::object();
};

auto make_command_body(CommandSet commands) -> StepBody;

auto parse_step_file(const Json& json, StepRegistry& registry) -> Expected<void>;

auto load_step_file(const std::filesystem::path& path, StepRegistry& registry) -> Expected<void>;

}  // namespace dwas::engine
