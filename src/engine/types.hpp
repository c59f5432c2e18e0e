#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "engine/error.hpp"

namespace dwas::engine {

using Json = nlohmann::json;

class RunContext;

struct BoundParameter {
  std::string name;
  Json value;
};

using ParameterList = std::vector<BoundParameter>;

using EnvironmentVariables = std::vector<std::pair<std::string, std::string>>;

using StepFn = std::function<Expected<void>(RunContext&)>;

/// Called on a requirement, before the dependent's run hook, with the
/// requirement's own context and the dependent's context.
using DependentSetupFn = std::function<Expected<void>(RunContext& requirement, RunContext& dependent)>;

/// Returns an object mapping an artifact key to a list of values.
using ArtifactsFn = std::function<Expected<Json>(RunContext&)>;

/// Every hook is optional.
struct StepBody {
  StepFn setup;
  StepFn run;
  DependentSetupFn setup_dependent;
  ArtifactsFn gather_artifacts;
  StepFn clean;
};

auto parameter_to_string(const Json& value) -> std::string;

/// Unknown placeholders are kept as written.
auto format_placeholders(std::string_view text, const ParameterList& parameters) -> std::string;

auto find_parameter(const ParameterList& parameters, std::string_view name) -> const Json*;

}  // namespace dwas::engine
