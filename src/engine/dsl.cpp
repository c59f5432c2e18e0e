#include "engine/dsl.hpp"

#include <format>
#include <fstream>
#include <optional>
#include <string_view>
#include <utility>

#include "common/logging/log.hpp"
#include "engine/context.hpp"

namespace dwas::engine {
namespace {

constexpr std::string_view kUserArgs = "{user_args}";
constexpr std::string_view kCacheDir = "{cache_dir}";
constexpr std::string_view kArtifactsPrefix = "{artifacts:";

auto field_error(std::string_view context, std::string_view field, std::string_view problem) -> EngineError {
  return make_error(ErrorCode::InvalidDefinition, std::format("{}: '{}' {}", context, field, problem));
}

auto get_string_field(const Json& obj, std::string_view field, std::string_view context)
  -> Expected<std::string> {
  auto it = obj.find(std::string(field));
  if (it == obj.end() || !it->is_string()) {
    return tl::unexpected(field_error(context, field, "is missing or not a string"));
  }
  return it->get<std::string>();
}

auto get_optional_string(const Json& obj, std::string_view field, std::string_view context)
  -> Expected<std::optional<std::string>> {
  auto it = obj.find(std::string(field));
  if (it == obj.end()) {
    return std::optional<std::string>{};
  }
  if (!it->is_string()) {
    return tl::unexpected(field_error(context, field, "must be a string"));
  }
  return std::optional<std::string>{it->get<std::string>()};
}

auto get_optional_bool(const Json& obj, std::string_view field, std::string_view context)
  -> Expected<std::optional<bool>> {
  auto it = obj.find(std::string(field));
  if (it == obj.end()) {
    return std::optional<bool>{};
  }
  if (!it->is_boolean()) {
    return tl::unexpected(field_error(context, field, "must be a boolean"));
  }
  return std::optional<bool>{it->get<bool>()};
}

auto to_strings(const Json& value, std::string_view field, std::string_view context)
  -> Expected<std::vector<std::string>> {
  if (!value.is_array()) {
    return tl::unexpected(field_error(context, field, "must be a list of strings"));
  }
  std::vector<std::string> out;
  out.reserve(value.size());
  for (const auto& entry : value) {
    if (!entry.is_string()) {
      return tl::unexpected(field_error(context, field, "must be a list of strings"));
    }
    out.push_back(entry.get<std::string>());
  }
  return out;
}

auto get_optional_strings(const Json& obj, std::string_view field, std::string_view context)
  -> Expected<std::optional<std::vector<std::string>>> {
  auto it = obj.find(std::string(field));
  if (it == obj.end()) {
    return std::optional<std::vector<std::string>>{};
  }
  auto values = to_strings(*it, field, context);
  if (!values) {
    return tl::unexpected(values.error());
  }
  return std::optional<std::vector<std::string>>{std::move(*values)};
}

auto parse_commands(const Json& obj, std::string_view field, std::string_view context)
  -> Expected<std::vector<CommandTemplate>> {
  std::vector<CommandTemplate> commands;
  auto it = obj.find(std::string(field));
  if (it == obj.end()) {
    return commands;
  }
  if (!it->is_array()) {
    return tl::unexpected(field_error(context, field, "must be a list of commands"));
  }
  for (const auto& command : *it) {
    auto argv = to_strings(command, field, context);
    if (!argv) {
      return tl::unexpected(argv.error());
    }
    if (argv->empty()) {
      return tl::unexpected(field_error(context, field, "contains an empty command"));
    }
    commands.push_back(std::move(*argv));
  }
  return commands;
}

auto parse_artifacts(const Json& obj, std::string_view context) -> Expected<Json> {
  auto out = Json::object();
  auto it = obj.find("artifacts");
  if (it == obj.end()) {
    return out;
  }
  if (!it->is_object()) {
    return tl::unexpected(field_error(context, "artifacts", "must be an object"));
  }
  for (const auto& [key, value] : it->items()) {
    if (value.is_string()) {
      out[key] = Json::array({value});
      continue;
    }
    auto values = to_strings(value, "artifacts." + key, context);
    if (!values) {
      return tl::unexpected(values.error());
    }
    out[key] = *values;
  }
  return out;
}

auto parse_parametrization(const Json& entry, std::string_view context) -> Expected<Parametrization> {
  if (!entry.is_object()) {
    return tl::unexpected(field_error(context, "parametrize", "entries must be objects"));
  }

  Parametrization out;
  if (auto names_it = entry.find("names"); names_it != entry.end()) {
    auto names = to_strings(*names_it, "parametrize.names", context);
    if (!names) {
      return tl::unexpected(names.error());
    }
    out.names = std::move(*names);

    auto values_it = entry.find("values");
    if (values_it == entry.end() || !values_it->is_array()) {
      return tl::unexpected(field_error(context, "parametrize.values", "must be a list"));
    }
    for (const auto& row : *values_it) {
      // A single parameter may list bare values instead of one-element rows.
      if (out.names.size() == 1 && !row.is_array()) {
        out.rows.push_back(std::vector<Json>(1, row));
        continue;
      }
      if (!row.is_array()) {
        return tl::unexpected(field_error(context, "parametrize.values", "rows must be lists"));
      }
      out.rows.emplace_back(row.begin(), row.end());
    }

    if (auto ids_it = entry.find("ids"); ids_it != entry.end()) {
      if (!ids_it->is_array()) {
        return tl::unexpected(field_error(context, "parametrize.ids", "must be a list"));
      }
      for (const auto& id : *ids_it) {
        if (id.is_null()) {
          out.ids.emplace_back(std::nullopt);
        } else if (id.is_string()) {
          out.ids.emplace_back(id.get<std::string>());
        } else {
          return tl::unexpected(field_error(context, "parametrize.ids", "must contain strings or null"));
        }
      }
    }
    return out;
  }

  if (entry.size() != 1) {
    return tl::unexpected(field_error(context, "parametrize", "shorthand entries must name exactly one parameter"));
  }
  auto item = entry.begin();
  if (!item->is_array()) {
    return tl::unexpected(field_error(context, "parametrize." + item.key(), "must be a list of values"));
  }
  return Parametrization::single(item.key(), std::vector<Json>(item->begin(), item->end()));
}

auto parse_step(const Json& json, std::size_t position) -> Expected<StepSpec> {
  if (!json.is_object()) {
    return tl::unexpected(make_error(ErrorCode::InvalidDefinition, std::format("steps[{}] must be an object", position)));
  }
  auto name = get_string_field(json, "name", std::format("steps[{}]", position));
  if (!name) {
    return tl::unexpected(name.error());
  }
  const auto context = std::format("step '{}'", *name);

  StepSpec spec;
  spec.name = std::move(*name);

  auto description = get_optional_string(json, "description", context);
  if (!description) {
    return tl::unexpected(description.error());
  }
  spec.description = std::move(*description);

  auto requirements = get_optional_strings(json, "requires", context);
  if (!requirements) {
    return tl::unexpected(requirements.error());
  }
  spec.requirements = std::move(*requirements);

  auto dependencies = get_optional_strings(json, "dependencies", context);
  if (!dependencies) {
    return tl::unexpected(dependencies.error());
  }
  spec.dependencies = std::move(*dependencies);

  auto run_by_default = get_optional_bool(json, "run_by_default", context);
  if (!run_by_default) {
    return tl::unexpected(run_by_default.error());
  }
  spec.run_by_default = *run_by_default;

  if (auto it = json.find("parametrize"); it != json.end()) {
    if (!it->is_array()) {
      return tl::unexpected(field_error(context, "parametrize", "must be a list"));
    }
    for (const auto& entry : *it) {
      auto parametrization = parse_parametrization(entry, context);
      if (!parametrization) {
        return tl::unexpected(parametrization.error());
      }
      spec.parameters.push_back(std::move(*parametrization));
    }
  }

  if (auto it = json.find("defaults"); it != json.end()) {
    if (!it->is_object()) {
      return tl::unexpected(field_error(context, "defaults", "must be an object"));
    }
    spec.defaults = *it;
  }

  auto cwd = get_optional_string(json, "cwd", context);
  if (!cwd) {
    return tl::unexpected(cwd.error());
  }
  spec.cwd = cwd->value_or("");

  if (auto it = json.find("setenv"); it != json.end()) {
    if (!it->is_object()) {
      return tl::unexpected(field_error(context, "setenv", "must be an object of strings"));
    }
    for (const auto& [variable, value] : it->items()) {
      if (!value.is_string()) {
        return tl::unexpected(field_error(context, "setenv." + variable, "must be a string"));
      }
      spec.setenv.emplace_back(variable, value.get<std::string>());
    }
  }

  auto passenv = get_optional_strings(json, "passenv", context);
  if (!passenv) {
    return tl::unexpected(passenv.error());
  }
  spec.passenv = passenv->value_or(std::vector<std::string>{});

  auto setup = parse_commands(json, "setup", context);
  if (!setup) {
    return tl::unexpected(setup.error());
  }
  auto run = parse_commands(json, "run", context);
  if (!run) {
    return tl::unexpected(run.error());
  }
  auto setup_dependent = parse_commands(json, "setup_dependent", context);
  if (!setup_dependent) {
    return tl::unexpected(setup_dependent.error());
  }
  auto clean = parse_commands(json, "clean", context);
  if (!clean) {
    return tl::unexpected(clean.error());
  }
  auto artifacts = parse_artifacts(json, context);
  if (!artifacts) {
    return tl::unexpected(artifacts.error());
  }

  CommandSet commands;
  commands.setup = std::move(*setup);
  commands.run = std::move(*run);
  commands.setup_dependent = std::move(*setup_dependent);
  commands.clean = std::move(*clean);
  commands.artifacts = std::move(*artifacts);
  spec.body = make_command_body(std::move(commands));
  return spec;
}

auto parse_group(const Json& json, std::size_t position) -> Expected<GroupSpec> {
  if (!json.is_object()) {
    return tl::unexpected(make_error(ErrorCode::InvalidDefinition, std::format("groups[{}] must be an object", position)));
  }
  auto name = get_string_field(json, "name", std::format("groups[{}]", position));
  if (!name) {
    return tl::unexpected(name.error());
  }
  const auto context = std::format("group '{}'", *name);

  GroupSpec group;
  group.name = std::move(*name);

  auto it = json.find("requires");
  if (it == json.end()) {
    return tl::unexpected(field_error(context, "requires", "is required"));
  }
  auto requirements = to_strings(*it, "requires", context);
  if (!requirements) {
    return tl::unexpected(requirements.error());
  }
  group.requirements = std::move(*requirements);

  auto description = get_optional_string(json, "description", context);
  if (!description) {
    return tl::unexpected(description.error());
  }
  group.description = std::move(*description);

  auto run_by_default = get_optional_bool(json, "run_by_default", context);
  if (!run_by_default) {
    return tl::unexpected(run_by_default.error());
  }
  group.run_by_default = *run_by_default;
  return group;
}

auto format_argument(const std::string& arg, const RunContext& ctx) -> std::string {
  auto out = format_placeholders(arg, ctx.parameters());
  const auto cache_dir = ctx.cache_dir().string();
  for (auto pos = out.find(kCacheDir); pos != std::string::npos; pos = out.find(kCacheDir, pos + cache_dir.size())) {
    out.replace(pos, kCacheDir.size(), cache_dir);
  }
  return out;
}

auto artifacts_key(const std::string& arg) -> std::optional<std::string> {
  if (arg.size() <= kArtifactsPrefix.size() + 1 || !arg.starts_with(kArtifactsPrefix) || arg.back() != '}') {
    return std::nullopt;
  }
  return arg.substr(kArtifactsPrefix.size(), arg.size() - kArtifactsPrefix.size() - 1);
}

auto expand_command(const CommandTemplate& command, const RunContext& ctx) -> Expected<std::vector<std::string>> {
  std::vector<std::string> argv;
  argv.reserve(command.size());
  for (const auto& arg : command) {
    if (arg == kUserArgs) {
      argv.insert(argv.end(), ctx.user_args().begin(), ctx.user_args().end());
      continue;
    }
    if (auto key = artifacts_key(arg)) {
      auto artifacts = ctx.artifacts(*key);
      if (!artifacts) {
        return tl::unexpected(artifacts.error());
      }
      for (const auto& artifact : *artifacts) {
        argv.push_back(parameter_to_string(artifact));
      }
      continue;
    }
    argv.push_back(format_argument(arg, ctx));
  }
  return argv;
}

auto consumes_user_args(const std::vector<CommandTemplate>& commands) -> bool {
  for (const auto& command : commands) {
    for (const auto& arg : command) {
      if (arg == kUserArgs) {
        return true;
      }
    }
  }
  return false;
}

// Commands are formatted with `origin` and started in `target`.
auto run_commands(const std::vector<CommandTemplate>& commands, const RunContext& origin, RunContext& target)
  -> Expected<void> {
  for (const auto& command : commands) {
    auto argv = expand_command(command, origin);
    if (!argv) {
      return tl::unexpected(argv.error());
    }
    auto result = target.run(std::move(*argv));
    if (!result) {
      return tl::unexpected(result.error());
    }
  }
  return {};
}

auto make_runner(std::vector<CommandTemplate> commands, bool warn_unused_args) -> StepFn {
  if (commands.empty() && !warn_unused_args) {
    return {};
  }
  return [commands = std::move(commands), warn_unused_args](RunContext& ctx) -> Expected<void> {
    if (warn_unused_args && !ctx.user_args().empty()) {
      log::warn("{}: additional arguments were given but this step does not use them", ctx.key());
    }
    return run_commands(commands, ctx, ctx);
  };
}

auto make_dependent_runner(std::vector<CommandTemplate> commands) -> DependentSetupFn {
  if (commands.empty()) {
    return {};
  }
  return [commands = std::move(commands)](RunContext& requirement, RunContext& dependent) -> Expected<void> {
    return run_commands(commands, requirement, dependent);
  };
}

auto make_artifacts(Json artifacts) -> ArtifactsFn {
  if (artifacts.empty()) {
    return {};
  }
  return [artifacts = std::move(artifacts)](RunContext& ctx) -> Expected<Json> {
    auto out = Json::object();
    for (const auto& [key, templates] : artifacts.items()) {
      auto& values = out[key];
      values = Json::array();
      for (const auto& entry : templates) {
        values.push_back(format_argument(entry.get<std::string>(), ctx));
      }
    }
    return out;
  };
}

}  // namespace

auto make_command_body(CommandSet commands) -> StepBody {
  const bool unused_args = !consumes_user_args(commands.setup) && !consumes_user_args(commands.run);
  StepBody body;
  body.setup = make_runner(std::move(commands.setup), false);
  body.run = make_runner(std::move(commands.run), unused_args);
  body.setup_dependent = make_dependent_runner(std::move(commands.setup_dependent));
  body.clean = make_runner(std::move(commands.clean), false);
  body.gather_artifacts = make_artifacts(std::move(commands.artifacts));
  return body;
}

auto parse_step_file(const Json& json, StepRegistry& registry) -> Expected<void> {
  if (!json.is_object()) {
    return tl::unexpected(make_error(ErrorCode::InvalidDefinition, "step file must contain an object"));
  }
  if (auto it = json.find("version"); it != json.end()) {
    if (!it->is_number_integer() || it->get<int>() != 1) {
      return tl::unexpected(make_error(ErrorCode::InvalidDefinition, "unsupported step file version"));
    }
  }

  auto steps_it = json.find("steps");
  if (steps_it != json.end()) {
    if (!steps_it->is_array()) {
      return tl::unexpected(make_error(ErrorCode::InvalidDefinition, "steps must be an array"));
    }
    for (std::size_t i = 0; i < steps_it->size(); ++i) {
      auto spec = parse_step((*steps_it)[i], i);
      if (!spec) {
        return tl::unexpected(spec.error());
      }
      if (auto registered = registry.register_step(std::move(*spec)); !registered) {
        return tl::unexpected(registered.error());
      }
    }
  }

  auto groups_it = json.find("groups");
  if (groups_it != json.end()) {
    if (!groups_it->is_array()) {
      return tl::unexpected(make_error(ErrorCode::InvalidDefinition, "groups must be an array"));
    }
    for (std::size_t i = 0; i < groups_it->size(); ++i) {
      auto group = parse_group((*groups_it)[i], i);
      if (!group) {
        return tl::unexpected(group.error());
      }
      if (auto registered = registry.register_group(std::move(*group)); !registered) {
        return tl::unexpected(registered.error());
      }
    }
  }
  return {};
}

auto load_step_file(const std::filesystem::path& path, StepRegistry& registry) -> Expected<void> {
  std::ifstream in(path);
  if (!in) {
    return tl::unexpected(
      make_error(ErrorCode::InvalidConfig, std::format("cannot open step file {}", path.string())));
  }
  auto json = Json::parse(in, nullptr, false);
  if (json.is_discarded()) {
    return tl::unexpected(
      make_error(ErrorCode::InvalidConfig, std::format("{} is not valid JSON", path.string())));
  }
  log::debug("Loading steps from {}", path.string());
  return parse_step_file(json, registry);
}

}  // namespace dwas::engine
