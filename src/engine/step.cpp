#include "engine/step.hpp"

#include <format>
#include <string_view>
#include <unordered_set>
#include <utility>

namespace dwas::engine {
namespace {

constexpr std::string_view kReservedRequires = "requires";
constexpr std::string_view kReservedDependencies = "dependencies";
constexpr std::string_view kReservedRunByDefault = "run_by_default";
constexpr std::string_view kReservedDescription = "description";

struct Combination {
  std::vector<std::string> ids;
  ParameterList values;
};

auto join(const std::vector<std::string>& parts, std::string_view separator) -> std::string {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i != 0) {
      out += separator;
    }
    out += parts[i];
  }
  return out;
}

auto row_id(const Parametrization& parametrization, std::size_t row) -> std::string {
  if (row < parametrization.ids.size() && parametrization.ids[row].has_value()) {
    return *parametrization.ids[row];
  }
  std::vector<std::string> parts;
  parts.reserve(parametrization.rows[row].size());
  for (const auto& value : parametrization.rows[row]) {
    parts.push_back(parameter_to_string(value));
  }
  return join(parts, "-");
}

auto is_spec_level_set(const StepSpec& spec, std::string_view name) -> bool {
  if (name == kReservedRequires) {
    return spec.requirements.has_value();
  }
  if (name == kReservedDependencies) {
    return spec.dependencies.has_value();
  }
  if (name == kReservedRunByDefault) {
    return spec.run_by_default.has_value();
  }
  if (name == kReservedDescription) {
    return spec.description.has_value();
  }
  return false;
}

auto take_parameter(ParameterList& parameters, std::string_view name) -> std::optional<Json> {
  for (auto it = parameters.begin(); it != parameters.end(); ++it) {
    if (it->name == name) {
      auto value = std::move(it->value);
      parameters.erase(it);
      return value;
    }
  }
  return std::nullopt;
}

auto to_string_list(const Json& value, std::string_view step, std::string_view field)
  -> Expected<std::vector<std::string>> {
  if (!value.is_array()) {
    return tl::unexpected(make_error(ErrorCode::InvalidDefinition,
                                     std::format("{}: '{}' must be a list of strings", step, field)));
  }
  std::vector<std::string> out;
  out.reserve(value.size());
  for (const auto& entry : value) {
    if (!entry.is_string()) {
      return tl::unexpected(make_error(ErrorCode::InvalidDefinition,
                                       std::format("{}: '{}' must be a list of strings", step, field)));
    }
    out.push_back(entry.get<std::string>());
  }
  return out;
}

}  // namespace

auto parameter_to_string(const Json& value) -> std::string {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  return value.dump();
}

auto format_placeholders(std::string_view text, const ParameterList& parameters) -> std::string {
  std::string out;
  out.reserve(text.size());
  std::size_t pos = 0;
  while (pos < text.size()) {
    auto open = text.find('{', pos);
    if (open == std::string_view::npos) {
      out.append(text.substr(pos));
      break;
    }
    auto close = text.find('}', open + 1);
    if (close == std::string_view::npos) {
      out.append(text.substr(pos));
      break;
    }
    out.append(text.substr(pos, open - pos));
    auto name = text.substr(open + 1, close - open - 1);
    if (const auto* value = find_parameter(parameters, name)) {
      out += parameter_to_string(*value);
    } else {
      out.append(text.substr(open, close - open + 1));
    }
    pos = close + 1;
  }
  return out;
}

auto find_parameter(const ParameterList& parameters, std::string_view name) -> const Json* {
  for (const auto& parameter : parameters) {
    if (parameter.name == name) {
      return &parameter.value;
    }
  }
  return nullptr;
}

auto Parametrization::single(std::string name, std::vector<Json> values) -> Parametrization {
  Parametrization out;
  out.names.push_back(std::move(name));
  out.rows.reserve(values.size());
  for (auto& value : values) {
    out.rows.push_back(std::vector<Json>(1, std::move(value)));
  }
  return out;
}

auto validate_spec(const StepSpec& spec) -> Expected<void> {
  if (spec.name.empty()) {
    return tl::unexpected(make_error(ErrorCode::InvalidDefinition, "step name is required"));
  }
  if (!spec.defaults.is_object()) {
    return tl::unexpected(
      make_error(ErrorCode::InvalidDefinition, std::format("{}: defaults must be an object", spec.name)));
  }

  std::unordered_set<std::string> seen;
  auto check_name = [&](const std::string& parameter) -> Expected<void> {
    if (parameter == "step" || parameter == "user_args") {
      return tl::unexpected(make_error(
        ErrorCode::InvalidDefinition,
        std::format("Cannot instantiate step {}: '{}' cannot be used as a parameter name", spec.name, parameter)));
    }
    if (is_spec_level_set(spec, parameter)) {
      return tl::unexpected(make_error(
        ErrorCode::InvalidDefinition,
        std::format("`{}` for {} was passed both in parameters and as an argument", parameter, spec.name)));
    }
    return {};
  };

  for (const auto& parametrization : spec.parameters) {
    if (parametrization.names.empty()) {
      return tl::unexpected(
        make_error(ErrorCode::InvalidDefinition, std::format("{}: parametrization without names", spec.name)));
    }
    if (parametrization.rows.empty()) {
      return tl::unexpected(make_error(
        ErrorCode::InvalidDefinition,
        std::format("{}: parametrization of '{}' has no values", spec.name, parametrization.names.front())));
    }
    if (!parametrization.ids.empty() && parametrization.ids.size() != parametrization.rows.size()) {
      return tl::unexpected(make_error(
        ErrorCode::InvalidDefinition,
        std::format("Error parametrizing {}: {} values were passed, but {} ids were given", spec.name,
                    parametrization.rows.size(), parametrization.ids.size())));
    }
    for (const auto& row : parametrization.rows) {
      if (row.size() != parametrization.names.size()) {
        return tl::unexpected(make_error(
          ErrorCode::InvalidDefinition,
          std::format("{}: expected {} values per row, got {}", spec.name, parametrization.names.size(), row.size())));
      }
    }
    for (const auto& parameter : parametrization.names) {
      if (!seen.insert(parameter).second) {
        return tl::unexpected(make_error(ErrorCode::InvalidDefinition,
                                         std::format("A conflict was detected while parametrizing '{}'."
                                                     " '{}' was already specified previously",
                                                     spec.name, parameter)));
      }
      if (auto checked = check_name(parameter); !checked) {
        return tl::unexpected(checked.error());
      }
    }
  }

  for (const auto& item : spec.defaults.items()) {
    if (auto checked = check_name(item.key()); !checked) {
      return tl::unexpected(checked.error());
    }
  }
  return {};
}

auto expand(const StepSpec& spec) -> Expected<std::vector<Node>> {
  if (auto valid = validate_spec(spec); !valid) {
    return tl::unexpected(valid.error());
  }

  std::vector<Combination> combinations(1);
  for (const auto& parametrization : spec.parameters) {
    std::vector<Combination> next;
    next.reserve(combinations.size() * parametrization.rows.size());
    for (const auto& combination : combinations) {
      for (std::size_t row = 0; row < parametrization.rows.size(); ++row) {
        Combination extended = combination;
        if (auto id = row_id(parametrization, row); !id.empty()) {
          extended.ids.push_back(std::move(id));
        }
        for (std::size_t i = 0; i < parametrization.names.size(); ++i) {
          extended.values.push_back(BoundParameter{parametrization.names[i], parametrization.rows[row][i]});
        }
        next.push_back(std::move(extended));
      }
    }
    combinations = std::move(next);
  }

  auto body = std::make_shared<const StepBody>(spec.body);
  std::vector<Node> nodes;
  nodes.reserve(combinations.size());
  for (auto& combination : combinations) {
    Node node;
    node.name = spec.name;
    node.kind = NodeKind::Step;
    node.body = body;
    node.setenv = spec.setenv;
    node.passenv = spec.passenv;
    node.cwd = spec.cwd;

    auto id = join(combination.ids, "-");
    node.key = (combinations.size() > 1 && !id.empty()) ? std::format("{}[{}]", spec.name, id) : spec.name;

    node.parameters = std::move(combination.values);
    for (const auto& [name, value] : spec.defaults.items()) {
      if (!find_parameter(node.parameters, name)) {
        node.parameters.push_back(BoundParameter{name, value});
      }
    }

    if (auto value = take_parameter(node.parameters, kReservedRequires)) {
      auto list = to_string_list(*value, node.key, kReservedRequires);
      if (!list) {
        return tl::unexpected(list.error());
      }
      node.requirements = std::move(*list);
    } else if (spec.requirements) {
      node.requirements = *spec.requirements;
    }

    if (auto value = take_parameter(node.parameters, kReservedDependencies)) {
      auto list = to_string_list(*value, node.key, kReservedDependencies);
      if (!list) {
        return tl::unexpected(list.error());
      }
      node.dependencies = std::move(*list);
    } else if (spec.dependencies) {
      node.dependencies = *spec.dependencies;
    }

    if (auto value = take_parameter(node.parameters, kReservedRunByDefault)) {
      if (!value->is_boolean()) {
        return tl::unexpected(make_error(ErrorCode::InvalidDefinition,
                                         std::format("{}: 'run_by_default' must be a boolean", node.key)));
      }
      node.run_by_default = value->get<bool>();
    } else {
      node.run_by_default = spec.run_by_default.value_or(true);
    }

    if (auto value = take_parameter(node.parameters, kReservedDescription)) {
      if (!value->is_string()) {
        return tl::unexpected(make_error(ErrorCode::InvalidDefinition,
                                         std::format("{}: 'description' must be a string", node.key)));
      }
      node.description = format_placeholders(value->get<std::string>(), node.parameters);
    } else if (spec.description) {
      node.description = format_placeholders(*spec.description, node.parameters);
    }

    nodes.push_back(std::move(node));
  }
  return nodes;
}

auto make_group_node(const GroupSpec& group) -> Node {
  Node node;
  node.key = group.name;
  node.name = group.name;
  node.kind = NodeKind::Group;
  node.requirements = group.requirements;
  node.run_by_default = group.run_by_default.value_or(true);
  node.description = group.description.value_or("");
  return node;
}

}  // namespace dwas::engine
