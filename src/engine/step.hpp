#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "engine/error.hpp"
#include "engine/types.hpp"

namespace dwas::engine {

/// Names bound together, one row of values per variant. Multiple
/// parametrizations on a step multiply.
struct Parametrization {
  std::vector<std::string> names;
  std::vector<std::vector<Json>> rows;
  /// Empty entries fall back to the row's values joined by '-'.
  std::vector<std::optional<std::string>> ids;

  static auto single(std::string name, std::vector<Json> values) -> Parametrization;
};

struct StepSpec {
  std::string name;
  std::vector<Parametrization> parameters;
  Json defaults = Json::object();
  std::optional<std::vector<std::string>> requirements;
  std::optional<std::vector<std::string>> dependencies;
  std::optional<bool> run_by_default;
  std::optional<std::string> description;
  StepBody body;
  EnvironmentVariables setenv;
  std::vector<std::string> passenv;
  std::string cwd;
};

struct GroupSpec {
  std::string name;
  std::vector<std::string> requirements;
  std::optional<std::string> description;
  std::optional<bool> run_by_default;
};

enum class NodeKind {
  Step,
  Group,
};

struct Node {
  std::string key;
  std::string name;
  NodeKind kind = NodeKind::Step;
  ParameterList parameters;
  std::vector<std::string> requirements;
  std::vector<std::string> dependencies;
  bool run_by_default = true;
  std::string description;
  std::shared_ptr<const StepBody> body;
  EnvironmentVariables setenv;
  std::vector<std::string> passenv;
  std::string cwd;
};

auto validate_spec(const StepSpec& spec) -> Expected<void>;

/// Expand a spec into its ordered variants. The first parametrization is the
/// outermost loop of the product, rows keep their declared order.
auto expand(const StepSpec& spec) -> Expected<std::vector<Node>>;

auto make_group_node(const GroupSpec& group) -> Node;

}  // namespace dwas::engine
