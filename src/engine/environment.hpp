#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "engine/error.hpp"
#include "engine/types.hpp"

namespace dwas::engine {

struct DependencySpec {
  std::vector<std::string> packages;
  Json parameters = Json::object();
};

struct EnvironmentHandle {
  std::string identity;
  std::filesystem::path root;
  std::string fingerprint;
  /// False when an existing environment with a matching fingerprint was reused.
  bool rebuilt = false;
  EnvironmentVariables variables;
};

struct Command {
  std::vector<std::string> argv;
  std::string cwd;
  /// Complete environment of the child. Nothing is inherited implicitly.
  EnvironmentVariables env;
};

struct ProcessResult {
  int exit_code = 0;
  std::string output;
};

/// Implementations must serialize `ensure` calls sharing an identity and
/// allow calls for different identities to proceed in parallel.
class EnvironmentCache {
 public:
  virtual ~EnvironmentCache() = default;

  virtual auto ensure(const std::string& identity, const DependencySpec& spec) -> Expected<EnvironmentHandle> = 0;
  /// Attach to an environment without setting it up.
  virtual auto open(const std::string& identity) -> Expected<EnvironmentHandle> = 0;
  virtual auto run(const EnvironmentHandle& handle, Command command) -> Expected<ProcessResult> = 0;
  virtual auto clean(const std::string& identity) -> Expected<void> = 0;
};

/// Distinct keys never share an identity.
auto node_identity(std::string_view key) -> std::string;

/// Stable digest of a dependency spec; `salt` folds in cache-wide settings.
auto fingerprint(const DependencySpec& spec, std::string_view salt = {}) -> std::string;

/// Later entries win.
auto find_variable(const EnvironmentVariables& variables, std::string_view name) -> const std::string*;

auto set_variable(EnvironmentVariables& variables, std::string name, std::string value) -> void;

}  // namespace dwas::engine
