#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "engine/environment.hpp"
#include "runtime/process.hpp"

namespace dwas::engine {

struct EnvironmentCacheConfig {
  /// Parent directory of every environment, usually `<cache_path>/environments`.
  std::filesystem::path root = ".dwas/environments";
  /// Run through `/bin/sh -c` when an environment is (re)built. `{packages}`
  /// expands to the space separated dependency list. Empty skips provisioning.
  std::string install_command;
};

/// One directory per identity holding a `fingerprint` file. The fingerprint
/// is written last, so an interrupted build is redone on the next run.
class DirectoryEnvironmentCache final : public EnvironmentCache {
 public:
  DirectoryEnvironmentCache(EnvironmentCacheConfig config, ProcessManager& processes);

  auto ensure(const std::string& identity, const DependencySpec& spec) -> Expected<EnvironmentHandle> override;
  auto open(const std::string& identity) -> Expected<EnvironmentHandle> override;
  auto run(const EnvironmentHandle& handle, Command command) -> Expected<ProcessResult> override;
  auto clean(const std::string& identity) -> Expected<void> override;

  /// Remove every environment.
  auto clean_all() -> Expected<void>;

  auto root() const -> const std::filesystem::path& { return config_.root; }

 private:
  auto lock_for(const std::string& identity) -> std::shared_ptr<std::mutex>;
  auto make_handle(const std::string& identity, std::string fingerprint, bool rebuilt) const -> EnvironmentHandle;
  auto provision(const EnvironmentHandle& handle, const DependencySpec& spec) -> Expected<void>;

  EnvironmentCacheConfig config_;
  ProcessManager* processes_;
  std::mutex locks_mutex_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks_;
};

}  // namespace dwas::engine
