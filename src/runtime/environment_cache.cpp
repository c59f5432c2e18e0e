#include "runtime/environment_cache.hpp"

#include <format>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include "common/logging/log.hpp"

namespace dwas::engine {
namespace {

constexpr const char* kFingerprintFile = "fingerprint";

auto read_fingerprint(const std::filesystem::path& directory) -> std::string {
  std::ifstream in(directory / kFingerprintFile);
  if (!in) {
    return {};
  }
  std::string value;
  std::getline(in, value);
  return value;
}

auto io_error(std::string_view what, const std::filesystem::path& path, const std::error_code& ec) -> EngineError {
  return make_error(ErrorCode::Io, std::format("{} {}: {}", what, path.string(), ec.message()));
}

auto replace_all(std::string text, std::string_view from, std::string_view to) -> std::string {
  std::size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
  return text;
}

}  // namespace

DirectoryEnvironmentCache::DirectoryEnvironmentCache(EnvironmentCacheConfig config, ProcessManager& processes)
    : config_(std::move(config)), processes_(&processes) {}

auto DirectoryEnvironmentCache::lock_for(const std::string& identity) -> std::shared_ptr<std::mutex> {
  std::lock_guard<std::mutex> lock(locks_mutex_);
  auto& entry = locks_[identity];
  if (!entry) {
    entry = std::make_shared<std::mutex>();
  }
  return entry;
}

auto DirectoryEnvironmentCache::make_handle(const std::string& identity, std::string fingerprint, bool rebuilt) const
  -> EnvironmentHandle {
  EnvironmentHandle handle;
  handle.identity = identity;
  handle.root = config_.root / identity;
  handle.fingerprint = std::move(fingerprint);
  handle.rebuilt = rebuilt;
  handle.variables.emplace_back("DWAS_ENV_DIR", handle.root.string());
  return handle;
}

auto DirectoryEnvironmentCache::ensure(const std::string& identity, const DependencySpec& spec)
  -> Expected<EnvironmentHandle> {
  auto identity_lock = lock_for(identity);
  std::lock_guard<std::mutex> guard(*identity_lock);

  const auto expected = fingerprint(spec, config_.install_command);
  const auto directory = config_.root / identity;
  if (read_fingerprint(directory) == expected) {
    log::debug("{}: reusing environment {}", identity, directory.string());
    return make_handle(identity, expected, false);
  }

  log::info("environment.rebuild", {{"identity", identity}, {"path", directory.string()}});
  std::error_code ec;
  std::filesystem::remove_all(directory, ec);
  if (ec) {
    return tl::unexpected(io_error("cannot remove", directory, ec));
  }
  std::filesystem::create_directories(directory / "bin", ec);
  if (ec) {
    return tl::unexpected(io_error("cannot create", directory, ec));
  }

  auto handle = make_handle(identity, expected, true);
  if (auto provisioned = provision(handle, spec); !provisioned) {
    return tl::unexpected(provisioned.error());
  }

  std::ofstream out(directory / kFingerprintFile, std::ios::trunc);
  out << expected << '\n';
  if (!out) {
    return tl::unexpected(make_error(ErrorCode::Io, std::format("cannot write fingerprint of {}", identity)));
  }
  return handle;
}

auto DirectoryEnvironmentCache::provision(const EnvironmentHandle& handle, const DependencySpec& spec)
  -> Expected<void> {
  if (config_.install_command.empty() || spec.packages.empty()) {
    return {};
  }

  std::string packages;
  for (const auto& package : spec.packages) {
    if (!packages.empty()) {
      packages.push_back(' ');
    }
    packages += package;
  }

  Command command;
  command.argv = {"/bin/sh", "-c", replace_all(config_.install_command, "{packages}", packages)};
  auto result = run(handle, std::move(command));
  if (!result) {
    return tl::unexpected(result.error());
  }
  if (result->exit_code != 0) {
    return tl::unexpected(make_error(
      ErrorCode::Execution,
      std::format("Installing dependencies failed with exit status {}:\n{}", result->exit_code, result->output)));
  }
  return {};
}

auto DirectoryEnvironmentCache::open(const std::string& identity) -> Expected<EnvironmentHandle> {
  const auto directory = config_.root / identity;
  auto stored = read_fingerprint(directory);
  if (stored.empty()) {
    log::warn("{}: environment was never set up, running without it", identity);
  }
  return make_handle(identity, std::move(stored), false);
}

auto DirectoryEnvironmentCache::run(const EnvironmentHandle& handle, Command command) -> Expected<ProcessResult> {
  for (const auto& [name, value] : handle.variables) {
    set_variable(command.env, name, value);
  }
  auto bin = (handle.root / "bin").string();
  if (const auto* path = find_variable(command.env, "PATH"); path != nullptr && !path->empty()) {
    bin += ":" + *path;
  }
  set_variable(command.env, "PATH", std::move(bin));
  return processes_->run(command);
}

auto DirectoryEnvironmentCache::clean(const std::string& identity) -> Expected<void> {
  auto identity_lock = lock_for(identity);
  std::lock_guard<std::mutex> guard(*identity_lock);

  const auto directory = config_.root / identity;
  std::error_code ec;
  std::filesystem::remove_all(directory, ec);
  if (ec) {
    return tl::unexpected(io_error("cannot remove", directory, ec));
  }
  return {};
}

auto DirectoryEnvironmentCache::clean_all() -> Expected<void> {
  std::error_code ec;
  std::filesystem::remove_all(config_.root, ec);
  if (ec) {
    return tl::unexpected(io_error("cannot remove", config_.root, ec));
  }
  log::info("environment.clean", {{"path", config_.root.string()}});
  return {};
}

}  // namespace dwas::engine
