#include "engine/environment.hpp"

#include <algorithm>
#include <cstdint>
#include <format>
#include <utility>

namespace dwas::engine {
namespace {

struct HashBuilder {
  std::uint64_t value = 1469598103934665603ULL;

  void add_byte(unsigned char byte) {
    value ^= byte;
    value *= 1099511628211ULL;
  }

  void add(std::string_view text) {
    for (unsigned char byte : text) {
      add_byte(byte);
    }
    add_byte(0xff);
  }

  void add_int(std::int64_t number) {
    add(std::to_string(number));
  }

  void add_json(const Json& json) {
    add(json.dump());
  }

  auto finish() const -> std::string {
    return std::format("{:016x}", value);
  }
};

auto is_identity_char(char c) -> bool {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '.' || c == '_' ||
         c == '-';
}

}  // namespace

auto node_identity(std::string_view key) -> std::string {
  std::string sanitized;
  sanitized.reserve(key.size());
  for (char c : key) {
    sanitized.push_back(is_identity_char(c) ? c : '_');
  }
  HashBuilder builder;
  builder.add(key);
  return std::format("{}-{}", sanitized, builder.finish().substr(0, 8));
}

auto fingerprint(const DependencySpec& spec, std::string_view salt) -> std::string {
  // Package order does not change what gets installed.
  auto packages = spec.packages;
  std::sort(packages.begin(), packages.end());

  HashBuilder builder;
  builder.add("environment");
  builder.add_int(static_cast<std::int64_t>(packages.size()));
  for (const auto& package : packages) {
    builder.add(package);
  }
  builder.add_json(spec.parameters);
  builder.add(salt);
  return builder.finish();
}

auto find_variable(const EnvironmentVariables& variables, std::string_view name) -> const std::string* {
  for (auto it = variables.rbegin(); it != variables.rend(); ++it) {
    if (it->first == name) {
      return &it->second;
    }
  }
  return nullptr;
}

auto set_variable(EnvironmentVariables& variables, std::string name, std::string value) -> void {
  for (auto& [existing, current] : variables) {
    if (existing == name) {
      current = std::move(value);
      return;
    }
  }
  variables.emplace_back(std::move(name), std::move(value));
}

}  // namespace dwas::engine
