#include "engine/context.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <format>
#include <utility>

#include "common/logging/log.hpp"
#include "engine/graph.hpp"

namespace dwas::engine {
namespace {

// Host variables every command sees. Anything else must be listed in passenv.
constexpr std::array<std::string_view, 12> kPassthrough = {
  "PATH",        "HOME",       "LANG",        "LANGUAGE",    "LC_ALL",      "LD_LIBRARY_PATH",
  "TERM",        "TMPDIR",     "http_proxy",  "https_proxy", "no_proxy",    "SSL_CERT_FILE",
};

auto host_variable(std::string_view name) -> const char* {
  return std::getenv(std::string(name).c_str());
}

}  // namespace

RunContext::RunContext(const Node& node, InvocationContext& invocation, EnvironmentHandle environment,
                       const Graph* graph)
    : node_(&node), invocation_(&invocation), environment_(std::move(environment)), graph_(graph) {}

auto RunContext::parameter(std::string_view name) const -> const Json* {
  return find_parameter(node_->parameters, name);
}

auto RunContext::log(std::string_view text) -> void {
  output_.append(text);
  if (!text.empty() && text.back() != '\n') {
    output_.push_back('\n');
  }
}

auto RunContext::command_environment() const -> EnvironmentVariables {
  EnvironmentVariables env;
  for (auto name : kPassthrough) {
    if (const char* value = host_variable(name)) {
      set_variable(env, std::string(name), value);
    }
  }
  for (const auto& name : node_->passenv) {
    if (const char* value = host_variable(name)) {
      set_variable(env, name, value);
    }
  }
  for (const auto& [name, value] : node_->setenv) {
    set_variable(env, name, format_placeholders(value, node_->parameters));
  }
  return env;
}

auto RunContext::run(std::vector<std::string> argv, std::string cwd) -> Expected<ProcessResult> {
  if (argv.empty()) {
    return tl::unexpected(make_error(ErrorCode::Execution, "cannot run an empty command"));
  }
  if (cancelled()) {
    return tl::unexpected(make_error(ErrorCode::Cancelled, "invocation cancelled"));
  }
  if (invocation_->environments == nullptr) {
    return tl::unexpected(make_error(ErrorCode::InvalidConfig, "no environment cache configured"));
  }

  auto rendered = render_command(argv);
  log::debug("{}: running {}", key(), rendered);

  Command command;
  command.argv = std::move(argv);
  command.cwd = cwd.empty() ? node_->cwd : std::move(cwd);
  command.env = command_environment();

  auto result = invocation_->environments->run(environment_, std::move(command));
  if (!result) {
    return tl::unexpected(result.error());
  }
  output_.append(result->output);
  if (result->exit_code != 0) {
    return tl::unexpected(make_error(ErrorCode::Execution,
                                     std::format("Command '{}' returned exit status {}", rendered, result->exit_code)));
  }
  return result;
}

auto RunContext::requirement_steps() const -> std::vector<const Node*> {
  std::vector<const Node*> out;
  if (graph_ == nullptr) {
    return out;
  }
  int self = graph_->index_of(node_->key);
  if (self < 0) {
    return out;
  }
  std::vector<int> seen;
  for (int requirement : graph_->requirements[static_cast<std::size_t>(self)]) {
    for (int member : graph_->members(requirement)) {
      if (std::find(seen.begin(), seen.end(), member) != seen.end()) {
        continue;
      }
      seen.push_back(member);
      out.push_back(&graph_->nodes[static_cast<std::size_t>(member)]);
    }
  }
  return out;
}

auto RunContext::attach(const Node& other) const -> Expected<RunContext> {
  if (invocation_->environments == nullptr) {
    return tl::unexpected(make_error(ErrorCode::InvalidConfig, "no environment cache configured"));
  }
  auto handle = invocation_->environments->open(node_identity(other.key));
  if (!handle) {
    return tl::unexpected(handle.error());
  }
  return RunContext(other, *invocation_, std::move(*handle), graph_);
}

auto RunContext::setup_from_requirements() -> Expected<void> {
  for (const auto* requirement : requirement_steps()) {
    if (!requirement->body || !requirement->body->setup_dependent) {
      continue;
    }
    auto origin = attach(*requirement);
    if (!origin) {
      return tl::unexpected(origin.error());
    }
    log::debug("{}: dependent setup from {}", key(), requirement->key);
    auto injected = requirement->body->setup_dependent(*origin, *this);
    log(origin->take_output());
    if (!injected) {
      return tl::unexpected(make_error(injected.error().code,
                                       std::format("setup from {} failed: {}", requirement->key,
                                                   injected.error().message)));
    }
  }
  return {};
}

auto RunContext::artifacts(std::string_view key) const -> Expected<std::vector<Json>> {
  std::vector<Json> out;
  for (const auto* requirement : requirement_steps()) {
    if (!requirement->body || !requirement->body->gather_artifacts) {
      log::debug("Step {} does not provide any artifacts", requirement->key);
      log::warn("No artifact provided for key '{}' by step '{}'", key, requirement->key);
      continue;
    }
    auto origin = attach(*requirement);
    if (!origin) {
      return tl::unexpected(origin.error());
    }
    auto published = requirement->body->gather_artifacts(*origin);
    if (!published) {
      return tl::unexpected(published.error());
    }
    if (!published->is_object()) {
      return tl::unexpected(make_error(ErrorCode::InvalidDefinition,
                                       std::format("{}: artifacts must be an object", requirement->key)));
    }
    auto it = published->find(std::string(key));
    if (it == published->end() || it->empty()) {
      log::warn("No artifact provided for key '{}' by step '{}'", key, requirement->key);
      continue;
    }
    if (it->is_array()) {
      out.insert(out.end(), it->begin(), it->end());
    } else {
      out.push_back(*it);
    }
  }
  return out;
}

auto render_command(const std::vector<std::string>& argv) -> std::string {
  std::string out;
  for (std::size_t i = 0; i < argv.size(); ++i) {
    if (i != 0) {
      out.push_back(' ');
    }
    out += argv[i];
  }
  return out;
}

}  // namespace dwas::engine
