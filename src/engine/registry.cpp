#include "engine/registry.hpp"

#include <format>

namespace dwas::engine {

auto StepRegistry::register_step(StepSpec spec) -> Expected<void> {
  if (contains(spec.name)) {
    return tl::unexpected(make_error(ErrorCode::DuplicateStep,
                                     std::format("A step with the name '{}' has already been registered", spec.name)));
  }
  if (auto valid = validate_spec(spec); !valid) {
    return tl::unexpected(valid.error());
  }
  step_index_.emplace(spec.name, steps_.size());
  steps_.push_back(std::move(spec));
  return {};
}

auto StepRegistry::register_group(GroupSpec group) -> Expected<void> {
  if (group.name.empty()) {
    return tl::unexpected(make_error(ErrorCode::InvalidDefinition, "group name is required"));
  }
  if (contains(group.name)) {
    return tl::unexpected(make_error(ErrorCode::DuplicateStep,
                                     std::format("A step with the name '{}' has already been registered", group.name)));
  }
  group_index_.emplace(group.name, groups_.size());
  groups_.push_back(std::move(group));
  return {};
}

auto StepRegistry::find_step(std::string_view name) const -> const StepSpec* {
  auto it = step_index_.find(std::string(name));
  if (it == step_index_.end()) {
    return nullptr;
  }
  return &steps_[it->second];
}

auto StepRegistry::find_group(std::string_view name) const -> const GroupSpec* {
  auto it = group_index_.find(std::string(name));
  if (it == group_index_.end()) {
    return nullptr;
  }
  return &groups_[it->second];
}

auto StepRegistry::contains(std::string_view name) const -> bool {
  auto key = std::string(name);
  return step_index_.contains(key) || group_index_.contains(key);
}

}  // namespace dwas::engine
