#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "engine/error.hpp"
#include "engine/step.hpp"

namespace dwas::engine {

/// Steps and groups share one namespace.
class StepRegistry {
 public:
  auto register_step(StepSpec spec) -> Expected<void>;
  auto register_group(GroupSpec group) -> Expected<void>;

  auto register_step(std::string name, StepFn run, std::vector<std::string> requirements = {}) -> Expected<void> {
    StepSpec spec;
    spec.name = std::move(name);
    spec.body.run = std::move(run);
    spec.requirements = std::move(requirements);
    return register_step(std::move(spec));
  }

  auto find_step(std::string_view name) const -> const StepSpec*;
  auto find_group(std::string_view name) const -> const GroupSpec*;
  auto contains(std::string_view name) const -> bool;

  auto steps() const -> const std::vector<StepSpec>& { return steps_; }
  auto groups() const -> const std::vector<GroupSpec>& { return groups_; }

 private:
  std::vector<StepSpec> steps_;
  std::vector<GroupSpec> groups_;
  std::unordered_map<std::string, std::size_t> step_index_;
  std::unordered_map<std::string, std::size_t> group_index_;
};

}  // namespace dwas::engine
