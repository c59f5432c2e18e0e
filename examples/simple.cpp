#include <filesystem>
#include <format>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "engine/context.hpp"
#include "engine/registry.hpp"
#include "runtime/pipeline.hpp"

int main() {
  dwas::engine::PipelineConfig config;
  config.cache_path = std::filesystem::temp_directory_path() / "dwas-simple";
  config.executor.max_parallelism = 2;
  dwas::engine::Pipeline pipeline(config);

  auto& registry = pipeline.registry();

  dwas::engine::StepSpec package;
  package.name = "package";
  package.body.run = [](dwas::engine::RunContext& ctx) -> dwas::engine::Expected<void> {
    auto result = ctx.run({"echo", "building sdist"});
    if (!result) {
      return tl::unexpected(result.error());
    }
    return {};
  };
  package.body.gather_artifacts = [](dwas::engine::RunContext& ctx) -> dwas::engine::Expected<dwas::engine::Json> {
    auto sdists = dwas::engine::Json::array();
    sdists.push_back((ctx.cache_dir() / "package.tar.gz").string());
    return dwas::engine::Json{{"sdists", std::move(sdists)}};
  };
  package.body.setup_dependent = [](dwas::engine::RunContext& origin,
                                    dwas::engine::RunContext& dependent) -> dwas::engine::Expected<void> {
    auto result = dependent.run({"echo", "installing", origin.key(), "into", dependent.key()});
    if (!result) {
      return tl::unexpected(result.error());
    }
    return {};
  };
  if (auto registered = registry.register_step(std::move(package)); !registered) {
    std::cerr << "Register error: " << registered.error().message << "\n";
    return 1;
  }

  dwas::engine::StepSpec pytest;
  pytest.name = "pytest";
  pytest.requirements = std::vector<std::string>{"package"};
  pytest.description = "Run the tests with python {python}";
  pytest.parameters.push_back(dwas::engine::Parametrization::single("python", {"3.11", "3.12"}));
  pytest.body.run = [](dwas::engine::RunContext& ctx) -> dwas::engine::Expected<void> {
    auto sdists = ctx.artifacts("sdists");
    if (!sdists) {
      return tl::unexpected(sdists.error());
    }
    ctx.log(std::format("would run pytest with python {} against {} sdist(s)",
                        dwas::engine::parameter_to_string(*ctx.parameter("python")), sdists->size()));
    return {};
  };
  if (auto registered = registry.register_step(std::move(pytest)); !registered) {
    std::cerr << "Register error: " << registered.error().message << "\n";
    return 1;
  }

  auto report = pipeline.execute({});
  if (!report) {
    std::cerr << "Run error: " << report.error().message << "\n";
    return 2;
  }
  for (std::size_t i = 0; i < report->order.size(); ++i) {
    std::cout << std::format("{} -> {}\n", report->order[i], dwas::engine::to_string(report->results[i].status));
  }
  return report->exit_code();
}
