#include "runtime/pipeline.hpp"

#include <exception>
#include <format>
#include <optional>
#include <utility>

#include "common/logging/log.hpp"
#include "engine/dsl.hpp"
#include "runtime/environment_cache.hpp"
#include "runtime/interrupt.hpp"

namespace dwas::engine {

Pipeline::Pipeline(PipelineConfig config)
    : config_(std::move(config)),
      processes_(config_.termination_grace),
      environments_(config_.environments),
      executor_(config_.executor) {
  if (!environments_) {
    EnvironmentCacheConfig cache;
    cache.root = config_.cache_path / "environments";
    cache.install_command = config_.install_command;
    environments_ = std::make_shared<DirectoryEnvironmentCache>(std::move(cache), processes_);
  }
}

Pipeline::~Pipeline() = default;

auto Pipeline::registry() -> StepRegistry& {
  graph_.reset();
  return registry_;
}

auto Pipeline::registry() const -> const StepRegistry& {
  return registry_;
}

auto Pipeline::load(const std::filesystem::path& path) -> Expected<void> {
  graph_.reset();
  return load_step_file(path, registry_);
}

auto Pipeline::graph() const -> Expected<std::shared_ptr<const Graph>> {
  if (graph_) {
    return graph_;
  }
  auto built = build_graph(registry_);
  if (!built) {
    return tl::unexpected(built.error());
  }
  graph_ = std::make_shared<const Graph>(std::move(*built));
  log::debug("Built graph with {} nodes", graph_->nodes.size());
  return graph_;
}

auto Pipeline::plan(const SelectOptions& options) const -> Expected<ExecutionPlan> {
  auto built = graph();
  if (!built) {
    return tl::unexpected(built.error());
  }
  return select(**built, options);
}

auto Pipeline::clean_node(const Node& node, InvocationContext& ctx, const Graph* graph) -> Expected<void> {
  const auto identity = node_identity(node.key);
  if (node.body && node.body->clean) {
    auto handle = environments_->open(identity);
    if (!handle) {
      return tl::unexpected(handle.error());
    }
    RunContext run_ctx(node, ctx, std::move(*handle), graph);
    Expected<void> hook;
    try {
      hook = node.body->clean(run_ctx);
    } catch (const std::exception& ex) {
      hook = tl::unexpected(make_error(ErrorCode::Execution, ex.what()));
    }
    if (!run_ctx.output().empty()) {
      log::info("{}: clean\n{}", node.key, run_ctx.output());
    }
    if (!hook) {
      return tl::unexpected(make_error(hook.error().code,
                                       std::format("cleaning {} failed: {}", node.key, hook.error().message)));
    }
  }
  log::debug("{}: removing environment {}", node.key, identity);
  return environments_->clean(identity);
}

auto Pipeline::execute(const RunOptions& options) -> Expected<ExecutionReport> {
  auto selected = plan(options.selection);
  if (!selected) {
    return tl::unexpected(selected.error());
  }

  InvocationContext ctx;
  ctx.environments = environments_.get();
  ctx.user_args = options.user_args;
  ctx.on_cancel = [this]() { processes_.terminate_all(); };
  ctx.on_abort = [this]() { processes_.kill_all(); };

  if (options.clean) {
    for (const auto& node : selected->nodes) {
      if (node.node->kind != NodeKind::Step) {
        continue;
      }
      if (auto cleaned = clean_node(*node.node, ctx, selected->graph); !cleaned) {
        return tl::unexpected(cleaned.error());
      }
    }
  }

  std::optional<InterruptGuard> guard;
  if (config_.handle_interrupts) {
    InterruptGuard::reset();
    guard.emplace();
    ctx.interrupts = []() { return InterruptGuard::count(); };
  }

  auto report = executor_.run(*selected, ctx);
  guard.reset();

  log_summary(*selected, report);
  return report;
}

auto Pipeline::list(const SelectOptions& options, const ListOptions& list_options) const
  -> Expected<std::vector<std::string>> {
  auto built = graph();
  if (!built) {
    return tl::unexpected(built.error());
  }
  auto selected = select(**built, options);
  if (!selected) {
    log::warn("{}", selected.error().message);
    return render_listing(**built, nullptr, list_options);
  }
  return render_listing(**built, &*selected, list_options);
}

}  // namespace dwas::engine
