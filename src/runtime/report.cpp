#include "runtime/report.hpp"

#include <algorithm>
#include <format>

#include "common/logging/log.hpp"

namespace dwas::engine {

auto format_duration(std::chrono::milliseconds duration) -> std::string {
  auto total = std::chrono::duration_cast<std::chrono::seconds>(duration).count();
  if (total < 0) {
    total = 0;
  }
  return std::format("{}:{:02}:{:02}", total / 3600, (total / 60) % 60, total % 60);
}

auto slowest_chain(const ExecutionPlan& plan, const ExecutionReport& report) -> Chain {
  const auto count = plan.nodes.size();
  std::vector<std::chrono::milliseconds> total(count, std::chrono::milliseconds{0});
  std::vector<int> previous(count, -1);

  // Plan order is topological, requirements are always computed first.
  int slowest = -1;
  for (std::size_t i = 0; i < count && i < report.results.size(); ++i) {
    std::chrono::milliseconds longest{0};
    for (int requirement : plan.nodes[i].requirements) {
      if (previous[i] < 0 || total[static_cast<std::size_t>(requirement)] > longest) {
        longest = total[static_cast<std::size_t>(requirement)];
        previous[i] = requirement;
      }
    }
    total[i] = longest + report.results[i].duration;
    if (slowest < 0 || total[i] > total[static_cast<std::size_t>(slowest)]) {
      slowest = static_cast<int>(i);
    }
  }

  Chain chain;
  if (slowest < 0) {
    return chain;
  }
  chain.duration = total[static_cast<std::size_t>(slowest)];
  for (int node = slowest; node >= 0; node = previous[static_cast<std::size_t>(node)]) {
    chain.keys.push_back(plan.nodes[static_cast<std::size_t>(node)].node->key);
  }
  std::reverse(chain.keys.begin(), chain.keys.end());
  return chain;
}

auto describe_outcome(const ExecutionReport& report) -> std::string {
  return std::format("{} jobs failed, {} could not run, {} were cancelled", report.count(NodeStatus::Failure),
                     report.count(NodeStatus::Skipped), report.count(NodeStatus::Cancelled));
}

auto log_summary(const ExecutionPlan& plan, const ExecutionReport& report) -> void {
  log::info("*** Steps summary ***");
  for (std::size_t i = 0; i < report.order.size(); ++i) {
    const auto& key = report.order[i];
    const auto& result = report.results[i];
    switch (result.status) {
      case NodeStatus::Success:
        log::info("\t[{}] {}: success", format_duration(result.duration), key);
        break;
      case NodeStatus::Failure:
        log::error("\t[{}] {}: error: {}", format_duration(result.duration), key, result.cause);
        break;
      case NodeStatus::Skipped:
        log::warn("\t[-:--:--] {}: blocked by {}", key, result.blocked_by);
        break;
      case NodeStatus::Cancelled:
        log::warn("\t[-:--:--] {}: Cancelled", key);
        break;
    }
  }

  if (plan.nodes.size() > 1) {
    auto chain = slowest_chain(plan, report);
    std::string rendered;
    for (std::size_t i = 0; i < chain.keys.size(); ++i) {
      if (i != 0) {
        rendered += " -> ";
      }
      rendered += chain.keys[i];
    }
    log::info("\tSlowest dependency chain takes {}: {}", format_duration(chain.duration), rendered);
  }

  log::info("All steps ran in {}", format_duration(report.elapsed));
  if (!report.succeeded()) {
    log::error("{}", describe_outcome(report));
  }
}

auto render_listing(const Graph& graph, const ExecutionPlan* selected, const ListOptions& options)
  -> std::vector<std::string> {
  struct Entry {
    std::string key;
    std::string dependencies;
    std::string description;
    bool selected = false;
  };

  std::vector<Entry> entries;
  entries.reserve(graph.nodes.size());
  std::size_t key_width = 0;
  std::size_t dependency_width = 0;
  for (std::size_t i = 0; i < graph.nodes.size(); ++i) {
    const auto& node = graph.nodes[i];
    Entry entry;
    entry.key = node.key;
    entry.selected = selected != nullptr && selected->find(node.key) != nullptr;
    if (options.show_dependencies && !graph.requirements[i].empty()) {
      entry.dependencies = " -->";
      for (std::size_t r = 0; r < graph.requirements[i].size(); ++r) {
        entry.dependencies += r == 0 ? " " : ", ";
        entry.dependencies += graph.nodes[static_cast<std::size_t>(graph.requirements[i][r])].key;
      }
    }
    if (options.verbose) {
      entry.description = node.description;
    }
    key_width = std::max(key_width, entry.key.size());
    dependency_width = std::max(dependency_width, entry.dependencies.size());
    entries.push_back(std::move(entry));
  }
  std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) { return a.key < b.key; });

  std::vector<std::string> lines;
  lines.reserve(entries.size() + 1);
  lines.emplace_back("Available steps (* means selected, - means skipped):");
  for (const auto& entry : entries) {
    auto line = std::format("\t{} {:<{}}{:<{}}", entry.selected ? '*' : '-', entry.key, key_width,
                            entry.dependencies, dependency_width);
    if (!entry.description.empty()) {
      line += std::format("\t[{}]", entry.description);
    }
    while (!line.empty() && line.back() == ' ') {
      line.pop_back();
    }
    lines.push_back(std::move(line));
  }
  return lines;
}

}  // namespace dwas::engine
