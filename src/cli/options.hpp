#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "engine/error.hpp"

namespace dwas::cli {

struct CommandLine {
  /// argv[0], DWAS_ADDOPTS words and the arguments before `--`, normalized
  /// for gflags.
  std::vector<std::string> flags;
  /// Everything after the first literal `--`.
  std::vector<std::string> user_args;
};

/// Split on whitespace. Single and double quotes group words and are removed.
auto split_shell_words(std::string_view text) -> engine::Expected<std::vector<std::string>>;

/// `--no-setup` -> `--no_setup`. Values after `=` are left alone.
auto normalize_flag(std::string_view arg) -> std::string;

/// Merge the environment options (inserted right after argv[0]) with the
/// command line and split off the pass-through arguments.
auto parse_command_line(const std::vector<std::string>& argv, const char* addopts)
  -> engine::Expected<CommandLine>;

/// Split comma separated lists, dropping empty entries.
auto split_list(std::string_view value) -> std::vector<std::string>;
auto split_list(const std::vector<std::string>& values) -> std::vector<std::string>;

/// Exit status for an error escaping to main. Listing never fails.
auto exit_status(const engine::EngineError& error, bool listing) -> int;

}  // namespace dwas::cli
