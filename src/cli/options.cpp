#include "cli/options.hpp"

#include <cctype>
#include <utility>

namespace dwas::cli {

auto split_shell_words(std::string_view text) -> engine::Expected<std::vector<std::string>> {
  std::vector<std::string> words;
  std::string current;
  bool in_word = false;
  char quote = 0;

  for (char c : text) {
    if (quote != 0) {
      if (c == quote) {
        quote = 0;
      } else {
        current.push_back(c);
      }
      continue;
    }
    if (c == '\'' || c == '"') {
      quote = c;
      in_word = true;
      continue;
    }
    if (std::isspace(static_cast<unsigned char>(c))) {
      if (in_word) {
        words.push_back(std::move(current));
        current.clear();
        in_word = false;
      }
      continue;
    }
    current.push_back(c);
    in_word = true;
  }

  if (quote != 0) {
    return tl::unexpected(engine::make_error(engine::ErrorCode::InvalidConfig, "DWAS_ADDOPTS: unterminated quote"));
  }
  if (in_word) {
    words.push_back(std::move(current));
  }
  return words;
}

auto normalize_flag(std::string_view arg) -> std::string {
  std::string out(arg);
  if (arg.size() <= 2 || arg.substr(0, 2) != "--") {
    return out;
  }
  auto end = out.find('=');
  if (end == std::string::npos) {
    end = out.size();
  }
  for (std::size_t i = 2; i < end; ++i) {
    if (out[i] == '-') {
      out[i] = '_';
    }
  }
  return out;
}

auto parse_command_line(const std::vector<std::string>& argv, const char* addopts) -> engine::Expected<CommandLine> {
  std::vector<std::string> merged;
  if (!argv.empty()) {
    merged.push_back(argv.front());
  }
  if (addopts != nullptr) {
    auto words = split_shell_words(addopts);
    if (!words) {
      return tl::unexpected(words.error());
    }
    merged.insert(merged.end(), words->begin(), words->end());
  }
  if (argv.size() > 1) {
    merged.insert(merged.end(), argv.begin() + 1, argv.end());
  }

  CommandLine out;
  bool passthrough = false;
  for (std::size_t i = 0; i < merged.size(); ++i) {
    if (passthrough) {
      out.user_args.push_back(std::move(merged[i]));
    } else if (i > 0 && merged[i] == "--") {
      passthrough = true;
    } else {
      out.flags.push_back(i == 0 ? std::move(merged[i]) : normalize_flag(merged[i]));
    }
  }
  return out;
}

auto split_list(std::string_view value) -> std::vector<std::string> {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start <= value.size()) {
    auto comma = value.find(',', start);
    if (comma == std::string_view::npos) {
      comma = value.size();
    }
    auto entry = value.substr(start, comma - start);
    while (!entry.empty() && std::isspace(static_cast<unsigned char>(entry.front()))) {
      entry.remove_prefix(1);
    }
    while (!entry.empty() && std::isspace(static_cast<unsigned char>(entry.back()))) {
      entry.remove_suffix(1);
    }
    if (!entry.empty()) {
      out.emplace_back(entry);
    }
    start = comma + 1;
  }
  return out;
}

auto split_list(const std::vector<std::string>& values) -> std::vector<std::string> {
  std::vector<std::string> out;
  for (const auto& value : values) {
    auto entries = split_list(value);
    out.insert(out.end(), entries.begin(), entries.end());
  }
  return out;
}

auto exit_status(const engine::EngineError& error, bool listing) -> int {
  return listing ? 0 : engine::exit_code_for(error);
}

}  // namespace dwas::cli
