#pragma once

#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <unordered_map>

namespace dwas::log {

using spdlog::trace;
using spdlog::debug;
using spdlog::info;
using spdlog::warn;
using spdlog::error;
using spdlog::critical;

/// Install the process wide async logger configured from the log_* flags.
void init();

void shutdown();

/// Override the level chosen by --log_level (e.g. "debug" for --verbose).
void set_level(std::string_view level);

void info(std::string_view event, std::unordered_map<std::string, std::string> fields);

}  // namespace dwas::log
