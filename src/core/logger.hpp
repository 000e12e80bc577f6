#pragma once
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

namespace asdf::core {

// Initialize logging with console output (stderr, so stdout stays parseable)
void init_logger();

// Set log level
void set_log_level(spdlog::level::level_enum level);

// Parse a level name ("trace", "debug", "info", "warn", "error", "off").
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name);

} // namespace asdf::core
