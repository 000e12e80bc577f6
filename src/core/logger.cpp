#include "core/logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace asdf::core {

void init_logger() {
    auto logger = spdlog::get("asdf");
    if (!logger) {
        logger = spdlog::stderr_color_mt("asdf");
    }
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::info);
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info")  return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "off")   return spdlog::level::off;
    return std::nullopt;
}

} // namespace asdf::core
