#include "common/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace memsync {

namespace {

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%f] [%n] [%^%l%$] %v";

} // anonymous namespace

void init_default_logger(spdlog::level::level_enum level) {
    auto logger = spdlog::get("memsync");
    if (!logger) {
        logger = spdlog::stdout_color_mt("memsync");
        logger->set_pattern(kPattern);
    }
    logger->set_level(level);
    spdlog::set_default_logger(logger);
}

std::shared_ptr<spdlog::logger> make_component_logger(
    const std::string& component,
    spdlog::level::level_enum level)
{
    // Return existing logger if already created (idempotent).
    if (auto existing = spdlog::get(component)) {
        return existing;
    }

    auto logger = spdlog::stdout_color_mt(component);
    logger->set_pattern(kPattern);
    logger->set_level(level);
    return logger;
}

spdlog::level::level_enum parse_log_level(const std::string& s) {
    if (s == "trace")    return spdlog::level::trace;
    if (s == "debug")    return spdlog::level::debug;
    if (s == "info")     return spdlog::level::info;
    if (s == "warn")     return spdlog::level::warn;
    if (s == "error")    return spdlog::level::err;
    if (s == "critical") return spdlog::level::critical;
    if (s == "off")      return spdlog::level::off;
    return spdlog::level::info;
}

} // namespace memsync
