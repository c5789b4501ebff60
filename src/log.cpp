// =============================================================================
// log.cpp - Library logger setup
// =============================================================================

#include "bondcurve/log.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace bondcurve {
namespace log {

namespace {

std::mutex logger_mutex;

spdlog::level::level_enum parse_level(std::string_view level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}

} // anonymous namespace

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    if (auto existing = spdlog::get(LOGGER_NAME)) return existing;

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto created = std::make_shared<spdlog::logger>(LOGGER_NAME, console_sink);
    created->set_level(spdlog::level::info);
    created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    spdlog::register_logger(created);
    return created;
}

void set_level(std::string_view level) {
    logger()->set_level(parse_level(level));
}

} // namespace log
} // namespace bondcurve
