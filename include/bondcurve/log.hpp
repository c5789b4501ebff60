#ifndef BONDCURVE_LOG_HPP
#define BONDCURVE_LOG_HPP

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace bondcurve {
namespace log {

constexpr const char* LOGGER_NAME = "bondcurve";

// Library logger, created on first use with a stdout colour sink
std::shared_ptr<spdlog::logger> logger();

// "trace", "debug", "info", "warn", "error" or "off"; anything else is info
void set_level(std::string_view level);

} // namespace log
} // namespace bondcurve

#endif // BONDCURVE_LOG_HPP
