#pragma once

#include <cstdint>
#include <utility>
#include <spdlog/spdlog.h>

namespace dmconcept {

/// @brief Log level of the codec's internal diagnostics
/// @details The codec logs through spdlog's default logger, at debug and
/// trace level only. Failures are always returned as Error values and never
/// only logged.
enum class LogLevel : std::uint8_t {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    critical = 5,
    off = 6,
};

void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;

namespace log {

template <typename... Args>
void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) noexcept;

template <typename... Args>
void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) noexcept;

} // namespace log

} // namespace dmconcept

#define DMCONCEPT_LOG_HEADER
#include "impl/log_impl.hpp"
