// Do not include this file directly. Include "log.hpp" instead.

#pragma once

#include <spdlog/spdlog.h>

#ifndef DMCONCEPT_LOG_HEADER
#include "../log.hpp" // for linters
#endif

namespace dmconcept {
namespace detail {

[[nodiscard]] inline spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::trace:
        return spdlog::level::trace;
    case LogLevel::debug:
        return spdlog::level::debug;
    case LogLevel::info:
        return spdlog::level::info;
    case LogLevel::warn:
        return spdlog::level::warn;
    case LogLevel::error:
        return spdlog::level::err;
    case LogLevel::critical:
        return spdlog::level::critical;
    case LogLevel::off:
        return spdlog::level::off;
    }
    return spdlog::level::off;
}

[[nodiscard]] inline LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept {
    switch (level) {
    case spdlog::level::trace:
        return LogLevel::trace;
    case spdlog::level::debug:
        return LogLevel::debug;
    case spdlog::level::info:
        return LogLevel::info;
    case spdlog::level::warn:
        return LogLevel::warn;
    case spdlog::level::err:
        return LogLevel::error;
    case spdlog::level::critical:
        return LogLevel::critical;
    case spdlog::level::off:
        return LogLevel::off;
    default:
        return LogLevel::off;
    }
}

} // namespace detail

inline void set_log_level(LogLevel level) noexcept {
    spdlog::set_level(detail::to_spdlog_level(level));
}

inline LogLevel log_level() noexcept {
    return detail::from_spdlog_level(spdlog::get_level());
}

namespace log {

// spdlog routes formatting failures to its error handler, so these never throw
template <typename... Args>
void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) noexcept {
    spdlog::debug(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) noexcept {
    spdlog::trace(fmt, std::forward<Args>(args)...);
}

} // namespace log

} // namespace dmconcept
