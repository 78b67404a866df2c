#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace dmconcept {

/// UTC instant with microsecond precision
using Timestamp = std::chrono::sys_time<std::chrono::microseconds>;

/// @brief Convert UTF-8 to UTF-16. Invalid sequences become U+FFFD.
[[nodiscard]] std::u16string utf8_to_utf16(std::string_view text) noexcept;

/// @brief Convert UTF-16 to UTF-8. Unpaired surrogates become U+FFFD.
[[nodiscard]] std::string utf16_to_utf8(std::u16string_view text) noexcept;

/// @brief Case-insensitive comparison of ASCII letters
[[nodiscard]] bool iequals_ascii(std::string_view a, std::string_view b) noexcept;

/// Largest offset `+HHMM` can hold
inline constexpr int32_t kMaxUtcOffsetMinutes = 99 * 60 + 59;

/// Timestamps are written with a four-digit year
inline constexpr int kMinTimestampYear = 0;
inline constexpr int kMaxTimestampYear = 9999;

/// @brief Parse `YYYY-MM-DDTHH:MM:SS`, optionally followed by `.fff` or `.ffffff`
/// @return std::nullopt for any other shape or an invalid calendar date
[[nodiscard]] std::optional<Timestamp> parse_iso_timestamp(std::string_view text) noexcept;

/// @brief Format as `YYYY-MM-DDTHH:MM:SS`, with `.ffffff` when the microseconds are nonzero
/// @pre The year is between kMinTimestampYear and kMaxTimestampYear
[[nodiscard]] std::string format_iso_timestamp(Timestamp timestamp) noexcept;

/// @brief Parse a UTC offset written `+HHMM` or `-HHMM` (a colon is accepted)
/// @return The offset in minutes
[[nodiscard]] std::optional<int32_t> parse_utc_offset(std::string_view text) noexcept;

/// @brief Format a UTC offset in minutes as `+HHMM` / `-HHMM`
/// @pre `minutes` is within kMaxUtcOffsetMinutes of zero
[[nodiscard]] std::string format_utc_offset(int32_t minutes) noexcept;

/// @brief Short date `MM/DD/YY`
[[nodiscard]] std::string format_short_date(Timestamp timestamp) noexcept;

/// @brief Short time `HH:MM:SS`
[[nodiscard]] std::string format_short_time(Timestamp timestamp) noexcept;

} // namespace dmconcept

#define DMCONCEPT_TEXT_HEADER
#include "impl/text_impl.hpp"
