// Do not include this file directly. Include "text.hpp" instead.

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#ifndef DMCONCEPT_TEXT_HEADER
#include "../text.hpp" // for linters
#endif

namespace dmconcept {
namespace detail {

inline constexpr char32_t kReplacementCharacter = 0xFFFD;

inline void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

inline void append_utf16(std::u16string& out, char32_t cp) {
    if (cp < 0x10000) {
        out.push_back(static_cast<char16_t>(cp));
    } else {
        cp -= 0x10000;
        out.push_back(static_cast<char16_t>(0xD800 | (cp >> 10)));
        out.push_back(static_cast<char16_t>(0xDC00 | (cp & 0x3FF)));
    }
}

/// Parse exactly `count` decimal digits
[[nodiscard]] inline std::optional<int> parse_digits(std::string_view text, std::size_t pos, std::size_t count) noexcept {
    if (pos + count > text.size()) {
        return std::nullopt;
    }
    int value = 0;
    for (std::size_t i = pos; i < pos + count; ++i) {
        if (text[i] < '0' || text[i] > '9') {
            return std::nullopt;
        }
        value = value * 10 + (text[i] - '0');
    }
    return value;
}

inline void append_padded(std::string& out, long long value, int width) {
    std::string digits = std::to_string(value);
    if (static_cast<int>(digits.size()) < width) {
        out.append(static_cast<std::size_t>(width) - digits.size(), '0');
    }
    out += digits;
}

struct CivilTime {
    std::chrono::year_month_day date;
    std::chrono::hh_mm_ss<std::chrono::microseconds> time;
};

[[nodiscard]] inline CivilTime split_timestamp(Timestamp timestamp) noexcept {
    auto day = std::chrono::floor<std::chrono::days>(timestamp);
    return CivilTime{std::chrono::year_month_day{day},
                     std::chrono::hh_mm_ss<std::chrono::microseconds>{timestamp - day}};
}

} // namespace detail

inline std::u16string utf8_to_utf16(std::string_view text) noexcept {
    std::u16string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        std::size_t extra = 0;
        char32_t cp = 0;
        if (lead < 0x80) {
            cp = lead;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            cp = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            cp = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            cp = lead & 0x07;
        } else {
            detail::append_utf16(out, detail::kReplacementCharacter);
            ++i;
            continue;
        }

        bool valid = i + extra < text.size();
        for (std::size_t k = 1; valid && k <= extra; ++k) {
            const auto cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                valid = false;
            } else {
                cp = (cp << 6) | (cont & 0x3F);
            }
        }
        // Reject overlong forms, surrogates and out-of-range values
        if (valid) {
            static constexpr char32_t minimum[] = {0, 0x80, 0x800, 0x10000};
            valid = cp >= minimum[extra] && cp <= 0x10FFFF && (cp < 0xD800 || cp > 0xDFFF);
        }

        if (!valid) {
            detail::append_utf16(out, detail::kReplacementCharacter);
            ++i;
            continue;
        }
        detail::append_utf16(out, cp);
        i += extra + 1;
    }
    return out;
}

inline std::string utf16_to_utf8(std::u16string_view text) noexcept {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        char32_t unit = text[i];
        if (unit >= 0xD800 && unit <= 0xDBFF) {
            if (i + 1 < text.size() && text[i + 1] >= 0xDC00 && text[i + 1] <= 0xDFFF) {
                const char32_t low = text[i + 1];
                detail::append_utf8(out, 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
                ++i;
                continue;
            }
            detail::append_utf8(out, detail::kReplacementCharacter);
        } else if (unit >= 0xDC00 && unit <= 0xDFFF) {
            detail::append_utf8(out, detail::kReplacementCharacter);
        } else {
            detail::append_utf8(out, unit);
        }
    }
    return out;
}

inline bool iequals_ascii(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        char ca = a[i];
        char cb = b[i];
        if (ca >= 'A' && ca <= 'Z') ca = static_cast<char>(ca - 'A' + 'a');
        if (cb >= 'A' && cb <= 'Z') cb = static_cast<char>(cb - 'A' + 'a');
        if (ca != cb) {
            return false;
        }
    }
    return true;
}

inline std::optional<Timestamp> parse_iso_timestamp(std::string_view text) noexcept {
    using namespace std::chrono;

    if (text.size() != 19 && text.size() != 23 && text.size() != 26) {
        return std::nullopt;
    }
    if (text[4] != '-' || text[7] != '-' || text[10] != 'T' || text[13] != ':' || text[16] != ':') {
        return std::nullopt;
    }

    auto y = detail::parse_digits(text, 0, 4);
    auto mo = detail::parse_digits(text, 5, 2);
    auto d = detail::parse_digits(text, 8, 2);
    auto h = detail::parse_digits(text, 11, 2);
    auto mi = detail::parse_digits(text, 14, 2);
    auto s = detail::parse_digits(text, 17, 2);
    if (!y || !mo || !d || !h || !mi || !s || *h > 23 || *mi > 59 || *s > 59) {
        return std::nullopt;
    }

    int micros = 0;
    if (text.size() > 19) {
        if (text[19] != '.') {
            return std::nullopt;
        }
        const std::size_t digits = text.size() - 20;
        auto fraction = detail::parse_digits(text, 20, digits);
        if (!fraction) {
            return std::nullopt;
        }
        micros = digits == 3 ? *fraction * 1000 : *fraction;
    }

    year_month_day date{year{*y}, month{static_cast<unsigned>(*mo)}, day{static_cast<unsigned>(*d)}};
    if (!date.ok()) {
        return std::nullopt;
    }
    return Timestamp{sys_days{date}} + hours{*h} + minutes{*mi} + seconds{*s} + microseconds{micros};
}

inline std::string format_iso_timestamp(Timestamp timestamp) noexcept {
    const auto civil = detail::split_timestamp(timestamp);
    std::string out;
    out.reserve(26);
    detail::append_padded(out, static_cast<int>(civil.date.year()), 4);
    out.push_back('-');
    detail::append_padded(out, static_cast<unsigned>(civil.date.month()), 2);
    out.push_back('-');
    detail::append_padded(out, static_cast<unsigned>(civil.date.day()), 2);
    out.push_back('T');
    detail::append_padded(out, civil.time.hours().count(), 2);
    out.push_back(':');
    detail::append_padded(out, civil.time.minutes().count(), 2);
    out.push_back(':');
    detail::append_padded(out, civil.time.seconds().count(), 2);
    const auto micros = civil.time.subseconds().count();
    if (micros != 0) {
        out.push_back('.');
        detail::append_padded(out, micros, 6);
    }
    return out;
}

inline std::optional<int32_t> parse_utc_offset(std::string_view text) noexcept {
    if (text.size() != 5 && text.size() != 6) {
        return std::nullopt;
    }
    if (text[0] != '+' && text[0] != '-') {
        return std::nullopt;
    }
    const std::size_t minute_pos = text.size() == 6 ? 4 : 3;
    if (text.size() == 6 && text[3] != ':') {
        return std::nullopt;
    }
    auto h = detail::parse_digits(text, 1, 2);
    auto m = detail::parse_digits(text, minute_pos, 2);
    if (!h || !m || *m > 59) {
        return std::nullopt;
    }
    const int32_t minutes = *h * 60 + *m;
    return text[0] == '-' ? -minutes : minutes;
}

inline std::string format_utc_offset(int32_t minutes) noexcept {
    std::string out;
    out.push_back(minutes < 0 ? '-' : '+');
    const long long magnitude = minutes < 0 ? -static_cast<long long>(minutes) : minutes;
    detail::append_padded(out, magnitude / 60, 2);
    detail::append_padded(out, magnitude % 60, 2);
    return out;
}

inline std::string format_short_date(Timestamp timestamp) noexcept {
    const auto civil = detail::split_timestamp(timestamp);
    std::string out;
    detail::append_padded(out, static_cast<unsigned>(civil.date.month()), 2);
    out.push_back('/');
    detail::append_padded(out, static_cast<unsigned>(civil.date.day()), 2);
    out.push_back('/');
    const int year = static_cast<int>(civil.date.year());
    detail::append_padded(out, ((year % 100) + 100) % 100, 2);
    return out;
}

inline std::string format_short_time(Timestamp timestamp) noexcept {
    const auto civil = detail::split_timestamp(timestamp);
    std::string out;
    detail::append_padded(out, civil.time.hours().count(), 2);
    out.push_back(':');
    detail::append_padded(out, civil.time.minutes().count(), 2);
    out.push_back(':');
    detail::append_padded(out, civil.time.seconds().count(), 2);
    return out;
}

} // namespace dmconcept
