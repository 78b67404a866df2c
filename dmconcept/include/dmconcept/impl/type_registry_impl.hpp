// Do not include this file directly. Include "type_registry.hpp" instead.

#pragma once

#include <string>
#include <type_traits>
#include <variant>
#include "../tag_stream.hpp"
#include "../types.hpp"
#include "../types/result.hpp"

#ifndef DMCONCEPT_TYPE_REGISTRY_HEADER
#include "../type_registry.hpp" // for linters
#endif

namespace dmconcept {

constexpr const PrimitiveTypeInfo* find_primitive_type(uint64_t code) noexcept {
    for (const auto& info : kPrimitiveTypes) {
        if (static_cast<uint64_t>(info.type) == code) {
            return &info;
        }
    }
    return nullptr;
}

inline Result<PrimitiveType> primitive_type_from_code(uint64_t code, std::size_t offset) noexcept {
    const auto* info = find_primitive_type(code);
    if (info == nullptr) [[unlikely]] {
        return Err(Error::Code::UnknownTypeCode, "Unknown type code " + std::to_string(code), offset);
    }
    return Ok(info->type);
}

constexpr std::optional<std::size_t> width_of(PrimitiveType type) noexcept {
    const auto* info = find_primitive_type(static_cast<uint64_t>(type));
    if (info == nullptr || info->width == 0) {
        return std::nullopt;
    }
    return info->width;
}

constexpr std::string_view type_name(PrimitiveType type) noexcept {
    const auto* info = find_primitive_type(static_cast<uint64_t>(type));
    return info != nullptr ? info->name : std::string_view{"unknown"};
}

template <> struct primitive_type_of<int16_t> { static constexpr PrimitiveType value = PrimitiveType::Int16; };
template <> struct primitive_type_of<int32_t> { static constexpr PrimitiveType value = PrimitiveType::Int32; };
template <> struct primitive_type_of<uint16_t> { static constexpr PrimitiveType value = PrimitiveType::UInt16; };
template <> struct primitive_type_of<uint32_t> { static constexpr PrimitiveType value = PrimitiveType::UInt32; };
template <> struct primitive_type_of<float> { static constexpr PrimitiveType value = PrimitiveType::Float32; };
template <> struct primitive_type_of<double> { static constexpr PrimitiveType value = PrimitiveType::Float64; };
template <> struct primitive_type_of<bool> { static constexpr PrimitiveType value = PrimitiveType::Bool; };
template <> struct primitive_type_of<int8_t> { static constexpr PrimitiveType value = PrimitiveType::Int8; };
template <> struct primitive_type_of<uint8_t> { static constexpr PrimitiveType value = PrimitiveType::UInt8; };
template <> struct primitive_type_of<int64_t> { static constexpr PrimitiveType value = PrimitiveType::Int64; };
template <> struct primitive_type_of<uint64_t> { static constexpr PrimitiveType value = PrimitiveType::UInt64; };
template <> struct primitive_type_of<std::u16string> { static constexpr PrimitiveType value = PrimitiveType::String; };

inline PrimitiveType type_of(const ScalarValue& value) noexcept {
    return std::visit([](const auto& v) {
        return primitive_type_of_v<std::remove_cvref_t<decltype(v)>>;
    }, value);
}

inline std::optional<std::size_t> struct_width(std::span<const PrimitiveType> fields) noexcept {
    std::size_t total = 0;
    for (PrimitiveType field : fields) {
        auto width = width_of(field);
        if (!width) {
            return std::nullopt;
        }
        total += *width;
    }
    return total;
}

namespace detail {

template <typename T>
[[nodiscard]] inline ScalarValue load_as(std::span<const std::byte> bytes) noexcept {
    if constexpr (std::is_same_v<T, bool>) {
        return ScalarValue{std::in_place_type<bool>, std::to_integer<uint8_t>(bytes[0]) != 0};
    } else {
        return ScalarValue{std::in_place_type<T>, load_value<T>(bytes, kValueEndian)};
    }
}

} // namespace detail

inline ScalarValue load_scalar(PrimitiveType type, std::span<const std::byte> bytes) noexcept {
    switch (type) {
        case PrimitiveType::Int16: return detail::load_as<int16_t>(bytes);
        case PrimitiveType::Int32: return detail::load_as<int32_t>(bytes);
        case PrimitiveType::UInt16: return detail::load_as<uint16_t>(bytes);
        case PrimitiveType::UInt32: return detail::load_as<uint32_t>(bytes);
        case PrimitiveType::Float32: return detail::load_as<float>(bytes);
        case PrimitiveType::Float64: return detail::load_as<double>(bytes);
        case PrimitiveType::Bool: return detail::load_as<bool>(bytes);
        case PrimitiveType::Int8: return detail::load_as<int8_t>(bytes);
        case PrimitiveType::UInt8: return detail::load_as<uint8_t>(bytes);
        case PrimitiveType::Int64: return detail::load_as<int64_t>(bytes);
        case PrimitiveType::UInt64: return detail::load_as<uint64_t>(bytes);
        case PrimitiveType::String: break;
    }
    return ScalarValue{std::u16string{}};
}

inline void store_scalar(const ScalarValue& value, std::span<std::byte> bytes) noexcept {
    std::visit([&bytes](const auto& v) {
        using T = std::remove_cvref_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            bytes[0] = v ? std::byte{1} : std::byte{0};
        } else if constexpr (std::is_arithmetic_v<T>) {
            store_value<T>(bytes, v, kValueEndian);
        }
    }, value);
}

template <DmWidthPolicy Policy, typename Reader>
    requires RawReader<Reader>
Result<ScalarValue> decode_scalar(PrimitiveType type, TagStreamReader<Reader>& reader) noexcept {
    using length_type = typename Policy::length_type;

    if (type == PrimitiveType::String) {
        const std::size_t start = reader.tell();
        auto length = reader.template read<length_type>(kStructureEndian);
        if (length.is_error()) [[unlikely]] {
            return length.error();
        }
        const uint64_t byte_count = length.value();
        if (byte_count % 2 != 0) [[unlikely]] {
            return Err(Error::Code::MalformedTag, "UTF-16 string has an odd byte length", start);
        }
        if (byte_count > reader.remaining()) [[unlikely]] {
            return Err(Error::Code::TruncatedInput, "String extends past end of stream", reader.tell());
        }
        auto bytes = reader.read_bytes(static_cast<std::size_t>(byte_count));
        if (bytes.is_error()) [[unlikely]] {
            return bytes.error();
        }
        std::u16string text(static_cast<std::size_t>(byte_count / 2), u'\0');
        for (std::size_t i = 0; i < text.size(); ++i) {
            text[i] = static_cast<char16_t>(
                load_value<uint16_t>(std::span<const std::byte>(bytes.value()).subspan(i * 2, 2), kValueEndian));
        }
        return Ok(ScalarValue{std::move(text)});
    }

    const std::size_t width = *width_of(type);
    std::array<std::byte, 8> raw{};
    auto res = reader.read_into(std::span<std::byte>(raw.data(), width));
    if (res.is_error()) [[unlikely]] {
        return res.error();
    }
    return Ok(load_scalar(type, std::span<const std::byte>(raw.data(), width)));
}

template <DmWidthPolicy Policy, typename Writer>
    requires RawWriter<Writer>
Result<void> encode_scalar(const ScalarValue& value, TagStreamWriter<Writer>& writer) noexcept {
    using length_type = typename Policy::length_type;

    if (const auto* text = std::get_if<std::u16string>(&value)) {
        auto res = writer.template write<length_type>(static_cast<length_type>(text->size() * 2), kStructureEndian);
        if (res.is_error()) [[unlikely]] {
            return res;
        }
        for (char16_t unit : *text) {
            res = writer.write_u16(static_cast<uint16_t>(unit), kValueEndian);
            if (res.is_error()) [[unlikely]] {
                return res;
            }
        }
        return Ok();
    }

    return std::visit([&writer](const auto& v) -> Result<void> {
        using T = std::remove_cvref_t<decltype(v)>;
        if constexpr (std::is_arithmetic_v<T>) {
            return writer.template write<T>(v, kValueEndian);
        } else {
            return Ok();
        }
    }, value);
}

template <DmWidthPolicy Policy>
std::size_t encoded_scalar_size(const ScalarValue& value) noexcept {
    if (const auto* text = std::get_if<std::u16string>(&value)) {
        return Policy::length_width + text->size() * 2;
    }
    return *width_of(type_of(value));
}

} // namespace dmconcept
