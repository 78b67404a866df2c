// Do not include this file directly. Include "types.hpp" instead.

#pragma once

#include <bit>
#include <cstring>
#include <type_traits>

#ifndef DMCONCEPT_TYPES_HEADER
#include "../types.hpp" // for linters
#endif

namespace dmconcept {

constexpr std::optional<DmVersion> version_from_marker(int32_t marker) noexcept {
    switch (marker) {
        case static_cast<int32_t>(DmVersion::DM3):
            return DmVersion::DM3;
        case static_cast<int32_t>(DmVersion::DM4):
            return DmVersion::DM4;
        default:
            return std::nullopt;
    }
}

constexpr std::optional<DataType> data_type_from_code(int64_t code) noexcept {
    switch (code) {
        case 1: return DataType::Int16;
        case 2: return DataType::Float32;
        case 3: return DataType::Complex64;
        case 6: return DataType::UInt8;
        case 7: return DataType::Int32;
        case 9: return DataType::Int8;
        case 10: return DataType::UInt16;
        case 11: return DataType::UInt32;
        case 12: return DataType::Float64;
        case 13: return DataType::Complex128;
        case 14: return DataType::Bool;
        case 23: return DataType::RGBA8;
        default: return std::nullopt;
    }
}

constexpr std::size_t data_type_size(DataType type) noexcept {
    switch (type) {
        case DataType::Int8:
        case DataType::UInt8:
        case DataType::Bool:
            return 1;
        case DataType::Int16:
        case DataType::UInt16:
            return 2;
        case DataType::Int32:
        case DataType::UInt32:
        case DataType::Float32:
        case DataType::RGBA8:
            return 4;
        case DataType::Float64:
        case DataType::Complex64:
            return 8;
        case DataType::Complex128:
            return 16;
    }
    return 0;
}

constexpr bool data_type_is_complex(DataType type) noexcept {
    return type == DataType::Complex64 || type == DataType::Complex128;
}

constexpr PrimitiveType data_type_storage(DataType type) noexcept {
    switch (type) {
        case DataType::Int16: return PrimitiveType::Int16;
        case DataType::Float32: return PrimitiveType::Float32;
        case DataType::Complex64: return PrimitiveType::Float32;
        case DataType::UInt8: return PrimitiveType::UInt8;
        case DataType::Int32: return PrimitiveType::Int32;
        case DataType::Int8: return PrimitiveType::Int8;
        case DataType::UInt16: return PrimitiveType::UInt16;
        case DataType::UInt32: return PrimitiveType::UInt32;
        case DataType::Float64: return PrimitiveType::Float64;
        case DataType::Complex128: return PrimitiveType::Float64;
        case DataType::Bool: return PrimitiveType::Bool;
        case DataType::RGBA8: return PrimitiveType::UInt32;
    }
    return PrimitiveType::UInt8;
}

constexpr std::string_view data_type_name(DataType type) noexcept {
    switch (type) {
        case DataType::Int16: return "int16";
        case DataType::Float32: return "float32";
        case DataType::Complex64: return "complex64";
        case DataType::UInt8: return "uint8";
        case DataType::Int32: return "int32";
        case DataType::Int8: return "int8";
        case DataType::UInt16: return "uint16";
        case DataType::UInt32: return "uint32";
        case DataType::Float64: return "float64";
        case DataType::Complex128: return "complex128";
        case DataType::Bool: return "bool";
        case DataType::RGBA8: return "rgba8";
    }
    return "unknown";
}

// byteswap template

template <typename T>
constexpr T byteswap(T value) noexcept requires std::is_integral_v<T> {
    if constexpr (sizeof(T) == 1) {
        return value;
    } else {
        using U = std::make_unsigned_t<T>;
        U v = static_cast<U>(value);
        U result = 0;
        for (std::size_t i = 0; i < sizeof(T); ++i) {
            result = static_cast<U>((result << 8) | (v & 0xFF));
            v = static_cast<U>(v >> 8);
        }
        return static_cast<T>(result);
    }
}

// convert_endianness template

template <typename T, std::endian SourceEndian, std::endian TargetEndian>
constexpr void convert_endianness([[maybe_unused]] T& value) noexcept {
    if constexpr (SourceEndian != TargetEndian) {
        if constexpr (std::is_integral_v<T>) {
            value = byteswap(value);
        } else if constexpr (std::is_floating_point_v<T>) {
            if constexpr (sizeof(T) == 4) {
                uint32_t temp = std::bit_cast<uint32_t>(value);
                value = std::bit_cast<T>(byteswap(temp));
            } else if constexpr (sizeof(T) == 8) {
                uint64_t temp = std::bit_cast<uint64_t>(value);
                value = std::bit_cast<T>(byteswap(temp));
            }
        } else {
            static_assert(sizeof(T) == 0, "convert_endianness not specialized for this type");
        }
    }
}

template <typename T>
T load_value(std::span<const std::byte> bytes, std::endian source) noexcept {
    T value;
    std::memcpy(&value, bytes.data(), sizeof(T));
    if (source == std::endian::big) {
        convert_endianness<T, std::endian::big, std::endian::native>(value);
    } else {
        convert_endianness<T, std::endian::little, std::endian::native>(value);
    }
    return value;
}

template <typename T>
void store_value(std::span<std::byte> bytes, T value, std::endian target) noexcept {
    if (target == std::endian::big) {
        convert_endianness<T, std::endian::native, std::endian::big>(value);
    } else {
        convert_endianness<T, std::endian::native, std::endian::little>(value);
    }
    std::memcpy(bytes.data(), &value, sizeof(T));
}

} // namespace dmconcept
