#pragma once

#include <array>
#include <bit>
#include <concepts>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string_view>
#include <type_traits>

namespace dmconcept {

/// @brief On-disk variant of the DM tag file
/// @details The value is the version marker stored in the first 4 bytes of the file.
enum class DmVersion : int32_t {
    DM3 = 3, ///< 4-byte length fields
    DM4 = 4  ///< 8-byte length fields, per-entry byte sizes
};

/// @brief Width policy selected by the version marker
/// @tparam Version The on-disk variant
/// @details Every length, count and type-code field of the tag stream is
/// stored with `length_type`. DM4 also prefixes each tag entry with its byte size.
template <DmVersion Version>
struct WidthPolicy;

template <>
struct WidthPolicy<DmVersion::DM3> {
    using length_type = uint32_t;
    static constexpr DmVersion version = DmVersion::DM3;
    static constexpr std::size_t length_width = 4;
    static constexpr std::size_t header_size = 12;  ///< version + file size + byte order
    static constexpr bool has_entry_size = false;
};

template <>
struct WidthPolicy<DmVersion::DM4> {
    using length_type = uint64_t;
    static constexpr DmVersion version = DmVersion::DM4;
    static constexpr std::size_t length_width = 8;
    static constexpr std::size_t header_size = 16;
    static constexpr bool has_entry_size = true;
};

template <typename T>
concept DmWidthPolicy = requires {
    typename T::length_type;
    { T::version } -> std::convertible_to<DmVersion>;
    { T::length_width } -> std::convertible_to<std::size_t>;
    { T::header_size } -> std::convertible_to<std::size_t>;
    { T::has_entry_size } -> std::convertible_to<bool>;
    requires sizeof(typename T::length_type) == T::length_width;
};

static_assert(DmWidthPolicy<WidthPolicy<DmVersion::DM3>>);
static_assert(DmWidthPolicy<WidthPolicy<DmVersion::DM4>>);

/// @brief Parse a version marker
/// @return The matching version, or std::nullopt for anything other than 3 or 4
[[nodiscard]] constexpr std::optional<DmVersion> version_from_marker(int32_t marker) noexcept;

/// @brief Primitive and structured type codes of the tag stream
enum class PrimitiveType : uint32_t {
    Int16   = 2,  ///< "short"
    Int32   = 3,  ///< "long"
    UInt16  = 4,  ///< "ushort", also used for UTF-16 text arrays
    UInt32  = 5,  ///< "ulong"
    Float32 = 6,  ///< "float"
    Float64 = 7,  ///< "double"
    Bool    = 8,  ///< one byte, nonzero is true
    Int8    = 9,  ///< "char"
    UInt8   = 10, ///< "octet"
    Int64   = 11,
    UInt64  = 12,
    String  = 18  ///< length-prefixed UTF-16LE
};

/// Structured type codes. They never appear as PrimitiveType values.
inline constexpr uint32_t kStructTypeCode = 15;
inline constexpr uint32_t kArrayTypeCode = 20;

/// Tag entry discriminators
inline constexpr uint8_t kGroupEntryKind = 20;
inline constexpr uint8_t kDataEntryKind = 21;

/// Delimiter opening every data block
inline constexpr std::array<char, 4> kDataDelimiter = {'%', '%', '%', '%'};

/// Byte order flag value for little-endian tag values and payload
inline constexpr int32_t kLittleEndianPayloadFlag = 1;

/// Number of zero bytes following the root group
inline constexpr std::size_t kTrailerSize = 8;

/// Endianness of the structural fields (lengths, counts, type codes)
inline constexpr std::endian kStructureEndian = std::endian::big;

/// Endianness of tag values and the pixel payload
inline constexpr std::endian kValueEndian = std::endian::little;

/// @brief Pixel element type of an image (the ImageData DataType tag)
enum class DataType : int32_t {
    Int16      = 1,
    Float32    = 2,
    Complex64  = 3,  ///< Pairs of float32 (real, imaginary)
    UInt8      = 6,
    Int32      = 7,
    Int8       = 9,
    UInt16     = 10,
    UInt32     = 11,
    Float64    = 12,
    Complex128 = 13, ///< Pairs of float64 (real, imaginary)
    Bool       = 14,
    RGBA8      = 23  ///< Packed 8-bit R, G, B, A channels
};

/// @brief Validate an image DataType code
[[nodiscard]] constexpr std::optional<DataType> data_type_from_code(int64_t code) noexcept;

/// @brief Size in bytes of one element (the ImageData PixelDepth tag)
[[nodiscard]] constexpr std::size_t data_type_size(DataType type) noexcept;

/// @brief Whether the element is stored as a struct of two floating point fields
[[nodiscard]] constexpr bool data_type_is_complex(DataType type) noexcept;

/// @brief Tag stream type used to store one element of the image payload
/// @details For complex types this is the field type of the (real, imaginary) struct.
[[nodiscard]] constexpr PrimitiveType data_type_storage(DataType type) noexcept;

[[nodiscard]] constexpr std::string_view data_type_name(DataType type) noexcept;

/// @brief Byte-swap an integral value
/// @note For 1-byte types, returns the value unchanged
template <typename T>
[[nodiscard]] constexpr T byteswap(T value) noexcept requires std::is_integral_v<T>;

/// @brief Convert a value from source endianness to target endianness in place
/// @note Handles integral and floating point types
template <typename T, std::endian SourceEndian, std::endian TargetEndian>
constexpr void convert_endianness([[maybe_unused]] T& value) noexcept;

/// @brief Load a value stored with the given endianness from raw bytes
/// @pre bytes.size() >= sizeof(T)
template <typename T>
[[nodiscard]] T load_value(std::span<const std::byte> bytes, std::endian source) noexcept;

/// @brief Store a value with the given endianness into raw bytes
/// @pre bytes.size() >= sizeof(T)
template <typename T>
void store_value(std::span<std::byte> bytes, T value, std::endian target) noexcept;

} // namespace dmconcept

#define DMCONCEPT_TYPES_HEADER
#include "impl/types_impl.hpp"
