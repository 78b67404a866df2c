#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include "reader_base.hpp"
#include "tag_stream.hpp"
#include "types.hpp"
#include "types/result.hpp"

namespace dmconcept {

/// @brief Value of one primitive tag
/// @details The alternative held determines the PrimitiveType. Strings hold
/// UTF-16 code units as stored on disk.
using ScalarValue = std::variant<
    int16_t, int32_t, uint16_t, uint32_t, float, double, bool,
    int8_t, uint8_t, int64_t, uint64_t, std::u16string>;

/// @brief One row of the type table
struct PrimitiveTypeInfo {
    PrimitiveType type;
    std::size_t width;        ///< On-disk width, 0 for the variable-width string
    std::string_view name;
};

/// @brief The closed set of primitive types. Never mutated.
inline constexpr std::array<PrimitiveTypeInfo, 12> kPrimitiveTypes = {{
    {PrimitiveType::Int16,   2, "int16"},
    {PrimitiveType::Int32,   4, "int32"},
    {PrimitiveType::UInt16,  2, "uint16"},
    {PrimitiveType::UInt32,  4, "uint32"},
    {PrimitiveType::Float32, 4, "float32"},
    {PrimitiveType::Float64, 8, "float64"},
    {PrimitiveType::Bool,    1, "bool"},
    {PrimitiveType::Int8,    1, "int8"},
    {PrimitiveType::UInt8,   1, "uint8"},
    {PrimitiveType::Int64,   8, "int64"},
    {PrimitiveType::UInt64,  8, "uint64"},
    {PrimitiveType::String,  0, "string"},
}};

/// @brief Look up a raw type code
/// @return The table row, or nullptr for a code outside the closed set
[[nodiscard]] constexpr const PrimitiveTypeInfo* find_primitive_type(uint64_t code) noexcept;

/// @brief Validate a raw type code read at `offset`
/// @return UnknownTypeCode if the code is not a primitive type
[[nodiscard]] Result<PrimitiveType> primitive_type_from_code(uint64_t code, std::size_t offset) noexcept;

/// @brief Fixed on-disk width of a primitive type, std::nullopt for strings
[[nodiscard]] constexpr std::optional<std::size_t> width_of(PrimitiveType type) noexcept;

[[nodiscard]] constexpr std::string_view type_name(PrimitiveType type) noexcept;

/// @brief PrimitiveType of the alternative held by a ScalarValue
[[nodiscard]] PrimitiveType type_of(const ScalarValue& value) noexcept;

/// @brief Compile-time PrimitiveType of a C++ type
template <typename T>
struct primitive_type_of;

template <typename T>
inline constexpr PrimitiveType primitive_type_of_v = primitive_type_of<T>::value;

/// @brief Sum of the field widths of a struct layout
/// @return std::nullopt if a field has no fixed width
[[nodiscard]] std::optional<std::size_t> struct_width(std::span<const PrimitiveType> fields) noexcept;

/// @brief Decode a fixed-width value from little-endian bytes
/// @pre width_of(type) is set and bytes holds at least that many bytes
[[nodiscard]] ScalarValue load_scalar(PrimitiveType type, std::span<const std::byte> bytes) noexcept;

/// @brief Encode a fixed-width value as little-endian bytes
/// @pre the value is not a string and bytes is large enough
void store_scalar(const ScalarValue& value, std::span<std::byte> bytes) noexcept;

/// @brief Read one value of `type` at the cursor
/// @tparam Policy width policy (sizes the string length field)
template <DmWidthPolicy Policy, typename Reader>
    requires RawReader<Reader>
[[nodiscard]] Result<ScalarValue> decode_scalar(PrimitiveType type, TagStreamReader<Reader>& reader) noexcept;

/// @brief Write one value at the cursor
template <DmWidthPolicy Policy, typename Writer>
    requires RawWriter<Writer>
[[nodiscard]] Result<void> encode_scalar(const ScalarValue& value, TagStreamWriter<Writer>& writer) noexcept;

/// @brief Number of bytes encode_scalar() writes for this value
template <DmWidthPolicy Policy>
[[nodiscard]] std::size_t encoded_scalar_size(const ScalarValue& value) noexcept;

} // namespace dmconcept

#define DMCONCEPT_TYPE_REGISTRY_HEADER
#include "impl/type_registry_impl.hpp"
