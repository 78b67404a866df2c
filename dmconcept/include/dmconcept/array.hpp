#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include "tag_tree.hpp"
#include "text.hpp"
#include "types.hpp"
#include "types/result.hpp"

namespace dmconcept {

/// @brief Linear calibration: physical = offset + scale * index
struct Calibration {
    double offset = 0.0;
    double scale = 1.0;
    std::string units;

    bool operator==(const Calibration&) const = default;
};

/// @brief Role of an axis in the array
enum class AxisKind : uint8_t {
    Sequence,    ///< Outermost time or frame axis
    Collection,  ///< Scan position or other parametric axis
    Datum        ///< Signal axis (spectrum channel, image row or column)
};

[[nodiscard]] constexpr std::string_view axis_kind_name(AxisKind kind) noexcept {
    switch (kind) {
        case AxisKind::Sequence: return "sequence";
        case AxisKind::Collection: return "collection";
        case AxisKind::Datum: return "datum";
    }
    return "unknown";
}

struct AxisDescriptor {
    uint64_t size = 0;
    Calibration calibration;
    AxisKind kind = AxisKind::Datum;

    bool operator==(const AxisDescriptor&) const = default;
};

struct TimezoneInfo {
    std::string name;                 ///< e.g. "Europe/Berlin", may be empty
    int32_t utc_offset_minutes = 0;

    bool operator==(const TimezoneInfo&) const = default;
};

/// @brief Dense N-dimensional array
/// @details Shape is outermost first. `data` holds the elements contiguously in
/// row-major order, each element little-endian as in the file; complex
/// elements are (real, imaginary) pairs and RGBA8 elements are R, G, B, A bytes.
struct NDArray {
    DataType element_type = DataType::Float32;
    std::vector<uint64_t> shape;
    std::vector<std::byte> data;

    /// @brief Array of zero bytes
    [[nodiscard]] static NDArray zeros(DataType type, std::vector<uint64_t> shape);

    /// @brief Array holding `values`, stored little-endian
    /// @pre sizeof(T) == data_type_size(type), or T is the field type of a complex `type`
    template <typename T>
    [[nodiscard]] static NDArray from_values(DataType type, std::vector<uint64_t> shape, const std::vector<T>& values);

    [[nodiscard]] std::size_t rank() const noexcept { return shape.size(); }
    [[nodiscard]] uint64_t element_count() const noexcept;

    /// @brief Bytes implied by the shape and element type
    [[nodiscard]] uint64_t byte_size() const noexcept;

    /// @brief Element (or complex component) `index` decoded as T
    template <typename T>
    [[nodiscard]] T at(uint64_t index) const noexcept;

    bool operator==(const NDArray&) const = default;
};

/// @brief Everything known about an array besides its elements
struct ArrayMetadata {
    std::vector<AxisDescriptor> axes;   ///< Outermost first, one per array dimension
    Calibration intensity_calibration;
    DataType element_type = DataType::Float32;
    std::optional<Timestamp> timestamp;
    std::optional<TimezoneInfo> timezone;
    std::string title;
    /// Vendor tags of the image not otherwise interpreted (timestamp and timezone tags removed)
    TagGroup properties;

    /// @brief Metadata with identity calibrations and the default axis kinds
    /// @details The two innermost axes are Datum axes, any outer axis is a Collection axis.
    [[nodiscard]] static ArrayMetadata plain(DataType type, std::span<const uint64_t> shape);

    [[nodiscard]] std::vector<uint64_t> shape() const;
    [[nodiscard]] std::size_t count(AxisKind kind) const noexcept;
    [[nodiscard]] bool is_sequence() const noexcept { return count(AxisKind::Sequence) > 0; }
    [[nodiscard]] uint64_t element_count() const noexcept;
    [[nodiscard]] uint64_t byte_size() const noexcept;

    bool operator==(const ArrayMetadata&) const = default;
};

/// @brief Result of decoding a file into memory
struct DecodedImage {
    NDArray array;
    ArrayMetadata metadata;
};

/// @brief Check that the axis kinds are ordered Sequence, Collection, Datum
/// @return InvalidMetadata naming the first violation
[[nodiscard]] Result<void> validate_axis_kinds(std::span<const AxisDescriptor> axes) noexcept;

/// @brief Check that the timestamp year and the timezone offset can be written
[[nodiscard]] Result<void> validate_time_fields(const ArrayMetadata& metadata) noexcept;

/// @brief Check that metadata describes an array of `type` and `shape`
/// @return InvalidMetadata on a rank, size, element type or axis-order mismatch,
/// or a timestamp or timezone that cannot be written
[[nodiscard]] Result<void> validate_metadata(const ArrayMetadata& metadata, DataType type,
                                             std::span<const uint64_t> shape) noexcept;

} // namespace dmconcept

#define DMCONCEPT_ARRAY_HEADER
#include "impl/array_impl.hpp"
