// Do not include this file directly. Include "array.hpp" instead.

#pragma once

#include <chrono>
#include <string>
#include <type_traits>
#include "../types.hpp"

#ifndef DMCONCEPT_ARRAY_HEADER
#include "../array.hpp" // for linters
#endif

namespace dmconcept {

inline NDArray NDArray::zeros(DataType type, std::vector<uint64_t> shape) {
    NDArray array{type, std::move(shape), {}};
    array.data.resize(static_cast<std::size_t>(array.byte_size()));
    return array;
}

template <typename T>
NDArray NDArray::from_values(DataType type, std::vector<uint64_t> shape, const std::vector<T>& values) {
    NDArray array{type, std::move(shape), {}};
    array.data.resize(values.size() * sizeof(T));
    for (std::size_t i = 0; i < values.size(); ++i) {
        store_value<T>(std::span<std::byte>(array.data).subspan(i * sizeof(T), sizeof(T)), values[i], kValueEndian);
    }
    return array;
}

inline uint64_t NDArray::element_count() const noexcept {
    uint64_t count = 1;
    for (uint64_t extent : shape) {
        count *= extent;
    }
    return count;
}

inline uint64_t NDArray::byte_size() const noexcept {
    return element_count() * data_type_size(element_type);
}

template <typename T>
T NDArray::at(uint64_t index) const noexcept {
    return load_value<T>(std::span<const std::byte>(data).subspan(static_cast<std::size_t>(index) * sizeof(T),
                                                                  sizeof(T)),
                         kValueEndian);
}

inline ArrayMetadata ArrayMetadata::plain(DataType type, std::span<const uint64_t> shape) {
    ArrayMetadata metadata;
    metadata.element_type = type;
    const std::size_t outer = shape.size() > 2 ? shape.size() - 2 : 0;
    for (std::size_t i = 0; i < shape.size(); ++i) {
        metadata.axes.push_back(AxisDescriptor{shape[i], Calibration{},
                                               i < outer ? AxisKind::Collection : AxisKind::Datum});
    }
    return metadata;
}

inline std::vector<uint64_t> ArrayMetadata::shape() const {
    std::vector<uint64_t> extents;
    extents.reserve(axes.size());
    for (const auto& axis : axes) {
        extents.push_back(axis.size);
    }
    return extents;
}

inline std::size_t ArrayMetadata::count(AxisKind kind) const noexcept {
    std::size_t n = 0;
    for (const auto& axis : axes) {
        if (axis.kind == kind) {
            ++n;
        }
    }
    return n;
}

inline uint64_t ArrayMetadata::element_count() const noexcept {
    uint64_t count = 1;
    for (const auto& axis : axes) {
        count *= axis.size;
    }
    return count;
}

inline uint64_t ArrayMetadata::byte_size() const noexcept {
    return element_count() * data_type_size(element_type);
}

inline Result<void> validate_axis_kinds(std::span<const AxisDescriptor> axes) noexcept {
    if (axes.empty()) [[unlikely]] {
        return Err(Error::Code::InvalidMetadata, "An array needs at least one axis");
    }

    std::size_t datum_count = 0;
    for (std::size_t i = 0; i < axes.size(); ++i) {
        const AxisKind kind = axes[i].kind;
        if (kind == AxisKind::Sequence && i != 0) [[unlikely]] {
            return Err(Error::Code::InvalidMetadata,
                       "Sequence axis " + std::to_string(i) + " is not the outermost axis");
        }
        if (kind == AxisKind::Datum) {
            ++datum_count;
        } else if (datum_count > 0) [[unlikely]] {
            return Err(Error::Code::InvalidMetadata,
                       std::string("Axis ") + std::to_string(i) + " (" + std::string(axis_kind_name(kind)) +
                       ") follows a datum axis");
        }
    }

    if (datum_count == 0 || datum_count > 2) [[unlikely]] {
        return Err(Error::Code::InvalidMetadata,
                   "Expected 1 or 2 datum axes, got " + std::to_string(datum_count));
    }
    return Ok();
}

inline Result<void> validate_time_fields(const ArrayMetadata& metadata) noexcept {
    if (metadata.timestamp) {
        const std::chrono::year_month_day date{std::chrono::floor<std::chrono::days>(*metadata.timestamp)};
        const int year = static_cast<int>(date.year());
        if (year < kMinTimestampYear || year > kMaxTimestampYear) [[unlikely]] {
            return Err(Error::Code::InvalidMetadata,
                       "Timestamp year " + std::to_string(year) + " does not have four digits");
        }
    }
    if (metadata.timezone) {
        const int32_t offset = metadata.timezone->utc_offset_minutes;
        if (offset < -kMaxUtcOffsetMinutes || offset > kMaxUtcOffsetMinutes) [[unlikely]] {
            return Err(Error::Code::InvalidMetadata,
                       "UTC offset of " + std::to_string(offset) + " minutes does not fit +HHMM");
        }
    }
    return Ok();
}

inline Result<void> validate_metadata(const ArrayMetadata& metadata, DataType type,
                                      std::span<const uint64_t> shape) noexcept {
    if (metadata.axes.size() != shape.size()) [[unlikely]] {
        return Err(Error::Code::InvalidMetadata,
                   "Metadata has " + std::to_string(metadata.axes.size()) + " axes for an array of rank " +
                   std::to_string(shape.size()));
    }
    for (std::size_t i = 0; i < shape.size(); ++i) {
        if (metadata.axes[i].size != shape[i]) [[unlikely]] {
            return Err(Error::Code::InvalidMetadata,
                       "Axis " + std::to_string(i) + " has size " + std::to_string(metadata.axes[i].size) +
                       " but the array extent is " + std::to_string(shape[i]));
        }
    }
    if (metadata.element_type != type) [[unlikely]] {
        return Err(Error::Code::InvalidMetadata,
                   std::string("Metadata element type ") + std::string(data_type_name(metadata.element_type)) +
                   " does not match array element type " + std::string(data_type_name(type)));
    }
    auto times = validate_time_fields(metadata);
    if (times.is_error()) [[unlikely]] {
        return times;
    }
    return validate_axis_kinds(metadata.axes);
}

} // namespace dmconcept
