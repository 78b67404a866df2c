// Do not include this file directly. Include "tag_extraction.hpp" instead.

#pragma once

#include <algorithm>
#include <limits>
#include <new>
#include <string>
#include "../strategy/stream_strategy.hpp"
#include "../text.hpp"

#ifndef DMCONCEPT_TAG_EXTRACTION_HEADER
#include "../tag_extraction.hpp" // for linters
#endif

namespace dmconcept {
namespace detail {

[[nodiscard]] inline Error layout_error(std::string message) noexcept {
    return Err(Error::Code::UnrecognizedLayout, std::move(message));
}

/// Calibration groups store the origin in pixels: offset = -origin * scale
[[nodiscard]] inline Calibration read_calibration(const TagGroup& group) noexcept {
    const double origin = group.find_number(tag_names::Origin).value_or(0.0);
    const double scale = group.find_number(tag_names::Scale).value_or(1.0);
    return Calibration{-origin * scale, scale, group.find_text(tag_names::Units).value_or(std::string{})};
}

/// Dimensions is a list of integers, innermost first
[[nodiscard]] inline std::optional<std::vector<uint64_t>> read_dimensions(const TagValue& value) noexcept {
    std::vector<uint64_t> extents;
    if (const auto* list = std::get_if<TagGroup>(&value)) {
        for (const auto& entry : list->entries) {
            auto extent = as_integer(entry.value);
            if (!extent || *extent < 0) {
                return std::nullopt;
            }
            extents.push_back(static_cast<uint64_t>(*extent));
        }
        return extents;
    }
    if (const auto* array = std::get_if<TagArray>(&value)) {
        for (uint64_t i = 0; i < array->length; ++i) {
            auto element = array->element(i);
            if (!element) {
                return std::nullopt;
            }
            auto extent = as_integer(TagValue{TagScalar{std::move(*element)}});
            if (!extent || *extent < 0) {
                return std::nullopt;
            }
            extents.push_back(static_cast<uint64_t>(*extent));
        }
        return extents;
    }
    return std::nullopt;
}

[[nodiscard]] inline bool is_spectrum_format(std::string_view format) noexcept {
    return iequals_ascii(format, kFormatSpectrum) || iequals_ascii(format, kFormatSpectrumImage);
}

[[nodiscard]] inline bool layout_matches(const ElementLayout& layout, DataType type) noexcept {
    if (data_type_is_complex(type)) {
        const PrimitiveType part = data_type_storage(type);
        return layout.is_struct && layout.fields.size() == 2 && layout.fields[0] == part && layout.fields[1] == part;
    }
    // Any primitive of the right width is accepted: vendor files disagree on signedness
    return !layout.is_struct && width_of(layout.primitive) == data_type_size(type);
}

/// Axis counts of the stored array, before the spectrum and sequence overlays
struct AxisCounts {
    std::size_t sequence = 0;
    std::size_t collection = 0;
    std::size_t datum = 0;
};

} // namespace detail

inline ElementLayout storage_layout(DataType type) {
    const PrimitiveType storage = data_type_storage(type);
    if (data_type_is_complex(type)) {
        return ElementLayout::structure({storage, storage});
    }
    return ElementLayout::of(storage);
}

inline Result<ExtractedImage> extract_image(const TagGroup& root) noexcept {
    const auto* image_list = root.find_group(tag_names::ImageList);
    if (image_list == nullptr || image_list->empty()) [[unlikely]] {
        return detail::layout_error("No ImageList in the tag tree");
    }
    const auto* image = std::get_if<TagGroup>(&image_list->entries.back().value);
    if (image == nullptr) [[unlikely]] {
        return detail::layout_error("Last ImageList entry is not a group");
    }
    const auto* image_data = image->find_group(tag_names::ImageData);
    if (image_data == nullptr) [[unlikely]] {
        return detail::layout_error("Image has no ImageData group");
    }
    const auto* data = image_data->find_array(tag_names::Data);
    if (data == nullptr) [[unlikely]] {
        return detail::layout_error("ImageData has no Data array");
    }

    auto type_code = image_data->find_integer(tag_names::DataType);
    if (!type_code) [[unlikely]] {
        return detail::layout_error("ImageData has no DataType");
    }
    auto element_type = data_type_from_code(*type_code);
    if (!element_type) [[unlikely]] {
        return detail::layout_error("Unsupported image DataType " + std::to_string(*type_code));
    }
    const std::size_t element_size = data_type_size(*element_type);
    if (auto depth = image_data->find_integer(tag_names::PixelDepth);
        depth && *depth != static_cast<int64_t>(element_size)) [[unlikely]] {
        return detail::layout_error("PixelDepth " + std::to_string(*depth) + " does not match DataType " +
                                    std::string(data_type_name(*element_type)));
    }
    if (!detail::layout_matches(data->layout, *element_type)) [[unlikely]] {
        return detail::layout_error("Data array layout does not match DataType " +
                                    std::string(data_type_name(*element_type)));
    }

    const auto* dimensions_tag = image_data->find(tag_names::Dimensions);
    if (dimensions_tag == nullptr) [[unlikely]] {
        return detail::layout_error("ImageData has no Dimensions");
    }
    auto dimensions = detail::read_dimensions(*dimensions_tag);
    if (!dimensions || dimensions->empty()) [[unlikely]] {
        return detail::layout_error("Dimensions must be a non-empty list of extents");
    }

    // Dimensions and calibrations are stored innermost first
    const std::size_t rank = dimensions->size();
    std::vector<uint64_t> stored(dimensions->rbegin(), dimensions->rend());
    uint64_t element_count = 1;
    for (uint64_t extent : stored) {
        if (extent != 0 && element_count > std::numeric_limits<uint64_t>::max() / extent) [[unlikely]] {
            return detail::layout_error("Dimensions overflow");
        }
        element_count *= extent;
    }
    if (data->length != element_count) [[unlikely]] {
        return detail::layout_error("Data holds " + std::to_string(data->length) + " elements, Dimensions imply " +
                                    std::to_string(element_count));
    }

    std::vector<Calibration> stored_calibrations(rank);
    ExtractedImage result;
    result.data = data;
    result.metadata.element_type = *element_type;
    if (const auto* calibrations = image_data->find_group(tag_names::Calibrations)) {
        if (const auto* dimension_list = calibrations->find_group(tag_names::Dimension)) {
            const std::size_t n = std::min(rank, dimension_list->size());
            for (std::size_t i = 0; i < n; ++i) {
                if (const auto* dimension = std::get_if<TagGroup>(&dimension_list->entries[i].value)) {
                    stored_calibrations[rank - 1 - i] = detail::read_calibration(*dimension);
                }
            }
        }
        if (const auto* brightness = calibrations->find_group(tag_names::Brightness)) {
            result.metadata.intensity_calibration = detail::read_calibration(*brightness);
        }
    }

    const TagGroup* image_tags = image->find_group(tag_names::ImageTags);
    const TagGroup* meta_data = image_tags != nullptr ? image_tags->find_group(tag_names::MetaData) : nullptr;
    bool is_spectrum = false;
    bool is_sequence = false;
    if (meta_data != nullptr) {
        is_spectrum = detail::is_spectrum_format(meta_data->find_text(tag_names::Format).value_or(std::string{}));
        is_sequence = meta_data->find_bool(tag_names::IsSequence).value_or(false);
    }

    // Classify the stored axes
    std::vector<uint64_t> shape = stored;
    std::vector<Calibration> axis_calibrations = stored_calibrations;
    detail::AxisCounts counts;
    if (rank == 3 && is_spectrum) {
        // Spectra are stored channel-first
        result.transpose = PayloadTranspose{stored[0], stored[1] * stored[2]};
        if (stored[1] == 1) {
            shape = {stored[2], stored[0]};
            axis_calibrations = {stored_calibrations[2], stored_calibrations[0]};
            counts = {0, 1, 1};
        } else {
            shape = {stored[1], stored[2], stored[0]};
            axis_calibrations = {stored_calibrations[1], stored_calibrations[2], stored_calibrations[0]};
            counts = {0, 2, 1};
        }
    } else if (rank == 3) {
        counts = {0, 1, 2};
    } else if (rank >= 4) {
        counts = {0, rank - 2, 2};
    } else {
        counts = {0, 0, rank};
    }
    if (is_spectrum) {
        counts.collection += counts.datum - 1;
        counts.datum = 1;
    }
    if (is_sequence && counts.collection > 0) {
        counts.sequence = 1;
        counts.collection -= 1;
    }

    result.stored_shape = std::move(stored);
    result.metadata.axes.reserve(shape.size());
    for (std::size_t i = 0; i < shape.size(); ++i) {
        AxisKind kind = AxisKind::Datum;
        if (i < counts.sequence) {
            kind = AxisKind::Sequence;
        } else if (i < counts.sequence + counts.collection) {
            kind = AxisKind::Collection;
        }
        result.metadata.axes.push_back(AxisDescriptor{shape[i], std::move(axis_calibrations[i]), kind});
    }

    result.metadata.title = image->find_text(tag_names::Name).value_or(std::string{});
    if (image_tags != nullptr) {
        if (auto stamp = image_tags->find_text(tag_names::Timestamp)) {
            result.metadata.timestamp = parse_iso_timestamp(*stamp);
        }
        auto zone_name = image_tags->find_text(tag_names::Timezone);
        std::optional<int32_t> zone_offset;
        if (auto offset_text = image_tags->find_text(tag_names::TimezoneOffset)) {
            zone_offset = parse_utc_offset(*offset_text);
        }
        if (zone_name || zone_offset) {
            result.metadata.timezone = TimezoneInfo{zone_name.value_or(std::string{}), zone_offset.value_or(0)};
        }

        result.metadata.properties = *image_tags;
        result.metadata.properties.remove(tag_names::Timestamp);
        result.metadata.properties.remove(tag_names::Timezone);
        result.metadata.properties.remove(tag_names::TimezoneOffset);
    }

    log::debug("Image {} ({}), stored shape rank {}, {} sequence / {} collection / {} datum axes",
               result.metadata.title, data_type_name(*element_type), rank,
               counts.sequence, counts.collection, counts.datum);
    return result;
}

inline Result<NDArray> materialize_array(const ExtractedImage& image) noexcept {
    if (image.data == nullptr || !image.data->is_inline()) [[unlikely]] {
        return detail::layout_error("Image payload was left in the byte source");
    }
    const auto payload = image.data->bytes();
    NDArray array;
    array.element_type = image.metadata.element_type;
    array.shape = image.shape();
    try {
        if (image.transpose) {
            array.data.resize(payload.size());
            transpose_bytes(payload, array.data, static_cast<std::size_t>(image.transpose->rows),
                            static_cast<std::size_t>(image.transpose->cols),
                            data_type_size(array.element_type));
        } else {
            array.data.assign(payload.begin(), payload.end());
        }
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Failed to allocate " + std::to_string(payload.size()) + " array bytes");
    }
    return array;
}

} // namespace dmconcept
