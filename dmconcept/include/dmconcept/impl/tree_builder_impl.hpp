// Do not include this file directly. Include "tree_builder.hpp" instead.

#pragma once

#include <limits>
#include <type_traits>
#include <variant>
#include <string>
#include <string_view>
#include "../log.hpp"
#include "../text.hpp"

#ifndef DMCONCEPT_TREE_BUILDER_HEADER
#include "../tree_builder.hpp" // for linters
#endif

namespace dmconcept {
namespace detail {

/// Integers are stored as int32 unless they need 64 bits
[[nodiscard]] inline TagScalar integer_tag(int64_t value) {
    if (value >= std::numeric_limits<int32_t>::min() && value <= std::numeric_limits<int32_t>::max()) {
        return TagScalar{ScalarValue{std::in_place_type<int32_t>, static_cast<int32_t>(value)}};
    }
    return TagScalar{ScalarValue{std::in_place_type<int64_t>, value}};
}

[[nodiscard]] inline TagScalar float_tag(double value) {
    return TagScalar{ScalarValue{std::in_place_type<double>, value}};
}

[[nodiscard]] inline TagScalar bool_tag(bool value) {
    return TagScalar{ScalarValue{std::in_place_type<bool>, value}};
}

[[nodiscard]] inline TagGroup calibration_group(const Calibration& calibration) {
    const double origin = calibration.scale != 0.0 ? -calibration.offset / calibration.scale : 0.0;
    TagGroup group;
    group.add(std::string(tag_names::Origin), float_tag(origin));
    group.add(std::string(tag_names::Scale), float_tag(calibration.scale));
    group.add(std::string(tag_names::Units), make_text(std::string_view{calibration.units}));
    return group;
}

[[nodiscard]] inline TagGroup id_list() {
    TagGroup ids = TagGroup::list();
    ids.add(std::string{}, integer_tag(0));
    return ids;
}

[[nodiscard]] inline TagGroup simple_image_source() {
    TagGroup source;
    source.add("ClassName", make_text(std::string_view{"ImageSource:Simple"}));
    source.add("Id", id_list());
    source.add("ImageRef", integer_tag(0));
    return source;
}

[[nodiscard]] inline TagGroup summed_image_source(std::size_t summed_dimension) {
    TagGroup source;
    source.add("ClassName", make_text(std::string_view{"ImageSource:Summed"}));
    source.add("Do Sum", bool_tag(true));
    source.add("Id", id_list());
    source.add("ImageRef", integer_tag(0));
    source.add("LayerEnd", integer_tag(0));
    source.add("LayerStart", integer_tag(0));
    source.add("Summed Dimension", integer_tag(static_cast<int64_t>(summed_dimension)));
    return source;
}

/// Cursor annotation shown over a spectrum image
[[nodiscard]] inline TagGroup si_cursor_annotation() {
    TagGroup annotation;
    annotation.add("AnnotationType", integer_tag(23));
    annotation.add("Name", make_text(std::string_view{"SICursor"}));
    TagStruct rectangle;
    for (int32_t v : {0, 0, 1, 1}) {
        rectangle.fields.emplace_back(std::in_place_type<int32_t>, v);
    }
    annotation.add("Rectangle", std::move(rectangle));
    return annotation;
}

[[nodiscard]] inline bool has_eels_signal(const TagGroup& properties) noexcept {
    const auto* meta_data = properties.find_group(tag_names::MetaData);
    if (meta_data == nullptr) {
        return false;
    }
    auto signal = meta_data->find_text(tag_names::Signal);
    return signal && iequals_ascii(*signal, kSignalEELS);
}

} // namespace detail

inline Result<StoredLayout> plan_stored_layout(const ArrayMetadata& metadata) noexcept {
    auto valid = validate_axis_kinds(metadata.axes);
    if (valid.is_error()) [[unlikely]] {
        return valid.error();
    }

    const auto& axes = metadata.axes;
    const std::size_t rank = axes.size();
    const std::size_t datum = metadata.count(AxisKind::Datum);

    StoredLayout layout;
    if (rank == 3 && datum == 1) {
        // (A, B, E) -> (E, A, B)
        layout.stored_shape = {axes[2].size, axes[0].size, axes[1].size};
        layout.stored_calibrations = {axes[2].calibration, axes[0].calibration, axes[1].calibration};
        layout.transpose = PayloadTranspose{axes[0].size * axes[1].size, axes[2].size};
    } else if (rank == 2 && datum == 1) {
        // (N, E) -> (E, 1, N)
        layout.stored_shape = {axes[1].size, 1, axes[0].size};
        layout.stored_calibrations = {axes[1].calibration, Calibration{}, axes[0].calibration};
        layout.transpose = PayloadTranspose{axes[0].size, axes[1].size};
        layout.sliced = true;
    } else {
        for (const auto& axis : axes) {
            layout.stored_shape.push_back(axis.size);
            layout.stored_calibrations.push_back(axis.calibration);
        }
    }
    return layout;
}

inline Result<TagGroup> build_image_tree(const ArrayMetadata& metadata, PayloadRef payload) noexcept {
    auto planned = plan_stored_layout(metadata);
    if (planned.is_error()) [[unlikely]] {
        return planned.error();
    }
    const StoredLayout& layout = planned.value();

    const uint64_t element_count = metadata.element_count();
    const uint64_t expected_bytes = metadata.byte_size();
    const uint64_t payload_bytes = std::visit([](const auto& p) -> uint64_t {
        using P = std::remove_cvref_t<decltype(p)>;
        if constexpr (std::is_same_v<P, InlinePayload>) {
            return p.bytes.size();
        } else {
            return p.byte_length;
        }
    }, payload);
    if (payload_bytes != expected_bytes) [[unlikely]] {
        return Err(Error::Code::InvalidMetadata,
                   "Payload holds " + std::to_string(payload_bytes) + " bytes, metadata implies " +
                   std::to_string(expected_bytes));
    }

    const bool sequence = metadata.is_sequence();
    const std::size_t datum = metadata.count(AxisKind::Datum);
    // Axis counts as the stored layout describes them
    const std::size_t collection = layout.sliced ? 2 : metadata.count(AxisKind::Collection);
    const bool stored_sequence = layout.sliced ? false : sequence;
    const std::size_t stored_rank = layout.stored_shape.size();

    // ImageData
    TagGroup image_data;
    image_data.add(std::string(tag_names::DataType), detail::integer_tag(static_cast<int64_t>(metadata.element_type)));
    image_data.add(std::string(tag_names::PixelDepth),
                   detail::integer_tag(static_cast<int64_t>(data_type_size(metadata.element_type))));
    TagGroup dimensions = TagGroup::list();
    for (auto it = layout.stored_shape.rbegin(); it != layout.stored_shape.rend(); ++it) {
        if (*it > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) [[unlikely]] {
            return Err(Error::Code::InvalidMetadata, "Axis size does not fit a signed 64-bit integer");
        }
        dimensions.add(std::string{}, detail::integer_tag(static_cast<int64_t>(*it)));
    }
    image_data.add(std::string(tag_names::Dimensions), std::move(dimensions));
    image_data.add(std::string(tag_names::Data),
                   TagArray{storage_layout(metadata.element_type), element_count, std::move(payload)});

    TagGroup calibrations;
    TagGroup dimension_list = TagGroup::list();
    for (auto it = layout.stored_calibrations.rbegin(); it != layout.stored_calibrations.rend(); ++it) {
        dimension_list.add(std::string{}, detail::calibration_group(*it));
    }
    calibrations.add(std::string(tag_names::Dimension), std::move(dimension_list));
    calibrations.add(std::string(tag_names::Brightness), detail::calibration_group(metadata.intensity_calibration));
    image_data.add(std::string(tag_names::Calibrations), std::move(calibrations));

    // ImageTags: vendor properties with the interpreted tags rewritten
    TagGroup image_tags = metadata.properties;
    image_tags.is_list = false;
    const bool eels = detail::has_eels_signal(image_tags);
    image_tags.remove(tag_names::Timestamp);
    image_tags.remove(tag_names::Timezone);
    image_tags.remove(tag_names::TimezoneOffset);

    std::optional<std::string_view> format;
    bool mark_eels = false;
    bool sliced = layout.sliced;
    if (eels && stored_rank == 1) {
        format = kFormatSpectrum;
        mark_eels = true;
    } else if (collection == 2 && datum == 1) {
        format = kFormatSpectrumImage;
        mark_eels = true;
        sliced = true;
    }
    // Derived tags always go last, in a fixed order
    if (auto* meta_data = image_tags.find_group(tag_names::MetaData)) {
        meta_data->remove(tag_names::Format);
        meta_data->remove(tag_names::IsSequence);
        if (mark_eels) {
            meta_data->remove(tag_names::Signal);
        }
    }
    if (datum == 1) {
        format = collection == 2 ? kFormatSpectrumImage : kFormatSpectrum;
    }
    if (format) {
        image_tags.group(std::string(tag_names::MetaData)).set(std::string(tag_names::Format), make_text(*format));
    }
    if (mark_eels) {
        image_tags.group(std::string(tag_names::MetaData)).set(std::string(tag_names::Signal), make_text(kSignalEELS));
    }
    if (sequence) {
        image_tags.group(std::string(tag_names::MetaData)).set(std::string(tag_names::IsSequence), detail::bool_tag(true));
    }
    if (metadata.timestamp) {
        image_tags.add(std::string(tag_names::Timestamp), make_text(format_iso_timestamp(*metadata.timestamp)));
    }
    if (metadata.timezone) {
        if (!metadata.timezone->name.empty()) {
            image_tags.add(std::string(tag_names::Timezone), make_text(std::string_view{metadata.timezone->name}));
        }
        image_tags.add(std::string(tag_names::TimezoneOffset),
                       make_text(format_utc_offset(metadata.timezone->utc_offset_minutes)));
    }

    TagGroup image;
    image.add(std::string(tag_names::ImageData), std::move(image_data));
    image.add(std::string(tag_names::ImageTags), std::move(image_tags));
    if (!metadata.title.empty()) {
        image.add(std::string(tag_names::Name), make_text(std::string_view{metadata.title}));
    }

    TagGroup root;
    TagGroup image_list = TagGroup::list();
    image_list.add(std::string{}, std::move(image));
    root.add(std::string(tag_names::ImageList), std::move(image_list));

    if (metadata.timestamp) {
        std::string time = format_short_time(*metadata.timestamp);
        if (metadata.timezone) {
            time += " " + format_utc_offset(metadata.timezone->utc_offset_minutes);
        }
        TagGroup data_bar;
        data_bar.add(std::string(tag_names::AcquisitionDate), make_text(format_short_date(*metadata.timestamp)));
        data_bar.add(std::string(tag_names::AcquisitionTime), make_text(time));
        root.add(std::string(tag_names::DataBar), std::move(data_bar));
    }

    TagGroup sources = TagGroup::list();
    TagGroup document_object;
    document_object.add("ImageSource", detail::integer_tag(0));
    document_object.add("AnnotationType", detail::integer_tag(20));
    if ((stored_sequence ? 1 : 0) + collection == 1 || sliced) {
        sources.add(std::string{}, detail::summed_image_source(stored_rank - 1));
        if (sliced) {
            TagGroup annotations = TagGroup::list();
            annotations.add(std::string{}, detail::si_cursor_annotation());
            document_object.add("AnnotationGroupList", std::move(annotations));
            document_object.add("ImageDisplayType", detail::integer_tag(1));
        }
    } else {
        sources.add(std::string{}, detail::simple_image_source());
    }
    root.add(std::string(tag_names::ImageSourceList), std::move(sources));

    TagGroup document_objects = TagGroup::list();
    document_objects.add(std::string{}, std::move(document_object));
    root.add(std::string(tag_names::DocumentObjectList), std::move(document_objects));

    TagGroup behavior;
    behavior.add("ViewDisplayID", detail::integer_tag(8));
    root.add(std::string(tag_names::ImageBehavior), std::move(behavior));
    root.add(std::string(tag_names::InImageMode), detail::bool_tag(true));

    log::debug("Built tag tree for {} image of stored rank {}{}", data_type_name(metadata.element_type), stored_rank,
               sequence ? " (sequence)" : "");
    return root;
}

} // namespace dmconcept
