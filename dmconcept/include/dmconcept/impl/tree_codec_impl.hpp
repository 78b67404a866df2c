// Do not include this file directly. Include "tree_codec.hpp" instead.

#pragma once

#include <array>
#include <cstring>
#include <limits>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "../log.hpp"
#include "../tag_stream.hpp"
#include "../tag_tree.hpp"
#include "../type_registry.hpp"
#include "../types.hpp"
#include "../types/result.hpp"

#ifndef DMCONCEPT_TREE_CODEC_HEADER
#include "../tree_codec.hpp" // for linters
#endif

namespace dmconcept {
namespace detail {

template <DmWidthPolicy Policy, typename Reader>
    requires RawReader<Reader>
[[nodiscard]] Result<uint64_t> read_length(TagStreamReader<Reader>& reader) noexcept {
    auto res = reader.template read<typename Policy::length_type>(kStructureEndian);
    if (res.is_error()) [[unlikely]] {
        return res.error();
    }
    return static_cast<uint64_t>(res.value());
}

/// Read a struct header: `length 0`, `length field_count`, per field `length 0`, `length type`
template <DmWidthPolicy Policy, typename Reader>
    requires RawReader<Reader>
[[nodiscard]] Result<std::vector<PrimitiveType>> read_struct_header(TagStreamReader<Reader>& reader) noexcept {
    const std::size_t start = reader.tell();
    auto name_length = read_length<Policy>(reader);
    if (name_length.is_error()) [[unlikely]] {
        return name_length.error();
    }
    if (name_length.value() != 0) [[unlikely]] {
        return Err(Error::Code::MalformedTag, "Struct name length must be zero", start);
    }

    auto field_count = read_length<Policy>(reader);
    if (field_count.is_error()) [[unlikely]] {
        return field_count.error();
    }
    if (field_count.value() > reader.remaining() / (2 * Policy::length_width)) [[unlikely]] {
        return Err(Error::Code::TruncatedInput,
                   "Struct declares " + std::to_string(field_count.value()) + " fields past end of stream",
                   reader.tell());
    }

    std::vector<PrimitiveType> fields;
    fields.reserve(static_cast<std::size_t>(field_count.value()));
    for (uint64_t i = 0; i < field_count.value(); ++i) {
        const std::size_t field_start = reader.tell();
        auto field_name_length = read_length<Policy>(reader);
        if (field_name_length.is_error()) [[unlikely]] {
            return field_name_length.error();
        }
        if (field_name_length.value() != 0) [[unlikely]] {
            return Err(Error::Code::MalformedTag, "Struct field name length must be zero", field_start);
        }
        const std::size_t type_start = reader.tell();
        auto code = read_length<Policy>(reader);
        if (code.is_error()) [[unlikely]] {
            return code.error();
        }
        if (code.value() == kStructTypeCode || code.value() == kArrayTypeCode) [[unlikely]] {
            return Err(Error::Code::MalformedTag, "Struct fields must be primitive", type_start);
        }
        auto type = primitive_type_from_code(code.value(), type_start);
        if (type.is_error()) [[unlikely]] {
            return type.error();
        }
        if (!width_of(type.value())) [[unlikely]] {
            return Err(Error::Code::MalformedTag, "Struct fields must have a fixed width", type_start);
        }
        fields.push_back(type.value());
    }
    return fields;
}

[[nodiscard]] inline Error info_count_mismatch(uint64_t declared, uint64_t expected, std::size_t offset) noexcept {
    return Err(Error::Code::MalformedTag,
               "Data block declares " + std::to_string(declared) + " info fields, expected " +
               std::to_string(expected),
               offset);
}

template <DmWidthPolicy Policy, typename Reader>
    requires RawReader<Reader>
[[nodiscard]] Result<TagValue> read_array(TagStreamReader<Reader>& reader, uint64_t info_count,
                                          std::size_t info_offset, const TreeDecodeOptions& options) noexcept {
    const std::size_t element_start = reader.tell();
    auto element_code = read_length<Policy>(reader);
    if (element_code.is_error()) [[unlikely]] {
        return element_code.error();
    }

    ElementLayout layout;
    if (element_code.value() == kStructTypeCode) {
        auto fields = read_struct_header<Policy>(reader);
        if (fields.is_error()) [[unlikely]] {
            return fields.error();
        }
        const uint64_t expected = 5 + 2 * static_cast<uint64_t>(fields.value().size());
        if (info_count != expected) [[unlikely]] {
            return info_count_mismatch(info_count, expected, info_offset);
        }
        layout = ElementLayout::structure(std::move(fields.value()));
    } else {
        if (element_code.value() == kArrayTypeCode) [[unlikely]] {
            return Err(Error::Code::MalformedTag, "Nested arrays are not supported", element_start);
        }
        auto type = primitive_type_from_code(element_code.value(), element_start);
        if (type.is_error()) [[unlikely]] {
            return type.error();
        }
        if (!width_of(type.value())) [[unlikely]] {
            return Err(Error::Code::MalformedTag, "Array elements must have a fixed width", element_start);
        }
        if (info_count != 3) [[unlikely]] {
            return info_count_mismatch(info_count, 3, info_offset);
        }
        layout = ElementLayout::of(type.value());
    }

    auto length = read_length<Policy>(reader);
    if (length.is_error()) [[unlikely]] {
        return length.error();
    }

    // element_width() is set: every member was checked above
    const uint64_t width = *layout.element_width();
    const uint64_t count = length.value();
    if (width != 0 && count > reader.remaining() / width) [[unlikely]] {
        return Err(Error::Code::TruncatedInput,
                   "Array of " + std::to_string(count) + " elements extends past end of stream",
                   reader.tell());
    }
    const uint64_t byte_length = count * width;

    TagArray array{std::move(layout), count, InlinePayload{}};
    if (byte_length > options.external_threshold) {
        const uint64_t offset = reader.tell();
        log::trace("Leaving {} array bytes at offset {} in the source", byte_length, offset);
        auto res = reader.skip(static_cast<std::size_t>(byte_length));
        if (res.is_error()) [[unlikely]] {
            return res.error();
        }
        array.payload = ExternalPayload{offset, byte_length};
        return TagValue{std::move(array)};
    }

    auto bytes = reader.read_bytes(static_cast<std::size_t>(byte_length));
    if (bytes.is_error()) [[unlikely]] {
        return bytes.error();
    }
    array.payload = InlinePayload{std::move(bytes.value())};
    return TagValue{std::move(array)};
}

template <DmWidthPolicy Policy, typename Reader>
    requires RawReader<Reader>
[[nodiscard]] Result<TagGroup> decode_group_at(TagStreamReader<Reader>& reader, const TreeDecodeOptions& options,
                                               std::size_t depth) noexcept;

template <DmWidthPolicy Policy, typename Reader>
    requires RawReader<Reader>
[[nodiscard]] Result<TagEntry> decode_tag_at(TagStreamReader<Reader>& reader, const TreeDecodeOptions& options,
                                             std::size_t depth) noexcept {
    const std::size_t start = reader.tell();
    auto kind = reader.read_u8();
    if (kind.is_error()) [[unlikely]] {
        return kind.error();
    }
    if (kind.value() != kGroupEntryKind && kind.value() != kDataEntryKind) [[unlikely]] {
        return Err(Error::Code::MalformedTag,
                   "Unknown tag entry kind " + std::to_string(kind.value()), start);
    }

    auto name_length = reader.read_u16(kStructureEndian);
    if (name_length.is_error()) [[unlikely]] {
        return name_length.error();
    }
    auto name = reader.read_string(name_length.value());
    if (name.is_error()) [[unlikely]] {
        return name.error();
    }

    if constexpr (Policy::has_entry_size) {
        // The entry size is informational; the nested structure is authoritative
        auto entry_size = read_length<Policy>(reader);
        if (entry_size.is_error()) [[unlikely]] {
            return entry_size.error();
        }
    }

    if (kind.value() == kGroupEntryKind) {
        auto group = decode_group_at<Policy>(reader, options, depth + 1);
        if (group.is_error()) [[unlikely]] {
            return group.error();
        }
        return TagEntry{std::move(name.value()), TagValue{std::move(group.value())}};
    }

    auto value = decode_data<Policy>(reader, options);
    if (value.is_error()) [[unlikely]] {
        return value.error();
    }
    return TagEntry{std::move(name.value()), std::move(value.value())};
}

template <DmWidthPolicy Policy, typename Reader>
    requires RawReader<Reader>
Result<TagGroup> decode_group_at(TagStreamReader<Reader>& reader, const TreeDecodeOptions& options,
                                 std::size_t depth) noexcept {
    const std::size_t start = reader.tell();
    if (depth > options.max_depth) [[unlikely]] {
        return Err(Error::Code::MalformedTag, "Tag groups nested too deeply", start);
    }

    auto is_dict = reader.read_u8();
    if (is_dict.is_error()) [[unlikely]] {
        return is_dict.error();
    }
    auto open = reader.read_u8();
    if (open.is_error()) [[unlikely]] {
        return open.error();
    }
    auto count = read_length<Policy>(reader);
    if (count.is_error()) [[unlikely]] {
        return count.error();
    }
    // An entry is at least a kind byte and a name length
    if (count.value() > reader.remaining() / 3) [[unlikely]] {
        return Err(Error::Code::TruncatedInput,
                   "Group declares " + std::to_string(count.value()) + " entries past end of stream",
                   reader.tell());
    }

    TagGroup group;
    group.is_list = is_dict.value() == 0;
    group.open = open.value() != 0;
    group.entries.reserve(static_cast<std::size_t>(count.value()));
    for (uint64_t i = 0; i < count.value(); ++i) {
        auto entry = decode_tag_at<Policy>(reader, options, depth);
        if (entry.is_error()) [[unlikely]] {
            return entry.error();
        }
        group.entries.push_back(std::move(entry.value()));
    }
    return group;
}

// ----------------------------------------------------------------------------
// Sizes
// ----------------------------------------------------------------------------

template <DmWidthPolicy Policy>
[[nodiscard]] Result<void> check_length_fits(uint64_t value, const char* what) noexcept {
    if (value > std::numeric_limits<typename Policy::length_type>::max()) [[unlikely]] {
        return Err(Error::Code::InvalidMetadata,
                   std::string(what) + " " + std::to_string(value) + " does not fit the file's length fields");
    }
    return Ok();
}

/// Bytes of a struct header (name length, count, per-field name length and type)
template <DmWidthPolicy Policy>
[[nodiscard]] constexpr uint64_t struct_header_size(std::size_t field_count) noexcept {
    return (2 + 2 * static_cast<uint64_t>(field_count)) * Policy::length_width;
}

template <DmWidthPolicy Policy>
[[nodiscard]] Result<uint64_t> data_block_size(const TagValue& value) noexcept {
    constexpr uint64_t W = Policy::length_width;
    // delimiter, info count, type code
    constexpr uint64_t prefix = kDataDelimiter.size() + 2 * W;

    if (const auto* scalar = std::get_if<TagScalar>(&value)) {
        if (const auto* text = std::get_if<std::u16string>(&scalar->value)) {
            auto fits = check_length_fits<Policy>(text->size() * 2, "String byte length");
            if (fits.is_error()) [[unlikely]] {
                return fits.error();
            }
        }
        return prefix + encoded_scalar_size<Policy>(scalar->value);
    }

    if (const auto* structure = std::get_if<TagStruct>(&value)) {
        uint64_t values = 0;
        for (const auto& field : structure->fields) {
            auto width = width_of(type_of(field));
            if (!width) [[unlikely]] {
                return Err(Error::Code::InvalidMetadata, "Struct fields must have a fixed width");
            }
            values += *width;
        }
        return prefix + struct_header_size<Policy>(structure->fields.size()) + values;
    }

    const auto& array = std::get<TagArray>(value);
    auto width = array.layout.element_width();
    if (!width) [[unlikely]] {
        return Err(Error::Code::InvalidMetadata, "Array elements must have a fixed width");
    }
    auto fits = check_length_fits<Policy>(array.length, "Array length");
    if (fits.is_error()) [[unlikely]] {
        return fits.error();
    }
    if (*width != 0 && array.length > std::numeric_limits<uint64_t>::max() / *width) [[unlikely]] {
        return Err(Error::Code::InvalidMetadata, "Array byte size overflows");
    }
    const uint64_t expected = array.length * *width;
    if (array.byte_length() != expected) [[unlikely]] {
        return Err(Error::Code::InvalidMetadata,
                   "Array holds " + std::to_string(array.byte_length()) + " payload bytes, expected " +
                   std::to_string(expected));
    }

    // element type and length
    uint64_t header = 2 * W;
    if (array.layout.is_struct) {
        header += struct_header_size<Policy>(array.layout.fields.size());
    }
    return prefix + header + expected;
}

template <DmWidthPolicy Policy>
[[nodiscard]] uint64_t info_count_of(const TagValue& value) noexcept {
    if (const auto* scalar = std::get_if<TagScalar>(&value)) {
        return std::holds_alternative<std::u16string>(scalar->value) ? 2 : 1;
    }
    if (const auto* structure = std::get_if<TagStruct>(&value)) {
        return 3 + 2 * static_cast<uint64_t>(structure->fields.size());
    }
    const auto& array = std::get<TagArray>(value);
    return array.layout.is_struct ? 5 + 2 * static_cast<uint64_t>(array.layout.fields.size()) : 3;
}

// ----------------------------------------------------------------------------
// Encoding helpers
// ----------------------------------------------------------------------------

template <DmWidthPolicy Policy, typename Writer>
    requires RawWriter<Writer>
[[nodiscard]] Result<void> write_length(TagStreamWriter<Writer>& writer, uint64_t value) noexcept {
    return writer.template write<typename Policy::length_type>(
        static_cast<typename Policy::length_type>(value), kStructureEndian);
}

template <DmWidthPolicy Policy, typename Writer>
    requires RawWriter<Writer>
[[nodiscard]] Result<void> write_struct_header(TagStreamWriter<Writer>& writer,
                                               std::span<const PrimitiveType> fields) noexcept {
    auto res = write_length<Policy>(writer, 0);
    if (res.is_error()) [[unlikely]] {
        return res;
    }
    res = write_length<Policy>(writer, fields.size());
    if (res.is_error()) [[unlikely]] {
        return res;
    }
    for (PrimitiveType field : fields) {
        res = write_length<Policy>(writer, 0);
        if (res.is_error()) [[unlikely]] {
            return res;
        }
        res = write_length<Policy>(writer, static_cast<uint64_t>(field));
        if (res.is_error()) [[unlikely]] {
            return res;
        }
    }
    return Ok();
}

} // namespace detail

// ============================================================================
// Decoding
// ============================================================================

template <DmWidthPolicy Policy, typename Reader>
    requires RawReader<Reader>
Result<TagGroup> decode_group(TagStreamReader<Reader>& reader, const TreeDecodeOptions& options) noexcept {
    return detail::decode_group_at<Policy>(reader, options, 0);
}

template <DmWidthPolicy Policy, typename Reader>
    requires RawReader<Reader>
Result<TagEntry> decode_tag(TagStreamReader<Reader>& reader, const TreeDecodeOptions& options) noexcept {
    return detail::decode_tag_at<Policy>(reader, options, 0);
}

template <DmWidthPolicy Policy, typename Reader>
    requires RawReader<Reader>
Result<TagValue> decode_data(TagStreamReader<Reader>& reader, const TreeDecodeOptions& options) noexcept {
    const std::size_t start = reader.tell();
    std::array<std::byte, 4> delimiter{};
    auto res = reader.read_into(delimiter);
    if (res.is_error()) [[unlikely]] {
        return res.error();
    }
    if (std::memcmp(delimiter.data(), kDataDelimiter.data(), kDataDelimiter.size()) != 0) [[unlikely]] {
        return Err(Error::Code::MalformedTag, "Missing %%%% data block delimiter", start);
    }

    const std::size_t info_offset = reader.tell();
    auto info_count = detail::read_length<Policy>(reader);
    if (info_count.is_error()) [[unlikely]] {
        return info_count.error();
    }
    const std::size_t type_offset = reader.tell();
    auto code = detail::read_length<Policy>(reader);
    if (code.is_error()) [[unlikely]] {
        return code.error();
    }

    if (code.value() == kArrayTypeCode) {
        return detail::read_array<Policy>(reader, info_count.value(), info_offset, options);
    }

    if (code.value() == kStructTypeCode) {
        auto fields = detail::read_struct_header<Policy>(reader);
        if (fields.is_error()) [[unlikely]] {
            return fields.error();
        }
        const uint64_t expected = 3 + 2 * static_cast<uint64_t>(fields.value().size());
        if (info_count.value() != expected) [[unlikely]] {
            return detail::info_count_mismatch(info_count.value(), expected, info_offset);
        }
        TagStruct structure;
        structure.fields.reserve(fields.value().size());
        for (PrimitiveType field : fields.value()) {
            auto value = decode_scalar<Policy>(field, reader);
            if (value.is_error()) [[unlikely]] {
                return value.error();
            }
            structure.fields.push_back(std::move(value.value()));
        }
        return TagValue{std::move(structure)};
    }

    auto type = primitive_type_from_code(code.value(), type_offset);
    if (type.is_error()) [[unlikely]] {
        return type.error();
    }
    const uint64_t expected = type.value() == PrimitiveType::String ? 2 : 1;
    if (info_count.value() != expected) [[unlikely]] {
        return detail::info_count_mismatch(info_count.value(), expected, info_offset);
    }
    auto value = decode_scalar<Policy>(type.value(), reader);
    if (value.is_error()) [[unlikely]] {
        return value.error();
    }
    return TagValue{TagScalar{std::move(value.value())}};
}

// ============================================================================
// Size computation
// ============================================================================

template <DmWidthPolicy Policy>
Result<uint64_t> encoded_size(const TagGroup& group) noexcept {
    auto fits = detail::check_length_fits<Policy>(group.entries.size(), "Group entry count");
    if (fits.is_error()) [[unlikely]] {
        return fits.error();
    }
    uint64_t total = 2 + Policy::length_width;
    for (const auto& entry : group.entries) {
        auto size = encoded_size<Policy>(entry, group.is_list);
        if (size.is_error()) [[unlikely]] {
            return size.error();
        }
        total += size.value();
    }
    return total;
}

template <DmWidthPolicy Policy>
Result<uint64_t> encoded_size(const TagEntry& entry, bool as_list_item) noexcept {
    const std::size_t name_size = as_list_item ? 0 : entry.name.size();
    if (name_size > std::numeric_limits<uint16_t>::max()) [[unlikely]] {
        return Err(Error::Code::InvalidMetadata, "Tag name longer than 65535 bytes");
    }
    auto body = encoded_size<Policy>(entry.value);
    if (body.is_error()) [[unlikely]] {
        return body.error();
    }
    uint64_t total = 1 + 2 + name_size + body.value();
    if constexpr (Policy::has_entry_size) {
        total += Policy::length_width;
    }
    return total;
}

template <DmWidthPolicy Policy>
Result<uint64_t> encoded_size(const TagValue& value) noexcept {
    if (const auto* group = std::get_if<TagGroup>(&value)) {
        return encoded_size<Policy>(*group);
    }
    return detail::data_block_size<Policy>(value);
}

// ============================================================================
// Encoding
// ============================================================================

template <DmWidthPolicy Policy, typename Writer, typename Emitter>
    requires RawWriter<Writer> && PayloadEmitter<Emitter>
Result<void> encode_group(const TagGroup& group, TagStreamWriter<Writer>& writer, Emitter&& emit) noexcept {
    auto res = writer.write_u8(group.is_list ? 0 : 1);
    if (res.is_error()) [[unlikely]] {
        return res;
    }
    res = writer.write_u8(group.open ? 1 : 0);
    if (res.is_error()) [[unlikely]] {
        return res;
    }
    res = detail::write_length<Policy>(writer, group.entries.size());
    if (res.is_error()) [[unlikely]] {
        return res;
    }
    for (const auto& entry : group.entries) {
        res = encode_tag<Policy>(entry, writer, emit, group.is_list);
        if (res.is_error()) [[unlikely]] {
            return res;
        }
    }
    return Ok();
}

template <DmWidthPolicy Policy, typename Writer, typename Emitter>
    requires RawWriter<Writer> && PayloadEmitter<Emitter>
Result<void> encode_tag(const TagEntry& entry, TagStreamWriter<Writer>& writer, Emitter&& emit,
                        bool as_list_item) noexcept {
    const bool is_group = std::holds_alternative<TagGroup>(entry.value);
    const std::string_view name = as_list_item ? std::string_view{} : std::string_view{entry.name};
    if (name.size() > std::numeric_limits<uint16_t>::max()) [[unlikely]] {
        return Err(Error::Code::InvalidMetadata, "Tag name longer than 65535 bytes");
    }

    auto res = writer.write_u8(is_group ? kGroupEntryKind : kDataEntryKind);
    if (res.is_error()) [[unlikely]] {
        return res;
    }
    res = writer.write_u16(static_cast<uint16_t>(name.size()), kStructureEndian);
    if (res.is_error()) [[unlikely]] {
        return res;
    }
    res = writer.write_string(name);
    if (res.is_error()) [[unlikely]] {
        return res;
    }

    if constexpr (Policy::has_entry_size) {
        auto body = encoded_size<Policy>(entry.value);
        if (body.is_error()) [[unlikely]] {
            return body.error();
        }
        res = detail::write_length<Policy>(writer, body.value());
        if (res.is_error()) [[unlikely]] {
            return res;
        }
    }

    if (is_group) {
        return encode_group<Policy>(std::get<TagGroup>(entry.value), writer, emit);
    }
    return encode_data<Policy>(entry.value, writer, emit);
}

template <DmWidthPolicy Policy, typename Writer, typename Emitter>
    requires RawWriter<Writer> && PayloadEmitter<Emitter>
Result<void> encode_data(const TagValue& value, TagStreamWriter<Writer>& writer, Emitter&& emit) noexcept {
    if (std::holds_alternative<TagGroup>(value)) [[unlikely]] {
        return Err(Error::Code::InvalidMetadata, "A group has no data block");
    }

    auto res = writer.write_bytes(std::as_bytes(std::span(kDataDelimiter)));
    if (res.is_error()) [[unlikely]] {
        return res;
    }
    res = detail::write_length<Policy>(writer, detail::info_count_of<Policy>(value));
    if (res.is_error()) [[unlikely]] {
        return res;
    }

    if (const auto* scalar = std::get_if<TagScalar>(&value)) {
        res = detail::write_length<Policy>(writer, static_cast<uint64_t>(scalar->type()));
        if (res.is_error()) [[unlikely]] {
            return res;
        }
        return encode_scalar<Policy>(scalar->value, writer);
    }

    if (const auto* structure = std::get_if<TagStruct>(&value)) {
        res = detail::write_length<Policy>(writer, kStructTypeCode);
        if (res.is_error()) [[unlikely]] {
            return res;
        }
        const auto layout = structure->layout();
        res = detail::write_struct_header<Policy>(writer, layout);
        if (res.is_error()) [[unlikely]] {
            return res;
        }
        for (const auto& field : structure->fields) {
            res = encode_scalar<Policy>(field, writer);
            if (res.is_error()) [[unlikely]] {
                return res;
            }
        }
        return Ok();
    }

    const auto& array = std::get<TagArray>(value);
    res = detail::write_length<Policy>(writer, kArrayTypeCode);
    if (res.is_error()) [[unlikely]] {
        return res;
    }
    if (array.layout.is_struct) {
        res = detail::write_length<Policy>(writer, kStructTypeCode);
        if (res.is_error()) [[unlikely]] {
            return res;
        }
        res = detail::write_struct_header<Policy>(writer, array.layout.fields);
    } else {
        res = detail::write_length<Policy>(writer, static_cast<uint64_t>(array.layout.primitive));
    }
    if (res.is_error()) [[unlikely]] {
        return res;
    }
    res = detail::write_length<Policy>(writer, array.length);
    if (res.is_error()) [[unlikely]] {
        return res;
    }

    if (const auto* owned = std::get_if<InlinePayload>(&array.payload)) {
        return writer.write_bytes(owned->bytes);
    }

    const auto& external = std::get<ExternalPayload>(array.payload);
    const uint64_t dest_offset = writer.tell();
    // Commit the header so the emitter writes after it
    res = writer.seek(static_cast<std::size_t>(dest_offset));
    if (res.is_error()) [[unlikely]] {
        return res;
    }
    res = emit(external, dest_offset);
    if (res.is_error()) [[unlikely]] {
        return res;
    }
    return writer.seek(static_cast<std::size_t>(dest_offset + external.byte_length));
}

} // namespace dmconcept
