// Do not include this file directly. Include "dm_writer.hpp" instead.

#pragma once

#include <limits>
#include <new>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#ifndef DMCONCEPT_DM_WRITER_HEADER
#include "../dm_writer.hpp" // for linters
#endif

namespace dmconcept {
namespace detail {

/// First array of `group` whose payload is not held by the tree
[[nodiscard]] inline const TagEntry* find_external_array(const TagGroup& group) noexcept {
    for (const auto& entry : group.entries) {
        if (const auto* child = std::get_if<TagGroup>(&entry.value)) {
            if (const auto* found = find_external_array(*child)) {
                return found;
            }
        } else if (const auto* array = std::get_if<TagArray>(&entry.value); array != nullptr && !array->is_inline()) {
            return &entry;
        }
    }
    return nullptr;
}

} // namespace detail

template <DmVersion Version>
Result<uint64_t> DmWriter<Version>::file_size(const TagGroup& root) noexcept {
    auto root_size = encoded_size<Policy>(root);
    if (root_size.is_error()) [[unlikely]] {
        return root_size.error();
    }
    return Policy::header_size + root_size.value() + kTrailerSize;
}

template <DmVersion Version>
template <typename Writer, typename Emitter>
    requires RawWriter<Writer> && PayloadEmitter<Emitter>
Result<void> DmWriter<Version>::write_tag_file(const TagGroup& root, Writer& writer, Emitter&& emit) noexcept {
    auto root_size = encoded_size<Policy>(root);
    if (root_size.is_error()) [[unlikely]] {
        return root_size.error();
    }

    // The header stores the root group size plus 4
    const uint64_t size_field = root_size.value() + 4;
    if (size_field > std::numeric_limits<typename Policy::length_type>::max()) [[unlikely]] {
        return Err(Error::Code::InvalidMetadata,
                   "Tag tree of " + std::to_string(root_size.value()) + " bytes does not fit a DM3 file");
    }
    const uint64_t total = Policy::header_size + root_size.value() + kTrailerSize;
    if (total > std::numeric_limits<std::size_t>::max()) [[unlikely]] {
        return Err(Error::Code::InvalidMetadata, "File size exceeds the addressable range");
    }

    auto res = writer.resize(static_cast<std::size_t>(total));
    if (res.is_error()) [[unlikely]] {
        return Err(Error::Code::SinkWriteError, "Failed to size the output: " + res.error().message);
    }

    TagStreamWriter<Writer> stream(writer, 0);
    res = stream.write_i32(static_cast<int32_t>(Version), kStructureEndian);
    if (res.is_error()) [[unlikely]] {
        return res;
    }
    res = stream.write(static_cast<typename Policy::length_type>(size_field), kStructureEndian);
    if (res.is_error()) [[unlikely]] {
        return res;
    }
    res = stream.write_i32(kLittleEndianPayloadFlag, kStructureEndian);
    if (res.is_error()) [[unlikely]] {
        return res;
    }

    res = encode_group<Policy>(root, stream, std::forward<Emitter>(emit));
    if (res.is_error()) [[unlikely]] {
        return res;
    }
    res = stream.write_zeros(kTrailerSize);
    if (res.is_error()) [[unlikely]] {
        return res;
    }

    if (stream.tell() != total) [[unlikely]] {
        return Err(Error::Code::SinkWriteError,
                   "Wrote " + std::to_string(stream.tell()) + " bytes, layout computed " + std::to_string(total),
                   stream.tell());
    }
    res = stream.flush();
    if (res.is_error()) [[unlikely]] {
        return res;
    }

    log::debug("Wrote DM{} file of {} bytes", static_cast<int>(Version), total);
    return Ok();
}

template <DmVersion Version>
template <typename Store, typename Writer>
    requires RawReader<Store> && RawWriter<Writer>
Result<void> DmWriter<Version>::encode_from(const Store& store, const ArrayMetadata& metadata, Writer& writer) noexcept {
    auto store_size = store.size();
    if (store_size.is_error()) [[unlikely]] {
        return Err(Error::Code::SourceReadError, "Failed to query the array store: " + store_size.error().message);
    }
    const uint64_t payload_bytes = metadata.byte_size();
    if (store_size.value() != payload_bytes) [[unlikely]] {
        return Err(Error::Code::InvalidMetadata,
                   "Array store holds " + std::to_string(store_size.value()) + " bytes, metadata implies " +
                   std::to_string(payload_bytes));
    }

    auto times = validate_time_fields(metadata);
    if (times.is_error()) [[unlikely]] {
        return times;
    }
    if (const auto* external = detail::find_external_array(metadata.properties)) [[unlikely]] {
        return Err(Error::Code::InvalidMetadata,
                   "Property " + external->name + " refers to bytes outside the metadata");
    }

    auto planned = plan_stored_layout(metadata);
    if (planned.is_error()) [[unlikely]] {
        return planned.error();
    }
    const StoredLayout& layout = planned.value();
    const std::size_t element_size = data_type_size(metadata.element_type);

    if (!options_.streaming.should_stream(payload_bytes)) {
        std::vector<std::byte> stored;
        std::vector<std::byte> moved;
        try {
            stored.resize(static_cast<std::size_t>(payload_bytes));
            if (layout.transpose) {
                moved.resize(stored.size());
            }
        } catch (const std::bad_alloc&) {
            return Err(Error::Code::MemoryError,
                       "Failed to allocate " + std::to_string(payload_bytes) + " payload bytes");
        }
        if (!stored.empty()) {
            auto res = store.read_into(stored.data(), 0, stored.size());
            if (res.is_error()) [[unlikely]] {
                return Err(Error::Code::SourceReadError, "Failed to read the array store: " + res.error().message);
            }
        }
        if (layout.transpose) {
            transpose_bytes(stored, moved, static_cast<std::size_t>(layout.transpose->rows),
                            static_cast<std::size_t>(layout.transpose->cols), element_size);
            stored.swap(moved);
        }

        auto tree = build_image_tree(metadata, InlinePayload{std::move(stored)});
        if (tree.is_error()) [[unlikely]] {
            return tree.error();
        }
        return write_tag_file(tree.value(), writer);
    }

    auto tree = build_image_tree(metadata, ExternalPayload{0, payload_bytes});
    if (tree.is_error()) [[unlikely]] {
        return tree.error();
    }

    ChunkedCopier copier(options_.streaming);
    const ExternalPayload pixels{0, payload_bytes};
    auto emit = [&](const ExternalPayload& payload, uint64_t dest_offset) -> Result<void> {
        if (payload != pixels) [[unlikely]] {
            return Err(Error::Code::InvalidMetadata, "Only the image payload is read from the array store",
                       dest_offset);
        }
        if (layout.transpose) {
            return copier.transpose(store, payload.offset, writer, dest_offset,
                                    layout.transpose->rows, layout.transpose->cols, element_size);
        }
        return copier.copy(store, payload.offset, writer, dest_offset, payload.byte_length);
    };
    auto res = write_tag_file(tree.value(), writer, emit);
    if (res.is_error()) [[unlikely]] {
        return res;
    }
    log::debug("Streamed {} payload bytes to the sink in {} chunk reads", payload_bytes, copier.chunks_moved());
    return Ok();
}

template <DmVersion Version>
template <typename Writer>
    requires RawWriter<Writer>
Result<void> DmWriter<Version>::encode(const NDArray& array, const ArrayMetadata& metadata, Writer& writer) noexcept {
    auto valid = validate_metadata(metadata, array.element_type, array.shape);
    if (valid.is_error()) [[unlikely]] {
        return valid;
    }
    if (array.data.size() != array.byte_size()) [[unlikely]] {
        return Err(Error::Code::InvalidMetadata,
                   "Array holds " + std::to_string(array.data.size()) + " bytes, its shape implies " +
                   std::to_string(array.byte_size()));
    }
    BufferViewReader store{std::span<const std::byte>(array.data)};
    return encode_from(store, metadata, writer);
}

template <typename Writer>
    requires RawWriter<Writer>
Result<void> encode(const NDArray& array, const ArrayMetadata& metadata, Writer& writer,
                    DmVersion version, const CodecOptions& options) noexcept {
    if (version == DmVersion::DM3) {
        return DmWriter<DmVersion::DM3>(options).encode(array, metadata, writer);
    }
    return DmWriter<DmVersion::DM4>(options).encode(array, metadata, writer);
}

template <typename Store, typename Writer>
    requires RawReader<Store> && RawWriter<Writer>
Result<void> encode_from(const Store& store, const ArrayMetadata& metadata, Writer& writer,
                         DmVersion version, const CodecOptions& options) noexcept {
    if (version == DmVersion::DM3) {
        return DmWriter<DmVersion::DM3>(options).encode_from(store, metadata, writer);
    }
    return DmWriter<DmVersion::DM4>(options).encode_from(store, metadata, writer);
}

template <typename Writer>
    requires RawWriter<Writer>
Result<void> write_tag_file(const TagGroup& root, Writer& writer, DmVersion version) noexcept {
    if (version == DmVersion::DM3) {
        return DmWriter<DmVersion::DM3>().write_tag_file(root, writer);
    }
    return DmWriter<DmVersion::DM4>().write_tag_file(root, writer);
}

} // namespace dmconcept
