// Do not include this file directly. Include "dm_reader.hpp" instead.

#pragma once

#include <new>
#include <span>
#include <string>
#include <utility>
#include <variant>

#ifndef DMCONCEPT_DM_READER_HEADER
#include "../dm_reader.hpp" // for linters
#endif

namespace dmconcept {
namespace detail {

[[nodiscard]] constexpr int version_number(DmVersion version) noexcept {
    return static_cast<int>(version);
}

/// Move the payload of `image` from `source` (or from the tree when inline) to `dest` in array order
template <typename Reader, typename Writer>
    requires RawReader<Reader> && RawWriter<Writer>
[[nodiscard]] Result<void> stream_payload(const Reader& source, const ExtractedImage& image,
                                          Writer& dest, ChunkedCopier& copier) noexcept {
    const TagArray& data = *image.data;
    const std::size_t element_size = data_type_size(image.metadata.element_type);

    auto move_from = [&](const auto& src, uint64_t src_offset) -> Result<void> {
        if (image.transpose) {
            return copier.transpose(src, src_offset, dest, 0, image.transpose->rows, image.transpose->cols,
                                    element_size);
        }
        return copier.copy(src, src_offset, dest, 0, data.byte_length());
    };

    if (data.is_inline()) {
        BufferViewReader tree_bytes(data.bytes());
        return move_from(tree_bytes, 0);
    }
    return move_from(source, std::get<ExternalPayload>(data.payload).offset);
}

/// Read every array `group` left in `source` into the tree
template <typename Reader>
    requires RawReader<Reader>
[[nodiscard]] Result<void> load_external_payloads(const Reader& source, TagGroup& group) noexcept {
    for (auto& entry : group.entries) {
        if (auto* child = std::get_if<TagGroup>(&entry.value)) {
            auto res = load_external_payloads(source, *child);
            if (res.is_error()) [[unlikely]] {
                return res;
            }
            continue;
        }
        auto* array = std::get_if<TagArray>(&entry.value);
        if (array == nullptr || array->is_inline()) {
            continue;
        }
        const ExternalPayload external = std::get<ExternalPayload>(array->payload);
        InlinePayload loaded;
        try {
            loaded.bytes.resize(static_cast<std::size_t>(external.byte_length));
        } catch (const std::bad_alloc&) {
            return Err(Error::Code::MemoryError,
                       "Failed to allocate " + std::to_string(external.byte_length) + " bytes for tag " + entry.name);
        }
        if (!loaded.bytes.empty()) {
            auto res = source.read_into(loaded.bytes.data(), static_cast<std::size_t>(external.offset),
                                        loaded.bytes.size());
            if (res.is_error()) [[unlikely]] {
                return Err(Error::Code::SourceReadError,
                           "Failed to read tag " + entry.name + ": " + res.error().message, external.offset);
            }
        }
        array->payload = std::move(loaded);
    }
    return Ok();
}

} // namespace detail

template <typename Reader>
    requires RawReader<Reader>
Result<FileHeader> read_file_header(TagStreamReader<Reader>& stream) noexcept {
    const std::size_t start = stream.tell();
    auto marker = stream.read_i32(kStructureEndian);
    if (marker.is_error()) [[unlikely]] {
        return marker.error();
    }
    auto version = version_from_marker(marker.value());
    if (!version) [[unlikely]] {
        return Err(Error::Code::UnsupportedVersion,
                   "Unsupported DM version marker " + std::to_string(marker.value()), start);
    }

    FileHeader header;
    header.version = *version;
    const std::size_t size_offset = stream.tell();
    if (header.version == DmVersion::DM3) {
        auto size = stream.read_u32(kStructureEndian);
        if (size.is_error()) [[unlikely]] {
            return size.error();
        }
        header.file_size = size.value();
    } else {
        auto size = stream.read_u64(kStructureEndian);
        if (size.is_error()) [[unlikely]] {
            return size.error();
        }
        header.file_size = size.value();
    }

    const std::size_t flag_offset = stream.tell();
    auto byte_order = stream.read_i32(kStructureEndian);
    if (byte_order.is_error()) [[unlikely]] {
        return byte_order.error();
    }
    header.byte_order = byte_order.value();
    if (header.byte_order != kLittleEndianPayloadFlag) [[unlikely]] {
        return Err(Error::Code::UnsupportedVersion,
                   "Unsupported byte order flag " + std::to_string(header.byte_order), flag_offset);
    }

    // Some writers leave out the 4 extra bytes; the smaller size must fit
    const uint64_t root_size = header.file_size >= 4 ? header.file_size - 4 : 0;
    if (root_size > stream.remaining()) [[unlikely]] {
        return Err(Error::Code::TruncatedInput,
                   "Header declares a " + std::to_string(root_size) + " byte tag tree but only " +
                   std::to_string(stream.remaining()) + " bytes follow",
                   size_offset);
    }

    log::debug("DM{} header, declared size {}", detail::version_number(header.version), header.file_size);
    return header;
}

template <typename Reader>
    requires RawReader<Reader>
Result<TagFile> read_tag_file(const Reader& reader, const TreeDecodeOptions& options) noexcept {
    auto stream_result = TagStreamReader<Reader>::open(reader);
    if (stream_result.is_error()) [[unlikely]] {
        return stream_result.error();
    }
    auto& stream = stream_result.value();

    auto header = read_file_header(stream);
    if (header.is_error()) [[unlikely]] {
        return header.error();
    }

    TagFile file;
    file.version = header.value().version;
    auto root = file.version == DmVersion::DM3
        ? decode_group<WidthPolicy<DmVersion::DM3>>(stream, options)
        : decode_group<WidthPolicy<DmVersion::DM4>>(stream, options);
    if (root.is_error()) [[unlikely]] {
        return root.error();
    }
    file.root = std::move(root.value());
    // The 8-byte trailer after the root group is not required
    return file;
}

template <typename Reader>
    requires RawReader<Reader>
Result<DecodedImage> decode(const Reader& reader, const CodecOptions& options) noexcept {
    auto file = read_tag_file(reader, TreeDecodeOptions{options.streaming.external_threshold()});
    if (file.is_error()) [[unlikely]] {
        return file.error();
    }
    auto image = extract_image(file.value().root);
    if (image.is_error()) [[unlikely]] {
        return image.error();
    }
    ExtractedImage& extracted = image.value();
    // Vendor arrays are read in full, the source is not kept
    auto loaded = detail::load_external_payloads(reader, extracted.metadata.properties);
    if (loaded.is_error()) [[unlikely]] {
        return loaded.error();
    }

    if (extracted.data->is_inline()) {
        auto array = materialize_array(extracted);
        if (array.is_error()) [[unlikely]] {
            return array.error();
        }
        return DecodedImage{std::move(array.value()), std::move(extracted.metadata)};
    }

    log::debug("Streaming {} payload bytes from the source", extracted.data->byte_length());
    NDArray array;
    array.element_type = extracted.metadata.element_type;
    array.shape = extracted.shape();
    try {
        array.data.resize(static_cast<std::size_t>(extracted.byte_size()));
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError,
                   "Failed to allocate " + std::to_string(extracted.byte_size()) + " array bytes");
    }

    BufferViewWriter dest{std::span<std::byte>(array.data)};
    ChunkedCopier copier(options.streaming);
    auto res = detail::stream_payload(reader, extracted, dest, copier);
    if (res.is_error()) [[unlikely]] {
        return res.error();
    }
    return DecodedImage{std::move(array), std::move(extracted.metadata)};
}

template <typename Reader, typename Store>
    requires RawReader<Reader> && RawWriter<Store>
Result<ArrayMetadata> decode_into(const Reader& reader, Store& store, const CodecOptions& options) noexcept {
    auto file = read_tag_file(reader, TreeDecodeOptions{options.streaming.external_threshold()});
    if (file.is_error()) [[unlikely]] {
        return file.error();
    }
    auto image = extract_image(file.value().root);
    if (image.is_error()) [[unlikely]] {
        return image.error();
    }
    ExtractedImage& extracted = image.value();
    // Vendor arrays are read in full, the source is not kept
    auto loaded = detail::load_external_payloads(reader, extracted.metadata.properties);
    if (loaded.is_error()) [[unlikely]] {
        return loaded.error();
    }

    auto res = store.resize(static_cast<std::size_t>(extracted.byte_size()));
    if (res.is_error()) [[unlikely]] {
        return Err(Error::Code::SinkWriteError, "Failed to size the array store: " + res.error().message);
    }

    ChunkedCopier copier(options.streaming);
    res = detail::stream_payload(reader, extracted, store, copier);
    if (res.is_error()) [[unlikely]] {
        return res.error();
    }
    res = store.flush();
    if (res.is_error()) [[unlikely]] {
        return Err(Error::Code::SinkWriteError, "Failed to flush the array store: " + res.error().message);
    }
    log::debug("Streamed {} payload bytes into the store in {} chunk reads",
               extracted.byte_size(), copier.chunks_moved());
    return std::move(extracted.metadata);
}

} // namespace dmconcept
