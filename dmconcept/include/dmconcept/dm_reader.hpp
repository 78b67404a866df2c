#pragma once

/**
 * @file dm_reader.hpp
 * @brief Decoding of complete DM3/DM4 files
 *
 * Decoding runs ReadHeader, ReadVersionMarker, SelectWidthPolicy,
 * ReadRootGroup, LocatePixelRegion and MaterializeArray in that order. The
 * version marker is checked before any tag is parsed and selects the width
 * policy once for the whole tree.
 *
 * ## Example Usage
 *
 * ```cpp
 * StreamFileReader file;
 * if (auto res = file.open("spectrum.dm4"); res.is_error()) { ... }
 *
 * auto decoded = decode(file);
 * if (decoded.is_ok()) {
 *     const NDArray& array = decoded.value().array;
 *     const ArrayMetadata& metadata = decoded.value().metadata;
 * }
 *
 * // Large files: stream the payload into a store of your own
 * StreamFileWriter store;
 * if (auto res = store.open("payload.raw"); res.is_error()) { ... }
 * auto metadata = decode_into(file, store, CodecOptions{StreamingParams::always(4 << 20)});
 * ```
 */

#include <cstdint>
#include "array.hpp"
#include "log.hpp"
#include "reader_base.hpp"
#include "readers/reader_buffer.hpp"
#include "strategy/stream_strategy.hpp"
#include "tag_extraction.hpp"
#include "tag_stream.hpp"
#include "tag_tree.hpp"
#include "tree_codec.hpp"
#include "types.hpp"
#include "types/result.hpp"

namespace dmconcept {

/// @brief The fixed fields preceding the root group
struct FileHeader {
    DmVersion version = DmVersion::DM4;
    uint64_t file_size = 0;     ///< Root group size + 4, as stored
    int32_t byte_order = kLittleEndianPayloadFlag;
};

/// @brief A decoded tag file: version and root group
struct TagFile {
    DmVersion version = DmVersion::DM4;
    TagGroup root;
};

/// @brief Read the file header at the cursor
/// @return UnsupportedVersion for a version marker other than 3 or 4, or a
/// byte order flag other than little-endian; TruncatedInput for short input
/// or a declared tree size that does not fit the source
template <typename Reader>
    requires RawReader<Reader>
[[nodiscard]] Result<FileHeader> read_file_header(TagStreamReader<Reader>& stream) noexcept;

/// @brief Decode the header and the whole tag tree of a file
/// @param options Arrays larger than `options.external_threshold` are left in the source
template <typename Reader>
    requires RawReader<Reader>
[[nodiscard]] Result<TagFile> read_tag_file(const Reader& reader, const TreeDecodeOptions& options = {}) noexcept;

/// @brief Decode the primary image of a file into memory
/// @details Payloads above `options.streaming.threshold_bytes` are not held
/// twice: the tag tree leaves them in the source and they are copied chunk by
/// chunk into the array.
/// @return The array and its metadata, or TruncatedInput, MalformedTag,
/// UnknownTypeCode, UnsupportedVersion, UnrecognizedLayout, SourceReadError
template <typename Reader>
    requires RawReader<Reader>
[[nodiscard]] Result<DecodedImage> decode(const Reader& reader, const CodecOptions& options = {}) noexcept;

/// @brief Decode the metadata and stream the payload into a caller store
/// @details `store` is resized to the array byte size and receives the
/// elements in array order (outermost axis first, little-endian). Peak
/// memory is bounded by the chunk size plus the tag tree.
template <typename Reader, typename Store>
    requires RawReader<Reader> && RawWriter<Store>
[[nodiscard]] Result<ArrayMetadata> decode_into(const Reader& reader, Store& store,
                                                const CodecOptions& options = {}) noexcept;

} // namespace dmconcept

#define DMCONCEPT_DM_READER_HEADER
#include "impl/dm_reader_impl.hpp"
