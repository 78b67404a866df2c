#pragma once

/**
 * @file dm_writer.hpp
 * @brief Encoding of complete DM3/DM4 files
 *
 * Encoding runs BuildTagTree, ComputeLayout, WriteHeader, WriteRootGroup and
 * WritePixelRegion. The size of every group and entry is computed before the
 * first byte is written, so the header file size and the DM4 entry sizes are
 * final when they are written and nothing is patched afterwards. The pixel
 * payload is written in place inside the Data array of the root group.
 *
 * ## Example Usage
 *
 * ```cpp
 * NDArray spectrum = NDArray::from_values<float>(DataType::Float32, {100}, values);
 * ArrayMetadata metadata = ArrayMetadata::plain(DataType::Float32, spectrum.shape);
 * metadata.axes[0].calibration = Calibration{0.0, 1.0, "eV"};
 *
 * StreamFileWriter file;
 * if (auto res = file.open("spectrum.dm3"); res.is_error()) { ... }
 * auto res = encode(spectrum, metadata, file, DmVersion::DM3);
 *
 * // Large arrays: pull the payload from a store in chunks
 * DmWriter<DmVersion::DM4> writer(CodecOptions{StreamingParams::always(4 << 20)});
 * auto streamed = writer.encode_from(payload_store, metadata, file);
 * ```
 */

#include <cstdint>
#include "array.hpp"
#include "log.hpp"
#include "reader_base.hpp"
#include "readers/reader_buffer.hpp"
#include "strategy/stream_strategy.hpp"
#include "tag_stream.hpp"
#include "tag_tree.hpp"
#include "tree_builder.hpp"
#include "tree_codec.hpp"
#include "types.hpp"
#include "types/result.hpp"

namespace dmconcept {

/// @brief Writer of DM files of one version
/// @tparam Version DM3 or DM4
/// @note NOT thread-safe - use separate instances per thread
template <DmVersion Version>
class DmWriter {
public:
    using Policy = WidthPolicy<Version>;

    explicit DmWriter(CodecOptions options = {}) noexcept
        : options_(options) {}

    [[nodiscard]] const CodecOptions& options() const noexcept { return options_; }

    /// @brief Encode an in-memory array and its metadata
    /// @param array Elements in array order, little-endian
    /// @return InvalidMetadata when the metadata does not describe the array
    /// (checked before any byte is written), SinkWriteError on sink failure
    template <typename Writer>
        requires RawWriter<Writer>
    [[nodiscard]] Result<void> encode(const NDArray& array, const ArrayMetadata& metadata, Writer& writer) noexcept;

    /// @brief Encode an array whose payload lives in a caller store
    /// @param store Holds exactly `metadata.byte_size()` bytes in array order
    /// @details Payloads above the streaming threshold are moved from the
    /// store to the sink in chunks; smaller ones are read into memory once.
    template <typename Store, typename Writer>
        requires RawReader<Store> && RawWriter<Writer>
    [[nodiscard]] Result<void> encode_from(const Store& store, const ArrayMetadata& metadata, Writer& writer) noexcept;

    /// @brief Write a file holding an arbitrary root group
    /// @param emit Writes the external payloads of the tree, if any
    /// @details The sink is resized to the exact file size first.
    template <typename Writer, typename Emitter = RejectExternalPayloads>
        requires RawWriter<Writer> && PayloadEmitter<Emitter>
    [[nodiscard]] Result<void> write_tag_file(const TagGroup& root, Writer& writer, Emitter&& emit = {}) noexcept;

    /// @brief Size of the file write_tag_file() produces for `root`
    [[nodiscard]] static Result<uint64_t> file_size(const TagGroup& root) noexcept;

private:
    CodecOptions options_;
};

/// @brief Encode an array with a version chosen at run time
template <typename Writer>
    requires RawWriter<Writer>
[[nodiscard]] Result<void> encode(const NDArray& array, const ArrayMetadata& metadata, Writer& writer,
                                  DmVersion version = DmVersion::DM4, const CodecOptions& options = {}) noexcept;

/// @brief Encode an array from a caller store with a version chosen at run time
template <typename Store, typename Writer>
    requires RawReader<Store> && RawWriter<Writer>
[[nodiscard]] Result<void> encode_from(const Store& store, const ArrayMetadata& metadata, Writer& writer,
                                       DmVersion version = DmVersion::DM4, const CodecOptions& options = {}) noexcept;

/// @brief Write a root group with inline payloads only
template <typename Writer>
    requires RawWriter<Writer>
[[nodiscard]] Result<void> write_tag_file(const TagGroup& root, Writer& writer,
                                          DmVersion version = DmVersion::DM4) noexcept;

} // namespace dmconcept

#define DMCONCEPT_DM_WRITER_HEADER
#include "impl/dm_writer_impl.hpp"
