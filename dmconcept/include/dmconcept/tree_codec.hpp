#pragma once

/**
 * @file tree_codec.hpp
 * @brief Recursive decode/encode between a tag stream and the TagValue model
 *
 * Every function is parameterized by a WidthPolicy, selected once from the
 * version marker. The grammar is the same for DM3 and DM4; only the width of
 * the length fields and the DM4 per-entry byte size differ.
 *
 * ## Grammar
 *
 * - group: `u8 is_dict`, `u8 open`, `length count`, then `count` entries
 * - entry: `u8 kind` (20 group, 21 data), `u16 name_length`, name,
 *   DM4 only `length entry_size`, then a group or a data block
 * - data block: `"%%%%"`, `length info_count`, `length type`, info fields, value
 *
 * All structural fields are big-endian, values are little-endian.
 *
 * ## Large arrays
 *
 * On decode, arrays whose payload exceeds `TreeDecodeOptions::external_threshold`
 * are not read: they decode as ExternalPayload and the cursor skips the bytes.
 * On encode, an ExternalPayload is handed to a payload emitter together with
 * its destination offset, and the emitter writes the bytes straight to the sink.
 *
 * Sizes are exact: `encoded_size()` returns the number of bytes `encode_group()`
 * will produce, so the file layout is known before the first byte is written.
 */

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include "log.hpp"
#include "reader_base.hpp"
#include "tag_stream.hpp"
#include "tag_tree.hpp"
#include "type_registry.hpp"
#include "types.hpp"
#include "types/result.hpp"

namespace dmconcept {

/// @brief Decode-time tuning of the tree codec
struct TreeDecodeOptions {
    /// Arrays with more payload bytes than this stay in the source
    uint64_t external_threshold = std::numeric_limits<uint64_t>::max();
    /// Groups nested deeper than this are rejected as malformed
    std::size_t max_depth = 256;
};

/// @brief Writes the bytes of an ExternalPayload at `dest_offset` of the sink
template <typename F>
concept PayloadEmitter = requires(F& emit, const ExternalPayload& payload, uint64_t dest_offset) {
    { emit(payload, dest_offset) } -> std::same_as<Result<void>>;
};

/// @brief Emitter for trees that must not hold external payloads
struct RejectExternalPayloads {
    Result<void> operator()(const ExternalPayload& payload, uint64_t dest_offset) const noexcept {
        return Err(Error::Code::InvalidMetadata,
                   "Tag tree references " + std::to_string(payload.byte_length) +
                   " external payload bytes but no pixel source was given",
                   dest_offset);
    }
};

// ============================================================================
// Decoding
// ============================================================================

/// @brief Decode a group at the cursor
/// @return The group, or TruncatedInput / MalformedTag / UnknownTypeCode
template <DmWidthPolicy Policy, typename Reader>
    requires RawReader<Reader>
[[nodiscard]] Result<TagGroup> decode_group(
    TagStreamReader<Reader>& reader, const TreeDecodeOptions& options = {}) noexcept;

/// @brief Decode one entry (kind, name, value) at the cursor
template <DmWidthPolicy Policy, typename Reader>
    requires RawReader<Reader>
[[nodiscard]] Result<TagEntry> decode_tag(
    TagStreamReader<Reader>& reader, const TreeDecodeOptions& options = {}) noexcept;

/// @brief Decode one `%%%%` data block at the cursor
template <DmWidthPolicy Policy, typename Reader>
    requires RawReader<Reader>
[[nodiscard]] Result<TagValue> decode_data(
    TagStreamReader<Reader>& reader, const TreeDecodeOptions& options = {}) noexcept;

// ============================================================================
// Size computation
// ============================================================================

/// @brief Exact encoded size of a group, an entry or a data block
/// @details Also validates the tree: names longer than 65535 bytes, counts
/// that do not fit the policy width, struct fields without a fixed width and
/// inline payloads whose size disagrees with the array length fail with
/// InvalidMetadata.
template <DmWidthPolicy Policy>
[[nodiscard]] Result<uint64_t> encoded_size(const TagGroup& group) noexcept;

/// @param as_list_item list items are counted without their name
template <DmWidthPolicy Policy>
[[nodiscard]] Result<uint64_t> encoded_size(const TagEntry& entry, bool as_list_item = false) noexcept;

/// @brief Size of a value's body: the group itself, or its data block
template <DmWidthPolicy Policy>
[[nodiscard]] Result<uint64_t> encoded_size(const TagValue& value) noexcept;

// ============================================================================
// Encoding
// ============================================================================

/// @brief Encode a group at the cursor
/// @pre encoded_size<Policy>(group) succeeded
template <DmWidthPolicy Policy, typename Writer, typename Emitter = RejectExternalPayloads>
    requires RawWriter<Writer> && PayloadEmitter<Emitter>
[[nodiscard]] Result<void> encode_group(
    const TagGroup& group, TagStreamWriter<Writer>& writer, Emitter&& emit = {}) noexcept;

/// @brief Encode one entry at the cursor
/// @param as_list_item list items are written without their name
template <DmWidthPolicy Policy, typename Writer, typename Emitter = RejectExternalPayloads>
    requires RawWriter<Writer> && PayloadEmitter<Emitter>
[[nodiscard]] Result<void> encode_tag(
    const TagEntry& entry, TagStreamWriter<Writer>& writer, Emitter&& emit = {},
    bool as_list_item = false) noexcept;

/// @brief Encode one data block (scalar, struct or array) at the cursor
template <DmWidthPolicy Policy, typename Writer, typename Emitter = RejectExternalPayloads>
    requires RawWriter<Writer> && PayloadEmitter<Emitter>
[[nodiscard]] Result<void> encode_data(
    const TagValue& value, TagStreamWriter<Writer>& writer, Emitter&& emit = {}) noexcept;

} // namespace dmconcept

#define DMCONCEPT_TREE_CODEC_HEADER
#include "impl/tree_codec_impl.hpp"
