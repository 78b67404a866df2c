#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <new>
#include <span>
#include <string>
#include <vector>
#include "../log.hpp"
#include "../reader_base.hpp"
#include "../types/result.hpp"

namespace dmconcept {

/// Parameters of the large-array streaming path
struct StreamingParams {
    /// Payloads larger than this many bytes are streamed instead of read into memory
    uint64_t threshold_bytes = 64ull * 1024 * 1024;

    /// Upper bound on the bytes held in memory at once while streaming
    std::size_t chunk_bytes = 16 * 1024 * 1024;

    /// Tag arrays up to this size are always read into the tag tree
    static constexpr uint64_t min_external_bytes = 64 * 1024;

    [[nodiscard]] constexpr bool should_stream(uint64_t payload_bytes) const noexcept {
        return payload_bytes > threshold_bytes;
    }

    /// @brief Size above which a tag array is left in the byte source while decoding the tree
    /// @details Never below min_external_bytes, so text and small numeric tags
    /// stay readable whatever the streaming threshold.
    [[nodiscard]] constexpr uint64_t external_threshold() const noexcept {
        return std::max(threshold_bytes, min_external_bytes);
    }

    /// 64 MiB threshold, 16 MiB chunks
    [[nodiscard]] static constexpr StreamingParams defaults() noexcept {
        return StreamingParams{};
    }

    /// Never stream
    [[nodiscard]] static constexpr StreamingParams in_memory() noexcept {
        return StreamingParams{std::numeric_limits<uint64_t>::max(), 16 * 1024 * 1024};
    }

    /// Stream every non-empty payload with the given chunk size
    [[nodiscard]] static constexpr StreamingParams always(std::size_t chunk_bytes) noexcept {
        return StreamingParams{0, std::max<std::size_t>(chunk_bytes, 1)};
    }
};

/// Run-time options of every decode/encode entry point
struct CodecOptions {
    StreamingParams streaming = StreamingParams::defaults();
};

/// @brief Transpose a rows x cols matrix of `element_size`-byte elements
/// @details dst[c][r] = src[r][c]. Works on cache-sized blocks.
/// @pre src and dst hold rows * cols * element_size bytes and do not overlap
inline void transpose_bytes(std::span<const std::byte> src, std::span<std::byte> dst,
                            std::size_t rows, std::size_t cols, std::size_t element_size) noexcept {
    constexpr std::size_t block = 32;
    for (std::size_t r0 = 0; r0 < rows; r0 += block) {
        const std::size_t r1 = std::min(rows, r0 + block);
        for (std::size_t c0 = 0; c0 < cols; c0 += block) {
            const std::size_t c1 = std::min(cols, c0 + block);
            for (std::size_t r = r0; r < r1; ++r) {
                for (std::size_t c = c0; c < c1; ++c) {
                    std::memcpy(dst.data() + (c * rows + r) * element_size,
                                src.data() + (r * cols + c) * element_size,
                                element_size);
                }
            }
        }
    }
}

/// Copies byte ranges between a RawReader and a RawWriter in bounded chunks
/// The chunk buffer is reused across calls
class ChunkedCopier {
private:
    StreamingParams params_;
    std::vector<std::byte> buffer_;
    std::vector<std::byte> transposed_;
    std::size_t chunks_moved_ = 0;

public:
    explicit ChunkedCopier(StreamingParams params = StreamingParams::defaults()) noexcept
        : params_(params) {}

    [[nodiscard]] const StreamingParams& params() const noexcept { return params_; }

    /// Number of chunk reads issued so far
    [[nodiscard]] std::size_t chunks_moved() const noexcept { return chunks_moved_; }

    /// @brief Copy `length` bytes from `src` at `src_offset` to `dst` at `dst_offset`
    /// @return SourceReadError if the source fails or is short, SinkWriteError if the sink fails
    template <typename Reader, typename Writer>
        requires RawReader<Reader> && RawWriter<Writer>
    [[nodiscard]] Result<void> copy(const Reader& src, uint64_t src_offset,
                                    Writer& dst, uint64_t dst_offset, uint64_t length) noexcept {
        if (length == 0) {
            return Ok();
        }
        const std::size_t chunk = std::max<std::size_t>(params_.chunk_bytes, 1);
        auto res = reserve(buffer_, static_cast<std::size_t>(std::min<uint64_t>(chunk, length)));
        if (res.is_error()) [[unlikely]] {
            return res;
        }

        log::debug("Streaming {} bytes in chunks of {}", length, chunk);
        uint64_t done = 0;
        while (done < length) {
            const std::size_t n = static_cast<std::size_t>(std::min<uint64_t>(chunk, length - done));
            res = read_block(src, src_offset + done, std::span<std::byte>(buffer_.data(), n));
            if (res.is_error()) [[unlikely]] {
                return res;
            }
            res = write_block(dst, dst_offset + done, std::span<const std::byte>(buffer_.data(), n));
            if (res.is_error()) [[unlikely]] {
                return res;
            }
            done += n;
        }
        return Ok();
    }

    /// @brief Transpose a rows x cols element matrix from `src` into `dst`
    /// @details The matrix is processed tile by tile; a tile never exceeds the
    /// chunk size, so memory stays bounded whatever the matrix shape.
    template <typename Reader, typename Writer>
        requires RawReader<Reader> && RawWriter<Writer>
    [[nodiscard]] Result<void> transpose(const Reader& src, uint64_t src_offset,
                                         Writer& dst, uint64_t dst_offset,
                                         uint64_t rows, uint64_t cols, std::size_t element_size) noexcept {
        if (rows == 0 || cols == 0 || element_size == 0) {
            return Ok();
        }
        // A single row or column is already in transposed order
        if (rows == 1 || cols == 1) {
            return copy(src, src_offset, dst, dst_offset, rows * cols * element_size);
        }

        const std::size_t budget = std::max<std::size_t>(params_.chunk_bytes / element_size, 1);
        const auto side = static_cast<uint64_t>(std::sqrt(static_cast<double>(budget)));
        const uint64_t tile_cols = std::clamp<uint64_t>(side, 1, cols);
        const uint64_t tile_rows = std::clamp<uint64_t>(budget / tile_cols, 1, rows);

        const std::size_t tile_bytes = static_cast<std::size_t>(tile_rows * tile_cols * element_size);
        auto res = reserve(buffer_, tile_bytes);
        if (res.is_error()) [[unlikely]] {
            return res;
        }
        res = reserve(transposed_, tile_bytes);
        if (res.is_error()) [[unlikely]] {
            return res;
        }

        log::debug("Transposing {}x{} elements of {} bytes in {}x{} tiles",
                   rows, cols, element_size, tile_rows, tile_cols);
        for (uint64_t r0 = 0; r0 < rows; r0 += tile_rows) {
            const uint64_t tr = std::min(tile_rows, rows - r0);
            for (uint64_t c0 = 0; c0 < cols; c0 += tile_cols) {
                const uint64_t tc = std::min(tile_cols, cols - c0);
                const std::size_t row_bytes = static_cast<std::size_t>(tc * element_size);

                for (uint64_t r = 0; r < tr; ++r) {
                    res = read_block(src, src_offset + ((r0 + r) * cols + c0) * element_size,
                                     std::span<std::byte>(buffer_.data() + r * row_bytes, row_bytes));
                    if (res.is_error()) [[unlikely]] {
                        return res;
                    }
                }

                transpose_bytes(std::span<const std::byte>(buffer_.data(), tr * row_bytes),
                                std::span<std::byte>(transposed_.data(), tr * row_bytes),
                                static_cast<std::size_t>(tr), static_cast<std::size_t>(tc), element_size);

                const std::size_t column_bytes = static_cast<std::size_t>(tr * element_size);
                for (uint64_t c = 0; c < tc; ++c) {
                    res = write_block(dst, dst_offset + ((c0 + c) * rows + r0) * element_size,
                                      std::span<const std::byte>(transposed_.data() + c * column_bytes,
                                                                 column_bytes));
                    if (res.is_error()) [[unlikely]] {
                        return res;
                    }
                }
            }
        }
        return Ok();
    }

    /// Release the chunk buffers
    void clear() noexcept {
        buffer_.clear();
        buffer_.shrink_to_fit();
        transposed_.clear();
        transposed_.shrink_to_fit();
    }

private:
    [[nodiscard]] static Result<void> reserve(std::vector<std::byte>& buffer, std::size_t size) noexcept {
        if (buffer.size() >= size) {
            return Ok();
        }
        try {
            buffer.resize(size);
        } catch (const std::bad_alloc&) {
            return Err(Error::Code::MemoryError, "Failed to allocate a " + std::to_string(size) + " byte chunk");
        }
        return Ok();
    }

    template <typename Reader>
        requires RawReader<Reader>
    [[nodiscard]] Result<void> read_block(const Reader& src, uint64_t offset, std::span<std::byte> dest) noexcept {
        ++chunks_moved_;
        auto res = src.read_into(dest.data(), static_cast<std::size_t>(offset), dest.size());
        if (res.is_error()) [[unlikely]] {
            return Err(Error::Code::SourceReadError, "Chunk read failed: " + res.error().message, offset);
        }
        return Ok();
    }

    template <typename Writer>
        requires RawWriter<Writer>
    [[nodiscard]] static Result<void> write_block(Writer& dst, uint64_t offset, std::span<const std::byte> data) noexcept {
        auto region_result = dst.write(static_cast<std::size_t>(offset), data.size());
        if (region_result.is_error()) [[unlikely]] {
            return Err(Error::Code::SinkWriteError, "Chunk write failed: " + region_result.error().message, offset);
        }
        auto region = std::move(region_result.value());
        if (region.size() != data.size()) [[unlikely]] {
            return Err(Error::Code::SinkWriteError, "Sink returned a short write region", offset);
        }
        std::memcpy(region.data().data(), data.data(), data.size());
        auto flushed = region.flush();
        if (flushed.is_error()) [[unlikely]] {
            return Err(Error::Code::SinkWriteError, flushed.error().message, offset);
        }
        return Ok();
    }
};

} // namespace dmconcept
