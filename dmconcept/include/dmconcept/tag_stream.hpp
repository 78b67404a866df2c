#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>
#include "reader_base.hpp"
#include "types.hpp"
#include "types/result.hpp"

namespace dmconcept {

/// @brief Sequential cursor over a RawReader
///
/// Reads go through a bounded read-ahead window so that the many small
/// structural fields of a tag stream do not each become a call into the
/// byte source. Large reads bypass the window.
///
/// Every read takes the endianness explicitly: structural fields of the DM
/// format are big-endian while tag values and the pixel payload are
/// little-endian.
///
/// Errors:
/// - TruncatedInput when fewer bytes remain than requested (the error
///   carries the cursor position)
/// - SourceReadError when the byte source fails
template <typename Reader>
    requires RawReader<Reader>
class TagStreamReader {
public:
    static constexpr std::size_t default_window_size = 64 * 1024;

    /// @brief Open a cursor at offset 0
    [[nodiscard]] static Result<TagStreamReader> open(
        const Reader& reader, std::size_t window_size = default_window_size) noexcept;

    [[nodiscard]] Result<uint8_t> read_u8() noexcept;
    [[nodiscard]] Result<uint16_t> read_u16(std::endian endian) noexcept;
    [[nodiscard]] Result<uint32_t> read_u32(std::endian endian) noexcept;
    [[nodiscard]] Result<uint64_t> read_u64(std::endian endian) noexcept;
    [[nodiscard]] Result<int8_t> read_i8() noexcept;
    [[nodiscard]] Result<int16_t> read_i16(std::endian endian) noexcept;
    [[nodiscard]] Result<int32_t> read_i32(std::endian endian) noexcept;
    [[nodiscard]] Result<int64_t> read_i64(std::endian endian) noexcept;
    [[nodiscard]] Result<float> read_f32(std::endian endian) noexcept;
    [[nodiscard]] Result<double> read_f64(std::endian endian) noexcept;

    /// @brief Read any arithmetic value
    template <typename T>
        requires std::is_arithmetic_v<T>
    [[nodiscard]] Result<T> read(std::endian endian) noexcept;

    /// @brief Read `length` raw bytes as a string (tag names are Latin-1)
    [[nodiscard]] Result<std::string> read_string(std::size_t length) noexcept;

    [[nodiscard]] Result<std::vector<std::byte>> read_bytes(std::size_t count) noexcept;

    /// @brief Fill `dest` entirely from the current position
    [[nodiscard]] Result<void> read_into(std::span<std::byte> dest) noexcept;

    [[nodiscard]] Result<void> skip(std::size_t count) noexcept;

    /// @brief Move to an absolute offset. Seeking to the end is allowed.
    [[nodiscard]] Result<void> seek(std::size_t offset) noexcept;

    [[nodiscard]] std::size_t tell() const noexcept { return position_; }
    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] std::size_t remaining() const noexcept { return size_ - position_; }

    [[nodiscard]] const Reader& source() const noexcept { return *reader_; }

private:
    TagStreamReader(const Reader& reader, std::size_t size, std::size_t window_size) noexcept;

    /// Make `count` bytes at the cursor available in the window and return them
    [[nodiscard]] Result<std::span<const std::byte>> take(std::size_t count) noexcept;

    [[nodiscard]] Error truncated(std::size_t requested) const noexcept;

    const Reader* reader_;
    std::size_t size_;
    std::size_t position_{0};
    std::vector<std::byte> window_;
    std::size_t window_offset_{0};
    std::size_t window_fill_{0};
};

/// @brief Sequential cursor over a RawWriter
///
/// Writes accumulate in a bounded buffer committed through the sink's write
/// regions, so the sink must already be sized to hold every byte written.
/// `seek()` commits pending bytes before moving. All sink failures surface as
/// SinkWriteError.
template <typename Writer>
    requires RawWriter<Writer>
class TagStreamWriter {
public:
    static constexpr std::size_t default_window_size = 64 * 1024;

    explicit TagStreamWriter(Writer& writer, std::size_t start_offset = 0,
                             std::size_t window_size = default_window_size) noexcept;

    [[nodiscard]] Result<void> write_u8(uint8_t value) noexcept;
    [[nodiscard]] Result<void> write_u16(uint16_t value, std::endian endian) noexcept;
    [[nodiscard]] Result<void> write_u32(uint32_t value, std::endian endian) noexcept;
    [[nodiscard]] Result<void> write_u64(uint64_t value, std::endian endian) noexcept;
    [[nodiscard]] Result<void> write_i8(int8_t value) noexcept;
    [[nodiscard]] Result<void> write_i16(int16_t value, std::endian endian) noexcept;
    [[nodiscard]] Result<void> write_i32(int32_t value, std::endian endian) noexcept;
    [[nodiscard]] Result<void> write_i64(int64_t value, std::endian endian) noexcept;
    [[nodiscard]] Result<void> write_f32(float value, std::endian endian) noexcept;
    [[nodiscard]] Result<void> write_f64(double value, std::endian endian) noexcept;

    template <typename T>
        requires std::is_arithmetic_v<T>
    [[nodiscard]] Result<void> write(T value, std::endian endian) noexcept;

    /// @brief Write the raw bytes of a string (tag names are Latin-1)
    [[nodiscard]] Result<void> write_string(std::string_view value) noexcept;

    [[nodiscard]] Result<void> write_bytes(std::span<const std::byte> data) noexcept;

    /// @brief Write `count` zero bytes
    [[nodiscard]] Result<void> write_zeros(std::size_t count) noexcept;

    /// @brief Commit pending bytes and move to an absolute offset
    [[nodiscard]] Result<void> seek(std::size_t offset) noexcept;

    [[nodiscard]] std::size_t tell() const noexcept { return pending_offset_ + pending_.size(); }

    /// @brief Commit pending bytes and flush the sink
    [[nodiscard]] Result<void> flush() noexcept;

    [[nodiscard]] Writer& sink() noexcept { return *writer_; }

private:
    [[nodiscard]] Result<void> put(std::size_t offset, std::span<const std::byte> data) noexcept;
    [[nodiscard]] Result<void> commit() noexcept;

    Writer* writer_;
    std::size_t window_size_;
    std::vector<std::byte> pending_;
    std::size_t pending_offset_;
};

} // namespace dmconcept

#define DMCONCEPT_TAG_STREAM_HEADER
#include "impl/tag_stream_impl.hpp"
