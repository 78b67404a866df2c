// Do not include this file directly. Include "tag_stream.hpp" instead.

#pragma once

#include <algorithm>
#include <array>
#include <cstring>
#include <string>
#include <type_traits>
#include "../reader_base.hpp"
#include "../types.hpp"
#include "../types/result.hpp"

#ifndef DMCONCEPT_TAG_STREAM_HEADER
#include "../tag_stream.hpp" // for linters
#endif

namespace dmconcept {

// ============================================================================
// TagStreamReader
// ============================================================================

template <typename Reader>
    requires RawReader<Reader>
TagStreamReader<Reader>::TagStreamReader(const Reader& reader, std::size_t size, std::size_t window_size) noexcept
    : reader_(&reader), size_(size), window_(std::max<std::size_t>(window_size, 16)) {}

template <typename Reader>
    requires RawReader<Reader>
Result<TagStreamReader<Reader>> TagStreamReader<Reader>::open(const Reader& reader, std::size_t window_size) noexcept {
    if (!reader.is_valid()) [[unlikely]] {
        return Err(Error::Code::SourceReadError, "Byte source is not open");
    }
    auto size_result = reader.size();
    if (size_result.is_error()) [[unlikely]] {
        return Err(Error::Code::SourceReadError, "Failed to query source size: " + size_result.error().message);
    }
    return TagStreamReader(reader, size_result.value(), window_size);
}

template <typename Reader>
    requires RawReader<Reader>
Error TagStreamReader<Reader>::truncated(std::size_t requested) const noexcept {
    return Err(Error::Code::TruncatedInput,
               "Stream ended: " + std::to_string(requested) + " bytes requested, " +
               std::to_string(remaining()) + " available",
               position_);
}

template <typename Reader>
    requires RawReader<Reader>
Result<std::span<const std::byte>> TagStreamReader<Reader>::take(std::size_t count) noexcept {
    if (count > remaining()) [[unlikely]] {
        return truncated(count);
    }

    const bool in_window = position_ >= window_offset_ &&
                           position_ + count <= window_offset_ + window_fill_;
    if (!in_window) {
        // count never exceeds the window: take() is only used for scalar fields
        const std::size_t to_fill = std::min(window_.size(), size_ - position_);
        auto res = reader_->read_into(window_.data(), position_, to_fill);
        if (res.is_error()) [[unlikely]] {
            window_fill_ = 0;
            return Err(Error::Code::SourceReadError, res.error().message, position_);
        }
        window_offset_ = position_;
        window_fill_ = to_fill;
    }

    std::span<const std::byte> bytes(window_.data() + (position_ - window_offset_), count);
    position_ += count;
    return Ok(bytes);
}

template <typename Reader>
    requires RawReader<Reader>
template <typename T>
    requires std::is_arithmetic_v<T>
Result<T> TagStreamReader<Reader>::read(std::endian endian) noexcept {
    auto bytes = take(sizeof(T));
    if (bytes.is_error()) [[unlikely]] {
        return bytes.error();
    }
    if constexpr (std::is_same_v<T, bool>) {
        return Ok(std::to_integer<uint8_t>(bytes.value()[0]) != 0);
    } else {
        return Ok(load_value<T>(bytes.value(), endian));
    }
}

template <typename Reader>
    requires RawReader<Reader>
Result<uint8_t> TagStreamReader<Reader>::read_u8() noexcept {
    return read<uint8_t>(std::endian::little);
}

template <typename Reader>
    requires RawReader<Reader>
Result<uint16_t> TagStreamReader<Reader>::read_u16(std::endian endian) noexcept {
    return read<uint16_t>(endian);
}

template <typename Reader>
    requires RawReader<Reader>
Result<uint32_t> TagStreamReader<Reader>::read_u32(std::endian endian) noexcept {
    return read<uint32_t>(endian);
}

template <typename Reader>
    requires RawReader<Reader>
Result<uint64_t> TagStreamReader<Reader>::read_u64(std::endian endian) noexcept {
    return read<uint64_t>(endian);
}

template <typename Reader>
    requires RawReader<Reader>
Result<int8_t> TagStreamReader<Reader>::read_i8() noexcept {
    return read<int8_t>(std::endian::little);
}

template <typename Reader>
    requires RawReader<Reader>
Result<int16_t> TagStreamReader<Reader>::read_i16(std::endian endian) noexcept {
    return read<int16_t>(endian);
}

template <typename Reader>
    requires RawReader<Reader>
Result<int32_t> TagStreamReader<Reader>::read_i32(std::endian endian) noexcept {
    return read<int32_t>(endian);
}

template <typename Reader>
    requires RawReader<Reader>
Result<int64_t> TagStreamReader<Reader>::read_i64(std::endian endian) noexcept {
    return read<int64_t>(endian);
}

template <typename Reader>
    requires RawReader<Reader>
Result<float> TagStreamReader<Reader>::read_f32(std::endian endian) noexcept {
    return read<float>(endian);
}

template <typename Reader>
    requires RawReader<Reader>
Result<double> TagStreamReader<Reader>::read_f64(std::endian endian) noexcept {
    return read<double>(endian);
}

template <typename Reader>
    requires RawReader<Reader>
Result<void> TagStreamReader<Reader>::read_into(std::span<std::byte> dest) noexcept {
    if (dest.empty()) {
        return Ok();
    }
    if (dest.size() > remaining()) [[unlikely]] {
        return truncated(dest.size());
    }

    std::size_t copied = 0;
    // Serve what the window already holds
    if (position_ >= window_offset_ && position_ < window_offset_ + window_fill_) {
        const std::size_t available = window_offset_ + window_fill_ - position_;
        copied = std::min(available, dest.size());
        std::memcpy(dest.data(), window_.data() + (position_ - window_offset_), copied);
        position_ += copied;
    }

    if (copied < dest.size()) {
        const std::size_t rest = dest.size() - copied;
        auto res = reader_->read_into(dest.data() + copied, position_, rest);
        if (res.is_error()) [[unlikely]] {
            return Err(Error::Code::SourceReadError, res.error().message, position_);
        }
        position_ += rest;
    }
    return Ok();
}

template <typename Reader>
    requires RawReader<Reader>
Result<std::vector<std::byte>> TagStreamReader<Reader>::read_bytes(std::size_t count) noexcept {
    if (count > remaining()) [[unlikely]] {
        return truncated(count);
    }
    std::vector<std::byte> bytes(count);
    auto res = read_into(bytes);
    if (res.is_error()) [[unlikely]] {
        return res.error();
    }
    return Ok(std::move(bytes));
}

template <typename Reader>
    requires RawReader<Reader>
Result<std::string> TagStreamReader<Reader>::read_string(std::size_t length) noexcept {
    if (length > remaining()) [[unlikely]] {
        return truncated(length);
    }
    std::string value(length, '\0');
    auto res = read_into(std::as_writable_bytes(std::span<char>(value.data(), value.size())));
    if (res.is_error()) [[unlikely]] {
        return res.error();
    }
    return Ok(std::move(value));
}

template <typename Reader>
    requires RawReader<Reader>
Result<void> TagStreamReader<Reader>::skip(std::size_t count) noexcept {
    if (count > remaining()) [[unlikely]] {
        return truncated(count);
    }
    position_ += count;
    return Ok();
}

template <typename Reader>
    requires RawReader<Reader>
Result<void> TagStreamReader<Reader>::seek(std::size_t offset) noexcept {
    if (offset > size_) [[unlikely]] {
        return Err(Error::Code::TruncatedInput,
                   "Seek beyond end of stream (size " + std::to_string(size_) + ")", offset);
    }
    position_ = offset;
    return Ok();
}

// ============================================================================
// TagStreamWriter
// ============================================================================

template <typename Writer>
    requires RawWriter<Writer>
TagStreamWriter<Writer>::TagStreamWriter(Writer& writer, std::size_t start_offset, std::size_t window_size) noexcept
    : writer_(&writer), window_size_(std::max<std::size_t>(window_size, 16)), pending_offset_(start_offset) {
    pending_.reserve(window_size_);
}

template <typename Writer>
    requires RawWriter<Writer>
Result<void> TagStreamWriter<Writer>::put(std::size_t offset, std::span<const std::byte> data) noexcept {
    auto region_result = writer_->write(offset, data.size());
    if (region_result.is_error()) [[unlikely]] {
        return Err(Error::Code::SinkWriteError,
                   "Failed to write to sink: " + region_result.error().message, offset);
    }
    auto region = std::move(region_result.value());
    if (region.size() != data.size()) [[unlikely]] {
        return Err(Error::Code::SinkWriteError, "Sink returned a short write region", offset);
    }
    std::memcpy(region.data().data(), data.data(), data.size());
    auto flush_result = region.flush();
    if (flush_result.is_error()) [[unlikely]] {
        return Err(Error::Code::SinkWriteError, flush_result.error().message, offset);
    }
    return Ok();
}

template <typename Writer>
    requires RawWriter<Writer>
Result<void> TagStreamWriter<Writer>::commit() noexcept {
    if (pending_.empty()) {
        return Ok();
    }
    auto res = put(pending_offset_, pending_);
    if (res.is_error()) [[unlikely]] {
        return res;
    }
    pending_offset_ += pending_.size();
    pending_.clear();
    return Ok();
}

template <typename Writer>
    requires RawWriter<Writer>
template <typename T>
    requires std::is_arithmetic_v<T>
Result<void> TagStreamWriter<Writer>::write(T value, std::endian endian) noexcept {
    std::array<std::byte, sizeof(T)> bytes;
    if constexpr (std::is_same_v<T, bool>) {
        bytes[0] = value ? std::byte{1} : std::byte{0};
    } else {
        store_value<T>(bytes, value, endian);
    }
    pending_.insert(pending_.end(), bytes.begin(), bytes.end());
    if (pending_.size() >= window_size_) {
        return commit();
    }
    return Ok();
}

template <typename Writer>
    requires RawWriter<Writer>
Result<void> TagStreamWriter<Writer>::write_u8(uint8_t value) noexcept {
    return write<uint8_t>(value, std::endian::little);
}

template <typename Writer>
    requires RawWriter<Writer>
Result<void> TagStreamWriter<Writer>::write_u16(uint16_t value, std::endian endian) noexcept {
    return write<uint16_t>(value, endian);
}

template <typename Writer>
    requires RawWriter<Writer>
Result<void> TagStreamWriter<Writer>::write_u32(uint32_t value, std::endian endian) noexcept {
    return write<uint32_t>(value, endian);
}

template <typename Writer>
    requires RawWriter<Writer>
Result<void> TagStreamWriter<Writer>::write_u64(uint64_t value, std::endian endian) noexcept {
    return write<uint64_t>(value, endian);
}

template <typename Writer>
    requires RawWriter<Writer>
Result<void> TagStreamWriter<Writer>::write_i8(int8_t value) noexcept {
    return write<int8_t>(value, std::endian::little);
}

template <typename Writer>
    requires RawWriter<Writer>
Result<void> TagStreamWriter<Writer>::write_i16(int16_t value, std::endian endian) noexcept {
    return write<int16_t>(value, endian);
}

template <typename Writer>
    requires RawWriter<Writer>
Result<void> TagStreamWriter<Writer>::write_i32(int32_t value, std::endian endian) noexcept {
    return write<int32_t>(value, endian);
}

template <typename Writer>
    requires RawWriter<Writer>
Result<void> TagStreamWriter<Writer>::write_i64(int64_t value, std::endian endian) noexcept {
    return write<int64_t>(value, endian);
}

template <typename Writer>
    requires RawWriter<Writer>
Result<void> TagStreamWriter<Writer>::write_f32(float value, std::endian endian) noexcept {
    return write<float>(value, endian);
}

template <typename Writer>
    requires RawWriter<Writer>
Result<void> TagStreamWriter<Writer>::write_f64(double value, std::endian endian) noexcept {
    return write<double>(value, endian);
}

template <typename Writer>
    requires RawWriter<Writer>
Result<void> TagStreamWriter<Writer>::write_bytes(std::span<const std::byte> data) noexcept {
    if (data.empty()) {
        return Ok();
    }
    if (pending_.size() + data.size() < window_size_) {
        pending_.insert(pending_.end(), data.begin(), data.end());
        return Ok();
    }

    // Large block: commit what is pending, then write the block in one region
    auto res = commit();
    if (res.is_error()) [[unlikely]] {
        return res;
    }
    res = put(pending_offset_, data);
    if (res.is_error()) [[unlikely]] {
        return res;
    }
    pending_offset_ += data.size();
    return Ok();
}

template <typename Writer>
    requires RawWriter<Writer>
Result<void> TagStreamWriter<Writer>::write_string(std::string_view value) noexcept {
    return write_bytes(std::as_bytes(std::span<const char>(value.data(), value.size())));
}

template <typename Writer>
    requires RawWriter<Writer>
Result<void> TagStreamWriter<Writer>::write_zeros(std::size_t count) noexcept {
    pending_.insert(pending_.end(), count, std::byte{0});
    if (pending_.size() >= window_size_) {
        return commit();
    }
    return Ok();
}

template <typename Writer>
    requires RawWriter<Writer>
Result<void> TagStreamWriter<Writer>::seek(std::size_t offset) noexcept {
    auto res = commit();
    if (res.is_error()) [[unlikely]] {
        return res;
    }
    pending_offset_ = offset;
    return Ok();
}

template <typename Writer>
    requires RawWriter<Writer>
Result<void> TagStreamWriter<Writer>::flush() noexcept {
    auto res = commit();
    if (res.is_error()) [[unlikely]] {
        return res;
    }
    auto flush_result = writer_->flush();
    if (flush_result.is_error()) [[unlikely]] {
        return Err(Error::Code::SinkWriteError, "Failed to flush sink: " + flush_result.error().message);
    }
    return Ok();
}

} // namespace dmconcept
