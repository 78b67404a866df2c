#pragma once

#include <cstddef>
#include <cstring>
#include <new>
#include <span>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>
#include "../reader_base.hpp"

namespace dmconcept {

/// Region of an in-memory buffer; writes land in place
class MemoryRegion {
private:
    std::span<std::byte> bytes_;

public:
    MemoryRegion() noexcept = default;
    explicit MemoryRegion(std::span<std::byte> bytes) noexcept : bytes_(bytes) {}

    [[nodiscard]] std::span<std::byte> data() noexcept { return bytes_; }
    [[nodiscard]] std::size_t size() const noexcept { return bytes_.size(); }
    [[nodiscard]] Result<void> flush() noexcept { return Ok(); }
};

static_assert(WriteRegion<MemoryRegion>);

namespace memory_access {

struct ReadOnly {
    static constexpr bool can_read = true;
    static constexpr bool can_write = false;
};

struct WriteOnly {
    static constexpr bool can_read = false;
    static constexpr bool can_write = true;
};

struct ReadWrite {
    static constexpr bool can_read = true;
    static constexpr bool can_write = true;
};

[[nodiscard]] inline bool in_range(std::size_t total, std::size_t offset, std::size_t size) noexcept {
    return offset <= total && size <= total - offset;
}

[[nodiscard]] inline Result<void> copy_out(std::span<const std::byte> bytes, void* dest,
                                           std::size_t offset, std::size_t size) noexcept {
    if (size == 0) {
        return Ok();
    }
    if (!in_range(bytes.size(), offset, size)) [[unlikely]] {
        return Err(Error::Code::OutOfBounds,
                   "Read of " + std::to_string(size) + " bytes past the end of a " +
                   std::to_string(bytes.size()) + " byte buffer", offset);
    }
    std::memcpy(dest, bytes.data() + offset, size);
    return Ok();
}

[[nodiscard]] inline Result<MemoryRegion> region_of(std::span<std::byte> bytes,
                                                    std::size_t offset, std::size_t size) noexcept {
    if (!in_range(bytes.size(), offset, size)) [[unlikely]] {
        return Err(Error::Code::OutOfBounds,
                   "Write of " + std::to_string(size) + " bytes past the end of a " +
                   std::to_string(bytes.size()) + " byte buffer", offset);
    }
    return MemoryRegion(bytes.subspan(offset, size));
}

} // namespace memory_access

/// @brief Byte source or sink over memory the caller owns
/// @details The size is fixed: resize() only accepts the current size, so an
/// encode into a view succeeds only when the view has the exact file size.
template <typename Access>
class BufferViewBase {
public:
    using Bytes = std::conditional_t<Access::can_write, std::span<std::byte>, std::span<const std::byte>>;
    using Region = MemoryRegion;

private:
    Bytes bytes_;

public:
    BufferViewBase() noexcept = default;
    explicit BufferViewBase(Bytes bytes) noexcept : bytes_(bytes) {}

    [[nodiscard]] Result<void> read_into(void* dest, std::size_t offset, std::size_t size) const noexcept
        requires (Access::can_read) {
        return memory_access::copy_out(bytes_, dest, offset, size);
    }

    [[nodiscard]] Result<Region> write(std::size_t offset, std::size_t size) noexcept
        requires (Access::can_write) {
        return memory_access::region_of(bytes_, offset, size);
    }

    [[nodiscard]] Result<std::size_t> size() const noexcept { return Ok(bytes_.size()); }

    [[nodiscard]] Result<void> resize(std::size_t new_size) noexcept
        requires (Access::can_write) {
        if (new_size != bytes_.size()) [[unlikely]] {
            return Err(Error::Code::SinkWriteError,
                       "A borrowed buffer of " + std::to_string(bytes_.size()) + " bytes cannot hold " +
                       std::to_string(new_size) + " bytes");
        }
        return Ok();
    }

    [[nodiscard]] Result<void> flush() noexcept
        requires (Access::can_write) {
        return Ok();
    }

    [[nodiscard]] bool is_valid() const noexcept { return true; }

    [[nodiscard]] std::span<const std::byte> buffer() const noexcept { return bytes_; }
};

/// Decode from bytes already in memory
using BufferViewReader = BufferViewBase<memory_access::ReadOnly>;
static_assert(RawReader<BufferViewReader>);

/// Encode into a caller buffer of the exact file size
using BufferViewWriter = BufferViewBase<memory_access::WriteOnly>;
static_assert(RawWriter<BufferViewWriter>);

/// @brief Byte source or sink over a vector it owns
/// @details resize() grows or shrinks the vector, so a BufferWriter can take
/// a whole encoded file without knowing its size in advance.
template <typename Access>
class BufferBase {
private:
    std::vector<std::byte> bytes_;

public:
    using Region = MemoryRegion;

    BufferBase() noexcept = default;
    explicit BufferBase(std::size_t size) : bytes_(size) {}
    explicit BufferBase(std::span<const std::byte> bytes) : bytes_(bytes.begin(), bytes.end()) {}
    explicit BufferBase(std::vector<std::byte>&& bytes) noexcept : bytes_(std::move(bytes)) {}

    [[nodiscard]] Result<void> read_into(void* dest, std::size_t offset, std::size_t size) const noexcept
        requires (Access::can_read) {
        return memory_access::copy_out(bytes_, dest, offset, size);
    }

    [[nodiscard]] Result<Region> write(std::size_t offset, std::size_t size) noexcept
        requires (Access::can_write) {
        return memory_access::region_of(bytes_, offset, size);
    }

    [[nodiscard]] Result<std::size_t> size() const noexcept { return Ok(bytes_.size()); }

    [[nodiscard]] Result<void> resize(std::size_t new_size) noexcept
        requires (Access::can_write) {
        try {
            bytes_.resize(new_size);
        } catch (const std::bad_alloc&) {
            return Err(Error::Code::MemoryError, "Failed to grow a buffer to " + std::to_string(new_size) + " bytes");
        } catch (const std::length_error&) {
            return Err(Error::Code::MemoryError, std::to_string(new_size) + " bytes exceed the vector limit");
        }
        return Ok();
    }

    [[nodiscard]] Result<void> flush() noexcept
        requires (Access::can_write) {
        return Ok();
    }

    [[nodiscard]] bool is_valid() const noexcept { return true; }

    [[nodiscard]] std::span<const std::byte> buffer() const noexcept { return bytes_; }
    [[nodiscard]] std::span<std::byte> buffer() noexcept
        requires (Access::can_write) {
        return bytes_;
    }

    [[nodiscard]] const std::vector<std::byte>& data() const noexcept { return bytes_; }
    [[nodiscard]] std::vector<std::byte>& data() noexcept
        requires (Access::can_write) {
        return bytes_;
    }
};

/// Owned copy of a file to decode
using BufferReader = BufferBase<memory_access::ReadOnly>;
static_assert(RawReader<BufferReader>);

/// Growable sink for an encoded file
using BufferWriter = BufferBase<memory_access::WriteOnly>;
static_assert(RawWriter<BufferWriter>);

/// In-memory array store for decode_into and encode_from
using BufferReadWriter = BufferBase<memory_access::ReadWrite>;
static_assert(RawReader<BufferReadWriter> && RawWriter<BufferReadWriter>);

} // namespace dmconcept
