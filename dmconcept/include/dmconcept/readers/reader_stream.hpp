#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <new>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>
#include "../reader_base.hpp"

namespace dmconcept {

/// @brief Staged region of a file sink
/// @details Bytes are collected in memory and written at `offset` by flush().
/// A region dropped without flush() writes nothing.
class FileRegion {
private:
    std::vector<std::byte> staged_;
    std::fstream* file_{nullptr};
    std::mutex* mutex_{nullptr};
    std::size_t offset_{0};

public:
    FileRegion() noexcept = default;
    FileRegion(std::vector<std::byte>&& staged, std::fstream* file, std::mutex* mutex, std::size_t offset) noexcept
        : staged_(std::move(staged)), file_(file), mutex_(mutex), offset_(offset) {}

    FileRegion(FileRegion&&) noexcept = default;
    FileRegion& operator=(FileRegion&&) noexcept = default;
    FileRegion(const FileRegion&) = delete;
    FileRegion& operator=(const FileRegion&) = delete;

    [[nodiscard]] std::span<std::byte> data() noexcept { return staged_; }
    [[nodiscard]] std::size_t size() const noexcept { return staged_.size(); }

    [[nodiscard]] Result<void> flush() noexcept {
        if (file_ == nullptr || staged_.empty()) {
            return Ok();
        }
        std::lock_guard<std::mutex> lock(*mutex_);
        file_->clear();
        file_->seekp(static_cast<std::streamoff>(offset_), std::ios::beg);
        file_->write(reinterpret_cast<const char*>(staged_.data()), static_cast<std::streamsize>(staged_.size()));
        if (!*file_) [[unlikely]] {
            return Err(Error::Code::SinkWriteError,
                       "Failed to write " + std::to_string(staged_.size()) + " bytes to the file", offset_);
        }
        file_ = nullptr;
        return Ok();
    }
};

static_assert(WriteRegion<FileRegion>);

namespace file_access {

struct ReadOnly {
    static constexpr bool can_read = true;
    static constexpr bool can_write = false;
    static constexpr std::ios::openmode mode = std::ios::binary | std::ios::in;
};

struct WriteOnly {
    static constexpr bool can_read = false;
    static constexpr bool can_write = true;
    static constexpr std::ios::openmode mode = std::ios::binary | std::ios::in | std::ios::out;
};

} // namespace file_access

/// @brief DM file on disk accessed through std::fstream
/// @details Positioned reads and writes are serialized by a mutex. A writer
/// creates the file when it does not exist; its size is whatever the encoder
/// resizes it to.
template <typename Access>
class StreamFileBase {
public:
    using Region = FileRegion;

private:
    mutable std::fstream file_;
    mutable std::mutex mutex_;
    std::string path_;
    std::size_t size_{0};

public:
    StreamFileBase() noexcept = default;

    explicit StreamFileBase(std::string_view path) noexcept {
        auto res = open(path);
        if (res.is_error()) {
            // is_valid() reports the failure
            path_.clear();
        }
    }

    ~StreamFileBase() noexcept { close(); }

    StreamFileBase(const StreamFileBase&) = delete;
    StreamFileBase& operator=(const StreamFileBase&) = delete;

    [[nodiscard]] Result<void> open(std::string_view path) noexcept {
        close();
        std::lock_guard<std::mutex> lock(mutex_);
        path_ = std::string(path);

        std::error_code ec;
        const bool exists = std::filesystem::exists(path_, ec);
        if constexpr (Access::can_write) {
            if (!exists) {
                std::ofstream create(path_, std::ios::binary | std::ios::trunc);
                if (!create) [[unlikely]] {
                    return Err(Error::Code::SinkWriteError, "Cannot create " + path_);
                }
            }
        } else if (!exists) {
            return Err(Error::Code::FileNotFound, "No such file: " + path_);
        }

        file_.open(path_, Access::mode);
        if (!file_.is_open()) [[unlikely]] {
            return Err(Access::can_write ? Error::Code::SinkWriteError : Error::Code::FileNotFound,
                       "Cannot open " + path_);
        }
        const auto size = std::filesystem::file_size(path_, ec);
        if (ec) [[unlikely]] {
            file_.close();
            return Err(Error::Code::SourceReadError, "Cannot query the size of " + path_ + ": " + ec.message());
        }
        size_ = static_cast<std::size_t>(size);
        return Ok();
    }

    void close() noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        if (file_.is_open()) {
            file_.close();
        }
        size_ = 0;
    }

    [[nodiscard]] bool is_valid() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return file_.is_open();
    }

    [[nodiscard]] std::string_view path() const noexcept { return path_; }

    [[nodiscard]] Result<std::size_t> size() const noexcept {
        if (!is_valid()) [[unlikely]] {
            return Err(Error::Code::SourceReadError, "File is not open");
        }
        return Ok(size_);
    }

    [[nodiscard]] Result<void> read_into(void* dest, std::size_t offset, std::size_t size) const noexcept
        requires (Access::can_read) {
        if (!is_valid()) [[unlikely]] {
            return Err(Error::Code::SourceReadError, "File is not open");
        }
        if (size == 0) {
            return Ok();
        }
        if (offset > size_ || size > size_ - offset) [[unlikely]] {
            return Err(Error::Code::OutOfBounds,
                       "Read of " + std::to_string(size) + " bytes past the end of " + path_, offset);
        }

        std::lock_guard<std::mutex> lock(mutex_);
        file_.clear();
        file_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
        file_.read(static_cast<char*>(dest), static_cast<std::streamsize>(size));
        if (static_cast<std::size_t>(file_.gcount()) != size) [[unlikely]] {
            return Err(Error::Code::SourceReadError, "Short read from " + path_, offset);
        }
        return Ok();
    }

    [[nodiscard]] Result<Region> write(std::size_t offset, std::size_t size) noexcept
        requires (Access::can_write) {
        if (!is_valid()) [[unlikely]] {
            return Err(Error::Code::SinkWriteError, "File is not open");
        }
        if (offset > size_ || size > size_ - offset) [[unlikely]] {
            return Err(Error::Code::OutOfBounds,
                       "Write of " + std::to_string(size) + " bytes past the end of " + path_, offset);
        }
        std::vector<std::byte> staged;
        try {
            staged.resize(size);
        } catch (const std::bad_alloc&) {
            return Err(Error::Code::MemoryError, "Failed to stage " + std::to_string(size) + " bytes", offset);
        }
        return FileRegion(std::move(staged), &file_, &mutex_, offset);
    }

    /// @brief Truncate or extend the file to `new_size` bytes
    [[nodiscard]] Result<void> resize(std::size_t new_size) noexcept
        requires (Access::can_write) {
        if (!is_valid()) [[unlikely]] {
            return Err(Error::Code::SinkWriteError, "File is not open");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        file_.flush();
        std::error_code ec;
        std::filesystem::resize_file(path_, new_size, ec);
        if (ec) [[unlikely]] {
            return Err(Error::Code::SinkWriteError,
                       "Cannot resize " + path_ + " to " + std::to_string(new_size) + " bytes: " + ec.message());
        }
        file_.clear();
        size_ = new_size;
        return Ok();
    }

    [[nodiscard]] Result<void> flush() noexcept
        requires (Access::can_write) {
        if (!is_valid()) [[unlikely]] {
            return Err(Error::Code::SinkWriteError, "File is not open");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        file_.flush();
        if (!file_) [[unlikely]] {
            return Err(Error::Code::SinkWriteError, "Failed to flush " + path_);
        }
        return Ok();
    }
};

/// Decode straight from a file
using StreamFileReader = StreamFileBase<file_access::ReadOnly>;
static_assert(RawReader<StreamFileReader>);

/// Encode straight into a file
using StreamFileWriter = StreamFileBase<file_access::WriteOnly>;
static_assert(RawWriter<StreamFileWriter>);

} // namespace dmconcept
