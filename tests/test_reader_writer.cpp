#include <gtest/gtest.h>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "../dmconcept/include/dmconcept/readers/reader_buffer.hpp"
#include "../dmconcept/include/dmconcept/readers/reader_stream.hpp"

using namespace dmconcept;
namespace fs = std::filesystem;

namespace {

std::vector<std::byte> pattern(std::size_t size) {
    std::vector<std::byte> bytes(size);
    for (std::size_t i = 0; i < size; ++i) {
        bytes[i] = static_cast<std::byte>((i * 7 + 3) & 0xFF);
    }
    return bytes;
}

std::string temp_path(const std::string& name) {
    return (fs::temp_directory_path() / name).string();
}

void write_file(const std::string& path, const std::vector<std::byte>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

std::vector<std::byte> file_bytes(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::vector<std::byte> bytes(static_cast<std::size_t>(fs::file_size(path)));
    in.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    return bytes;
}

template <typename Writer>
void put(Writer& writer, std::size_t offset, const std::vector<std::byte>& bytes) {
    auto region = writer.write(offset, bytes.size());
    ASSERT_TRUE(region.is_ok()) << region.error().message;
    auto r = std::move(region.value());
    ASSERT_EQ(r.size(), bytes.size());
    std::memcpy(r.data().data(), bytes.data(), bytes.size());
    ASSERT_TRUE(r.flush().is_ok());
}

} // namespace

// ============================================================================
// Byte sources
// ============================================================================

/// Owns the bytes behind each source type for the duration of a test
template <typename Source>
struct SourceHolder;

template <>
struct SourceHolder<BufferViewReader> {
    std::vector<std::byte> bytes;
    BufferViewReader source;
    explicit SourceHolder(std::vector<std::byte> b) : bytes(std::move(b)), source(std::span<const std::byte>(bytes)) {}
};

template <>
struct SourceHolder<BufferReader> {
    BufferReader source;
    explicit SourceHolder(std::vector<std::byte> b) : source(std::move(b)) {}
};

template <>
struct SourceHolder<StreamFileReader> {
    std::string path = temp_path("dmconcept_source_test.bin");
    StreamFileReader source;
    explicit SourceHolder(std::vector<std::byte> b) {
        write_file(path, b);
        EXPECT_TRUE(source.open(path).is_ok());
    }
    ~SourceHolder() {
        source.close();
        std::remove(path.c_str());
    }
};

template <typename Source>
class ByteSourceTest : public ::testing::Test {
protected:
    std::vector<std::byte> expected = pattern(3000);
    SourceHolder<Source> holder{expected};
    Source& source() { return holder.source; }
};

using SourceTypes = ::testing::Types<BufferViewReader, BufferReader, StreamFileReader>;
TYPED_TEST_SUITE(ByteSourceTest, SourceTypes);

TYPED_TEST(ByteSourceTest, ReportsItsSize) {
    EXPECT_TRUE(this->source().is_valid());
    ASSERT_TRUE(this->source().size().is_ok());
    EXPECT_EQ(this->source().size().value(), 3000u);
}

TYPED_TEST(ByteSourceTest, ReadsAnExactRange) {
    std::vector<std::byte> out(100);
    ASSERT_TRUE(this->source().read_into(out.data(), 1234, out.size()).is_ok());
    EXPECT_EQ(std::memcmp(out.data(), this->expected.data() + 1234, out.size()), 0);
}

TYPED_TEST(ByteSourceTest, ReadsTheLastByte) {
    std::byte last{};
    ASSERT_TRUE(this->source().read_into(&last, 2999, 1).is_ok());
    EXPECT_EQ(last, this->expected.back());
}

TYPED_TEST(ByteSourceTest, RangePastTheEndIsOutOfBounds) {
    std::vector<std::byte> out(16);
    auto res = this->source().read_into(out.data(), 2990, out.size());
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().code, Error::Code::OutOfBounds);
    EXPECT_EQ(res.error().offset.value_or(0), 2990u);
}

TYPED_TEST(ByteSourceTest, EmptyReadAtTheEnd) {
    EXPECT_TRUE(this->source().read_into(nullptr, 3000, 0).is_ok());
}

TYPED_TEST(ByteSourceTest, RandomAccessInAnyOrder) {
    for (std::size_t offset : {2900u, 0u, 1500u, 7u}) {
        std::vector<std::byte> out(50);
        ASSERT_TRUE(this->source().read_into(out.data(), offset, out.size()).is_ok());
        EXPECT_EQ(std::memcmp(out.data(), this->expected.data() + offset, out.size()), 0) << "offset " << offset;
    }
}

// ============================================================================
// Byte sinks
// ============================================================================

TEST(MemorySinks, OwnedBufferGrowsAndShrinks) {
    BufferWriter sink;
    EXPECT_EQ(sink.size().value(), 0u);
    ASSERT_TRUE(sink.resize(64).is_ok());
    put(sink, 60, pattern(4));
    EXPECT_EQ(sink.data()[60], pattern(4)[0]);

    ASSERT_TRUE(sink.resize(8).is_ok());
    EXPECT_EQ(sink.data().size(), 8u);
}

TEST(MemorySinks, RegionsPastTheEndAreRejected) {
    BufferWriter sink(10);
    auto region = sink.write(8, 4);
    ASSERT_TRUE(region.is_error());
    EXPECT_EQ(region.error().code, Error::Code::OutOfBounds);
    EXPECT_TRUE(sink.write(10, 0).is_ok());
}

TEST(MemorySinks, BorrowedBufferWritesInPlace) {
    std::vector<std::byte> storage(32);
    BufferViewWriter sink{std::span<std::byte>(storage)};
    put(sink, 4, pattern(8));
    EXPECT_EQ(std::memcmp(storage.data() + 4, pattern(8).data(), 8), 0);
    EXPECT_EQ(sink.buffer().data(), storage.data());
}

TEST(MemorySinks, BorrowedBufferKeepsItsSize) {
    std::vector<std::byte> storage(32);
    BufferViewWriter sink{std::span<std::byte>(storage)};
    EXPECT_TRUE(sink.resize(32).is_ok());
    auto res = sink.resize(33);
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().code, Error::Code::SinkWriteError);
}

TEST(MemorySinks, ReadWriteBufferIsAnArrayStore) {
    BufferReadWriter store;
    ASSERT_TRUE(store.resize(16).is_ok());
    put(store, 0, pattern(16));

    std::vector<std::byte> back(16);
    ASSERT_TRUE(store.read_into(back.data(), 0, back.size()).is_ok());
    EXPECT_EQ(back, pattern(16));
}

// ============================================================================
// Files
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
    std::string path = temp_path("dmconcept_sink_test.dm4");

    void SetUp() override { fs::remove(path); }
    void TearDown() override { fs::remove(path); }
};

TEST_F(FileSinkTest, WriterCreatesTheFile) {
    StreamFileWriter writer;
    ASSERT_TRUE(writer.open(path).is_ok());
    EXPECT_TRUE(writer.is_valid());
    EXPECT_EQ(writer.size().value(), 0u);
    EXPECT_TRUE(fs::exists(path));
    EXPECT_EQ(writer.path(), path);
}

TEST_F(FileSinkTest, RegionReachesTheFileOnFlush) {
    StreamFileWriter writer(path);
    ASSERT_TRUE(writer.is_valid());
    ASSERT_TRUE(writer.resize(100).is_ok());
    put(writer, 10, pattern(20));
    ASSERT_TRUE(writer.flush().is_ok());
    writer.close();

    const auto bytes = file_bytes(path);
    ASSERT_EQ(bytes.size(), 100u);
    EXPECT_EQ(std::memcmp(bytes.data() + 10, pattern(20).data(), 20), 0);
    EXPECT_EQ(bytes[0], std::byte{0});
}

TEST_F(FileSinkTest, UnflushedRegionWritesNothing) {
    StreamFileWriter writer(path);
    ASSERT_TRUE(writer.resize(8).is_ok());
    {
        auto region = writer.write(0, 8);
        ASSERT_TRUE(region.is_ok());
        std::memset(region.value().data().data(), 0xFF, 8);
    }
    writer.close();
    EXPECT_EQ(file_bytes(path), std::vector<std::byte>(8));
}

TEST_F(FileSinkTest, ResizeShrinksAnExistingFile) {
    write_file(path, pattern(500));
    StreamFileWriter writer(path);
    EXPECT_EQ(writer.size().value(), 500u);
    ASSERT_TRUE(writer.resize(50).is_ok());
    put(writer, 0, pattern(2));
    writer.close();

    const auto bytes = file_bytes(path);
    ASSERT_EQ(bytes.size(), 50u);
    EXPECT_EQ(bytes[10], pattern(50)[10]);
}

TEST_F(FileSinkTest, WriteBeyondTheSizeIsRejected) {
    StreamFileWriter writer(path);
    ASSERT_TRUE(writer.resize(4).is_ok());
    auto region = writer.write(2, 4);
    ASSERT_TRUE(region.is_error());
    EXPECT_EQ(region.error().code, Error::Code::OutOfBounds);
}

TEST_F(FileSinkTest, MissingFileIsNotFound) {
    StreamFileReader reader;
    auto res = reader.open(path);
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().code, Error::Code::FileNotFound);
    EXPECT_FALSE(reader.is_valid());
    EXPECT_EQ(reader.size().error().code, Error::Code::SourceReadError);
}

TEST_F(FileSinkTest, ClosedFileCannotBeUsed) {
    StreamFileWriter writer(path);
    writer.close();
    EXPECT_FALSE(writer.is_valid());
    EXPECT_EQ(writer.write(0, 1).error().code, Error::Code::SinkWriteError);
    EXPECT_EQ(writer.resize(1).error().code, Error::Code::SinkWriteError);
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
