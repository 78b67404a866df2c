#include <gtest/gtest.h>
#include <array>
#include <bit>
#include <cstring>
#include <string>
#include <vector>

#include "../dmconcept/include/dmconcept/readers/reader_buffer.hpp"
#include "../dmconcept/include/dmconcept/readers/reader_stream.hpp"
#include "../dmconcept/include/dmconcept/tag_stream.hpp"

using namespace dmconcept;

namespace {

std::vector<std::byte> bytes_of(std::initializer_list<int> values) {
    std::vector<std::byte> out;
    for (int v : values) {
        out.push_back(static_cast<std::byte>(v));
    }
    return out;
}

} // namespace

// ============================================================================
// TagStreamReader
// ============================================================================

TEST(TagStreamReader, ReadsBothEndiannesses) {
    auto data = bytes_of({0x00, 0x00, 0x00, 0x03, 0x03, 0x00, 0x00, 0x00, 0x12, 0x34});
    BufferViewReader source{std::span<const std::byte>(data)};
    auto stream_result = TagStreamReader<BufferViewReader>::open(source);
    ASSERT_TRUE(stream_result.is_ok());
    auto& stream = stream_result.value();

    EXPECT_EQ(stream.read_i32(std::endian::big).value(), 3);
    EXPECT_EQ(stream.read_u32(std::endian::little).value(), 3u);
    EXPECT_EQ(stream.read_u16(std::endian::big).value(), 0x1234);
    EXPECT_EQ(stream.remaining(), 0u);
}

TEST(TagStreamReader, ReadsFloatingPoint) {
    std::vector<std::byte> data(12);
    store_value<double>(std::span<std::byte>(data).subspan(0, 8), 2.5, std::endian::little);
    store_value<float>(std::span<std::byte>(data).subspan(8, 4), -1.25f, std::endian::big);

    BufferViewReader source{std::span<const std::byte>(data)};
    auto stream = std::move(TagStreamReader<BufferViewReader>::open(source).value());

    EXPECT_DOUBLE_EQ(stream.read_f64(std::endian::little).value(), 2.5);
    EXPECT_FLOAT_EQ(stream.read_f32(std::endian::big).value(), -1.25f);
}

TEST(TagStreamReader, BoolIsAnyNonZeroByte) {
    auto data = bytes_of({0x00, 0x01, 0x7F});
    BufferViewReader source{std::span<const std::byte>(data)};
    auto stream = std::move(TagStreamReader<BufferViewReader>::open(source).value());

    EXPECT_FALSE(stream.read<bool>(std::endian::little).value());
    EXPECT_TRUE(stream.read<bool>(std::endian::little).value());
    EXPECT_TRUE(stream.read<bool>(std::endian::little).value());
}

TEST(TagStreamReader, ValuesAcrossWindowBoundaries) {
    std::vector<std::byte> data(1000);
    for (size_t i = 0; i < data.size() / 2; ++i) {
        store_value<uint16_t>(std::span<std::byte>(data).subspan(i * 2, 2), static_cast<uint16_t>(i * 3),
                              std::endian::big);
    }
    BufferViewReader source{std::span<const std::byte>(data)};
    // A 17-byte window puts every other value across a refill
    auto stream = std::move(TagStreamReader<BufferViewReader>::open(source, 17).value());

    for (size_t i = 0; i < data.size() / 2; ++i) {
        auto value = stream.read_u16(std::endian::big);
        ASSERT_TRUE(value.is_ok()) << "at value " << i;
        EXPECT_EQ(value.value(), static_cast<uint16_t>(i * 3));
    }
    EXPECT_EQ(stream.tell(), data.size());
}

TEST(TagStreamReader, StringsAndBlocks) {
    std::vector<std::byte> data;
    for (char c : std::string("ImageList")) {
        data.push_back(static_cast<std::byte>(c));
    }
    for (int i = 0; i < 300; ++i) {
        data.push_back(static_cast<std::byte>(i));
    }
    BufferViewReader source{std::span<const std::byte>(data)};
    auto stream = std::move(TagStreamReader<BufferViewReader>::open(source, 16).value());

    EXPECT_EQ(stream.read_string(9).value(), "ImageList");
    auto block = stream.read_bytes(300);
    ASSERT_TRUE(block.is_ok());
    ASSERT_EQ(block.value().size(), 300u);
    EXPECT_EQ(block.value()[0], std::byte{0});
    EXPECT_EQ(block.value()[299], static_cast<std::byte>(299 % 256));
}

TEST(TagStreamReader, ReadIntoMixesWindowAndDirectReads) {
    std::vector<std::byte> data(256);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<std::byte>(i);
    }
    BufferViewReader source{std::span<const std::byte>(data)};
    auto stream = std::move(TagStreamReader<BufferViewReader>::open(source, 32).value());

    // Fill the window, then read a block that starts inside it and ends past it
    ASSERT_TRUE(stream.read_u8().is_ok());
    std::array<std::byte, 100> block{};
    ASSERT_TRUE(stream.read_into(block).is_ok());
    EXPECT_EQ(std::memcmp(block.data(), data.data() + 1, block.size()), 0);
    EXPECT_EQ(stream.tell(), 101u);
}

TEST(TagStreamReader, SkipAndSeek) {
    std::vector<std::byte> data(64);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<std::byte>(i);
    }
    BufferViewReader source{std::span<const std::byte>(data)};
    auto stream = std::move(TagStreamReader<BufferViewReader>::open(source).value());

    ASSERT_TRUE(stream.skip(10).is_ok());
    EXPECT_EQ(stream.read_u8().value(), 10);
    ASSERT_TRUE(stream.seek(3).is_ok());
    EXPECT_EQ(stream.read_u8().value(), 3);
    ASSERT_TRUE(stream.seek(64).is_ok());
    EXPECT_EQ(stream.remaining(), 0u);
}

TEST(TagStreamReader, TruncationCarriesTheOffset) {
    auto data = bytes_of({0x01, 0x02, 0x03, 0x04, 0x05, 0x06});
    BufferViewReader source{std::span<const std::byte>(data)};
    auto stream = std::move(TagStreamReader<BufferViewReader>::open(source).value());

    ASSERT_TRUE(stream.read_u32(std::endian::big).is_ok());
    auto value = stream.read_u32(std::endian::big);
    ASSERT_TRUE(value.is_error());
    EXPECT_EQ(value.error().code, Error::Code::TruncatedInput);
    ASSERT_TRUE(value.error().offset.has_value());
    EXPECT_EQ(*value.error().offset, 4u);

    EXPECT_EQ(stream.skip(3).error().code, Error::Code::TruncatedInput);
    EXPECT_EQ(stream.read_bytes(3).error().code, Error::Code::TruncatedInput);
    EXPECT_EQ(stream.seek(7).error().code, Error::Code::TruncatedInput);
}

TEST(TagStreamReader, ClosedSourceCannotBeOpened) {
    StreamFileReader closed;
    auto stream = TagStreamReader<StreamFileReader>::open(closed);
    ASSERT_TRUE(stream.is_error());
    EXPECT_EQ(stream.error().code, Error::Code::SourceReadError);
}

// ============================================================================
// TagStreamWriter
// ============================================================================

TEST(TagStreamWriter, WritesBothEndiannesses) {
    BufferWriter sink(10);
    TagStreamWriter<BufferWriter> stream(sink);

    ASSERT_TRUE(stream.write_i32(3, std::endian::big).is_ok());
    ASSERT_TRUE(stream.write_u32(3, std::endian::little).is_ok());
    ASSERT_TRUE(stream.write_u16(0x1234, std::endian::big).is_ok());
    EXPECT_EQ(stream.tell(), 10u);
    ASSERT_TRUE(stream.flush().is_ok());

    EXPECT_EQ(sink.data(), bytes_of({0x00, 0x00, 0x00, 0x03, 0x03, 0x00, 0x00, 0x00, 0x12, 0x34}));
}

TEST(TagStreamWriter, StringsZerosAndStartOffset) {
    BufferWriter sink(12);
    TagStreamWriter<BufferWriter> stream(sink, 2);

    ASSERT_TRUE(stream.write_string("%%%%").is_ok());
    ASSERT_TRUE(stream.write_zeros(4).is_ok());
    ASSERT_TRUE(stream.write_u8(0xAB).is_ok());
    EXPECT_EQ(stream.tell(), 11u);
    ASSERT_TRUE(stream.flush().is_ok());

    EXPECT_EQ(sink.data(), bytes_of({0, 0, '%', '%', '%', '%', 0, 0, 0, 0, 0xAB, 0}));
}

TEST(TagStreamWriter, CommitsWhenTheWindowFills) {
    BufferWriter sink(40);
    TagStreamWriter<BufferWriter> stream(sink, 0, 16);

    for (uint8_t i = 0; i < 40; ++i) {
        ASSERT_TRUE(stream.write_u8(i).is_ok());
    }
    // The first 32 bytes were committed by the window, the rest is pending
    EXPECT_EQ(sink.data()[31], std::byte{31});
    EXPECT_EQ(sink.data()[39], std::byte{0});

    ASSERT_TRUE(stream.flush().is_ok());
    EXPECT_EQ(sink.data()[39], std::byte{39});
}

TEST(TagStreamWriter, SeekCommitsAndMoves) {
    BufferWriter sink(8);
    TagStreamWriter<BufferWriter> stream(sink);

    ASSERT_TRUE(stream.write_u16(0xBEEF, std::endian::big).is_ok());
    ASSERT_TRUE(stream.seek(6).is_ok());
    EXPECT_EQ(sink.data()[0], std::byte{0xBE});
    ASSERT_TRUE(stream.write_u16(0xCAFE, std::endian::little).is_ok());
    ASSERT_TRUE(stream.flush().is_ok());

    EXPECT_EQ(sink.data(), bytes_of({0xBE, 0xEF, 0, 0, 0, 0, 0xFE, 0xCA}));
}

TEST(TagStreamWriter, LargeBlocksBypassTheWindow) {
    std::vector<std::byte> block(1000);
    for (size_t i = 0; i < block.size(); ++i) {
        block[i] = static_cast<std::byte>(i * 7);
    }
    BufferWriter sink(1004);
    TagStreamWriter<BufferWriter> stream(sink, 0, 64);

    ASSERT_TRUE(stream.write_u32(1000, std::endian::big).is_ok());
    ASSERT_TRUE(stream.write_bytes(block).is_ok());
    ASSERT_TRUE(stream.flush().is_ok());

    EXPECT_EQ(std::memcmp(sink.data().data() + 4, block.data(), block.size()), 0);
}

TEST(TagStreamWriter, SinkTooSmallIsAWriteError) {
    std::vector<std::byte> buffer(4);
    BufferViewWriter sink{std::span<std::byte>(buffer)};
    TagStreamWriter<BufferViewWriter> stream(sink);

    ASSERT_TRUE(stream.write_u64(1, std::endian::big).is_ok());
    auto flushed = stream.flush();
    ASSERT_TRUE(flushed.is_error());
    EXPECT_EQ(flushed.error().code, Error::Code::SinkWriteError);
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
