#include <gtest/gtest.h>
#include <cstdint>
#include <cstring>
#include <variant>
#include <vector>

#include "../dmconcept/include/dmconcept/dmconcept.hpp"

using namespace dmconcept;

namespace {

constexpr std::size_t kSmallChunk = 4096;

NDArray float_ramp(std::vector<uint64_t> shape) {
    uint64_t count = 1;
    for (uint64_t extent : shape) {
        count *= extent;
    }
    std::vector<float> values(static_cast<std::size_t>(count));
    for (std::size_t i = 0; i < values.size(); ++i) {
        values[i] = static_cast<float>(i) * 0.5f;
    }
    return NDArray::from_values<float>(DataType::Float32, std::move(shape), values);
}

std::vector<std::byte> encode_with(const NDArray& array, const ArrayMetadata& metadata,
                                   DmVersion version, StreamingParams params) {
    BufferWriter sink;
    auto res = encode(array, metadata, sink, version, CodecOptions{params});
    EXPECT_TRUE(res.is_ok()) << res.error().message;
    return sink.data();
}

std::vector<std::byte> sequential_bytes(std::size_t size) {
    std::vector<std::byte> bytes(size);
    for (std::size_t i = 0; i < size; ++i) {
        bytes[i] = static_cast<std::byte>((i * 31) & 0xFF);
    }
    return bytes;
}

} // namespace

// ============================================================================
// Streaming parameters
// ============================================================================

TEST(StreamingParams, Presets) {
    const auto defaults = StreamingParams::defaults();
    EXPECT_EQ(defaults.threshold_bytes, 64ull * 1024 * 1024);
    EXPECT_EQ(defaults.chunk_bytes, 16u * 1024 * 1024);
    EXPECT_FALSE(defaults.should_stream(64ull * 1024 * 1024));
    EXPECT_TRUE(defaults.should_stream(64ull * 1024 * 1024 + 1));

    EXPECT_FALSE(StreamingParams::in_memory().should_stream(1ull << 40));

    const auto always = StreamingParams::always(0);
    EXPECT_TRUE(always.should_stream(1));
    EXPECT_EQ(always.chunk_bytes, 1u);
}

TEST(StreamingParams, ExternalThresholdHasAFloor) {
    EXPECT_EQ(StreamingParams::always(kSmallChunk).external_threshold(), StreamingParams::min_external_bytes);
    EXPECT_EQ(StreamingParams::defaults().external_threshold(), 64ull * 1024 * 1024);
}

// ============================================================================
// ChunkedCopier
// ============================================================================

TEST(ChunkedCopier, CopiesInBoundedChunks) {
    BufferReader source(sequential_bytes(10000));
    BufferWriter sink(10100);
    ChunkedCopier copier(StreamingParams::always(1024));

    ASSERT_TRUE(copier.copy(source, 0, sink, 100, 10000).is_ok());
    EXPECT_EQ(copier.chunks_moved(), 10u);
    EXPECT_EQ(std::memcmp(sink.data().data() + 100, source.data().data(), 10000), 0);
}

TEST(ChunkedCopier, ShortSourceIsAReadError) {
    BufferReader source(sequential_bytes(100));
    BufferWriter sink(200);
    ChunkedCopier copier(StreamingParams::always(64));

    auto res = copier.copy(source, 50, sink, 0, 200);
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().code, Error::Code::SourceReadError);
}

TEST(ChunkedCopier, TransposeMatchesInMemoryTranspose) {
    constexpr std::size_t rows = 37;
    constexpr std::size_t cols = 53;
    constexpr std::size_t element = 4;
    const auto matrix = sequential_bytes(rows * cols * element);

    std::vector<std::byte> expected(matrix.size());
    transpose_bytes(matrix, expected, rows, cols, element);

    BufferReader source{std::vector<std::byte>(matrix)};
    BufferWriter sink(matrix.size());
    // Tiles of 16 elements force many partial tiles on both axes
    ChunkedCopier copier(StreamingParams::always(16 * element));
    ASSERT_TRUE(copier.transpose(source, 0, sink, 0, rows, cols, element).is_ok());
    EXPECT_EQ(sink.data(), expected);
    EXPECT_GT(copier.chunks_moved(), rows);
}

TEST(ChunkedCopier, TransposeOfAVectorIsACopy) {
    const auto row = sequential_bytes(64);
    BufferReader source{std::vector<std::byte>(row)};
    BufferWriter sink(64);
    ChunkedCopier copier(StreamingParams::always(8));

    ASSERT_TRUE(copier.transpose(source, 0, sink, 0, 1, 16, 4).is_ok());
    EXPECT_EQ(sink.data(), row);
}

TEST(TransposeBytes, SwapsRowsAndColumns) {
    const std::vector<std::byte> src = {std::byte{1}, std::byte{2}, std::byte{3},
                                        std::byte{4}, std::byte{5}, std::byte{6}};
    std::vector<std::byte> dst(6);
    transpose_bytes(src, dst, 2, 3, 1);
    const std::vector<std::byte> expected = {std::byte{1}, std::byte{4}, std::byte{2},
                                             std::byte{5}, std::byte{3}, std::byte{6}};
    EXPECT_EQ(dst, expected);
}

// ============================================================================
// Streamed encode and decode
// ============================================================================

class StreamedCodec : public ::testing::TestWithParam<DmVersion> {};

TEST_P(StreamedCodec, StreamedImageMatchesInMemory) {
    // 160 KB of payload, above the tag-tree floor
    NDArray array = float_ramp({200, 200});
    ArrayMetadata metadata = ArrayMetadata::plain(DataType::Float32, array.shape);
    metadata.axes[0].calibration = Calibration{0.0, 0.5, "nm"};

    const auto in_memory = encode_with(array, metadata, GetParam(), StreamingParams::in_memory());
    const auto streamed = encode_with(array, metadata, GetParam(), StreamingParams::always(kSmallChunk));
    EXPECT_EQ(streamed, in_memory);

    BufferViewReader source{std::span<const std::byte>(streamed)};
    auto decoded = decode(source, CodecOptions{StreamingParams::always(kSmallChunk)});
    ASSERT_TRUE(decoded.is_ok()) << decoded.error().message;
    EXPECT_EQ(decoded.value().array, array);
    EXPECT_DOUBLE_EQ(decoded.value().metadata.axes[0].calibration.scale, 0.5);
}

TEST_P(StreamedCodec, StreamedSpectrumImageIsTransposed) {
    // Spectrum images are stored energy-major, so both directions transpose
    NDArray array = float_ramp({20, 30, 100});
    ArrayMetadata metadata = ArrayMetadata::plain(DataType::Float32, array.shape);
    metadata.axes[1].kind = AxisKind::Collection;
    metadata.axes[2].calibration = Calibration{100.0, 0.25, "eV"};

    const auto in_memory = encode_with(array, metadata, GetParam(), StreamingParams::in_memory());
    const auto streamed = encode_with(array, metadata, GetParam(), StreamingParams::always(kSmallChunk));
    EXPECT_EQ(streamed, in_memory);

    BufferViewReader source{std::span<const std::byte>(streamed)};
    auto from_memory = decode(source, CodecOptions{StreamingParams::in_memory()});
    auto from_stream = decode(source, CodecOptions{StreamingParams::always(kSmallChunk)});
    ASSERT_TRUE(from_memory.is_ok()) << from_memory.error().message;
    ASSERT_TRUE(from_stream.is_ok()) << from_stream.error().message;
    EXPECT_EQ(from_memory.value().array, array);
    EXPECT_EQ(from_stream.value().array, array);
    EXPECT_EQ(from_stream.value().metadata.axes[2].calibration.units, "eV");
}

TEST_P(StreamedCodec, DecodeIntoStore) {
    NDArray array = float_ramp({20, 30, 100});
    ArrayMetadata metadata = ArrayMetadata::plain(DataType::Float32, array.shape);
    metadata.axes[1].kind = AxisKind::Collection;
    const auto file = encode_with(array, metadata, GetParam(), StreamingParams::in_memory());

    BufferViewReader source{std::span<const std::byte>(file)};
    BufferReadWriter store;
    auto decoded = decode_into(source, store, CodecOptions{StreamingParams::always(kSmallChunk)});
    ASSERT_TRUE(decoded.is_ok()) << decoded.error().message;
    EXPECT_EQ(decoded.value().shape(), array.shape);
    EXPECT_EQ(store.data(), array.data);
}

TEST_P(StreamedCodec, EncodeFromStore) {
    NDArray array = float_ramp({150, 150});
    ArrayMetadata metadata = ArrayMetadata::plain(DataType::Float32, array.shape);
    const auto expected = encode_with(array, metadata, GetParam(), StreamingParams::in_memory());

    for (const auto& params : {StreamingParams::in_memory(), StreamingParams::always(kSmallChunk)}) {
        BufferReader store{std::vector<std::byte>(array.data)};
        BufferWriter sink;
        auto res = encode_from(store, metadata, sink, GetParam(), CodecOptions{params});
        ASSERT_TRUE(res.is_ok()) << res.error().message;
        EXPECT_EQ(sink.data(), expected);
    }
}

TEST_P(StreamedCodec, StoreOfTheWrongSizeIsRejected) {
    ArrayMetadata metadata = ArrayMetadata::plain(DataType::Float32, std::vector<uint64_t>{10, 10});
    BufferReader store(std::size_t{399});
    BufferWriter sink;

    auto res = encode_from(store, metadata, sink, GetParam());
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().code, Error::Code::InvalidMetadata);
    EXPECT_TRUE(sink.data().empty());
}

TEST_P(StreamedCodec, LargeTagArraysStayInTheSource) {
    NDArray array = float_ramp({200, 200});
    const auto file = encode_with(array, ArrayMetadata::plain(DataType::Float32, array.shape), GetParam(),
                                  StreamingParams::in_memory());

    BufferViewReader source{std::span<const std::byte>(file)};
    auto tree = read_tag_file(source, TreeDecodeOptions{StreamingParams::min_external_bytes});
    ASSERT_TRUE(tree.is_ok()) << tree.error().message;

    auto image = extract_image(tree.value().root);
    ASSERT_TRUE(image.is_ok()) << image.error().message;
    const auto* external = std::get_if<ExternalPayload>(&image.value().data->payload);
    ASSERT_NE(external, nullptr);
    EXPECT_EQ(external->byte_length, array.data.size());
    EXPECT_EQ(std::memcmp(file.data() + external->offset, array.data.data(), array.data.size()), 0);
}

TEST_P(StreamedCodec, LargeVendorArraysAreReadOnDecode) {
    NDArray array = float_ramp({300, 300});
    ArrayMetadata metadata = ArrayMetadata::plain(DataType::Float32, array.shape);
    std::vector<uint8_t> thumb(100 * 1024);
    for (std::size_t i = 0; i < thumb.size(); ++i) {
        thumb[i] = static_cast<uint8_t>(i * 13);
    }
    metadata.properties.add("Thumb", make_array(thumb));
    const auto file = encode_with(array, metadata, GetParam(), StreamingParams::in_memory());

    DecodedImage decoded;
    {
        // The source is gone before anything is re-encoded
        const std::vector<std::byte> copy = file;
        BufferViewReader source{std::span<const std::byte>(copy)};
        auto result = decode(source, CodecOptions{StreamingParams::always(kSmallChunk)});
        ASSERT_TRUE(result.is_ok()) << result.error().message;
        decoded = std::move(result.value());
    }
    const TagValue* entry = decoded.metadata.properties.find("Thumb");
    ASSERT_NE(entry, nullptr);
    const auto* stored = std::get_if<TagArray>(entry);
    ASSERT_NE(stored, nullptr);
    ASSERT_TRUE(stored->is_inline());
    EXPECT_EQ(std::memcmp(stored->bytes().data(), thumb.data(), thumb.size()), 0);

    EXPECT_EQ(encode_with(decoded.array, decoded.metadata, GetParam(), StreamingParams::in_memory()), file);
    EXPECT_EQ(encode_with(decoded.array, decoded.metadata, GetParam(), StreamingParams::always(kSmallChunk)), file);
}

TEST_P(StreamedCodec, DecodeIntoReadsLargeVendorArrays) {
    NDArray array = float_ramp({10, 10});
    ArrayMetadata metadata = ArrayMetadata::plain(DataType::Float32, array.shape);
    metadata.properties.group("Acquisition").add("Gain", make_array(std::vector<float>(32 * 1024, 1.5f)));
    const auto file = encode_with(array, metadata, GetParam(), StreamingParams::in_memory());

    BufferViewReader source{std::span<const std::byte>(file)};
    BufferReadWriter store;
    auto decoded = decode_into(source, store, CodecOptions{StreamingParams::always(kSmallChunk)});
    ASSERT_TRUE(decoded.is_ok()) << decoded.error().message;
    const TagGroup* acquisition = decoded.value().properties.find_group("Acquisition");
    ASSERT_NE(acquisition, nullptr);
    const TagValue* gain = acquisition->find("Gain");
    ASSERT_NE(gain, nullptr);
    EXPECT_TRUE(std::get<TagArray>(*gain).is_inline());
    EXPECT_EQ(store.data(), array.data);
}

INSTANTIATE_TEST_SUITE_P(BothVersions, StreamedCodec, ::testing::Values(DmVersion::DM3, DmVersion::DM4),
                         [](const ::testing::TestParamInfo<DmVersion>& info) {
                             return info.param == DmVersion::DM3 ? std::string("DM3") : std::string("DM4");
                         });

// ============================================================================
// Main
// ============================================================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
