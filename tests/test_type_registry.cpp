#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "../dmconcept/include/dmconcept/readers/reader_buffer.hpp"
#include "../dmconcept/include/dmconcept/type_registry.hpp"
#include "../dmconcept/include/dmconcept/types.hpp"

using namespace dmconcept;

using DM3 = WidthPolicy<DmVersion::DM3>;
using DM4 = WidthPolicy<DmVersion::DM4>;

// ============================================================================
// Type table
// ============================================================================

TEST(TypeRegistry, KnownCodesHaveTheirWidths) {
    EXPECT_EQ(width_of(PrimitiveType::Int16), 2u);
    EXPECT_EQ(width_of(PrimitiveType::Int32), 4u);
    EXPECT_EQ(width_of(PrimitiveType::UInt16), 2u);
    EXPECT_EQ(width_of(PrimitiveType::UInt32), 4u);
    EXPECT_EQ(width_of(PrimitiveType::Float32), 4u);
    EXPECT_EQ(width_of(PrimitiveType::Float64), 8u);
    EXPECT_EQ(width_of(PrimitiveType::Bool), 1u);
    EXPECT_EQ(width_of(PrimitiveType::Int8), 1u);
    EXPECT_EQ(width_of(PrimitiveType::UInt8), 1u);
    EXPECT_EQ(width_of(PrimitiveType::Int64), 8u);
    EXPECT_EQ(width_of(PrimitiveType::UInt64), 8u);
    EXPECT_FALSE(width_of(PrimitiveType::String).has_value());
}

TEST(TypeRegistry, StructuredAndUnknownCodesAreNotPrimitives) {
    EXPECT_EQ(find_primitive_type(kStructTypeCode), nullptr);
    EXPECT_EQ(find_primitive_type(kArrayTypeCode), nullptr);
    EXPECT_EQ(find_primitive_type(0), nullptr);
    EXPECT_EQ(find_primitive_type(13), nullptr);
    EXPECT_EQ(find_primitive_type(99), nullptr);

    auto type = primitive_type_from_code(99, 42);
    ASSERT_TRUE(type.is_error());
    EXPECT_EQ(type.error().code, Error::Code::UnknownTypeCode);
    ASSERT_TRUE(type.error().offset.has_value());
    EXPECT_EQ(*type.error().offset, 42u);
}

TEST(TypeRegistry, NamesAndCompileTimeTypes) {
    EXPECT_EQ(type_name(PrimitiveType::Float32), "float32");
    EXPECT_EQ(type_name(PrimitiveType::String), "string");
    static_assert(primitive_type_of_v<int16_t> == PrimitiveType::Int16);
    static_assert(primitive_type_of_v<double> == PrimitiveType::Float64);
    static_assert(primitive_type_of_v<bool> == PrimitiveType::Bool);
    EXPECT_EQ(type_of(ScalarValue{uint8_t{7}}), PrimitiveType::UInt8);
    EXPECT_EQ(type_of(ScalarValue{std::u16string(u"abc")}), PrimitiveType::String);
}

TEST(TypeRegistry, StructWidthSumsFields) {
    std::vector<PrimitiveType> complex_fields = {PrimitiveType::Float32, PrimitiveType::Float32};
    EXPECT_EQ(struct_width(complex_fields), 8u);

    std::vector<PrimitiveType> with_string = {PrimitiveType::Int32, PrimitiveType::String};
    EXPECT_FALSE(struct_width(with_string).has_value());
}

TEST(TypeRegistry, ImageDataTypes) {
    EXPECT_EQ(data_type_size(DataType::Int16), 2u);
    EXPECT_EQ(data_type_size(DataType::Complex64), 8u);
    EXPECT_EQ(data_type_size(DataType::Complex128), 16u);
    EXPECT_EQ(data_type_size(DataType::RGBA8), 4u);
    EXPECT_TRUE(data_type_is_complex(DataType::Complex64));
    EXPECT_FALSE(data_type_is_complex(DataType::Float64));
    EXPECT_EQ(data_type_storage(DataType::Complex128), PrimitiveType::Float64);
    EXPECT_EQ(data_type_from_code(2), DataType::Float32);
    EXPECT_FALSE(data_type_from_code(5).has_value());
    EXPECT_FALSE(data_type_from_code(-1).has_value());
}

TEST(TypeRegistry, VersionMarkers) {
    EXPECT_EQ(version_from_marker(3), DmVersion::DM3);
    EXPECT_EQ(version_from_marker(4), DmVersion::DM4);
    EXPECT_FALSE(version_from_marker(5).has_value());
    EXPECT_FALSE(version_from_marker(0).has_value());
}

// ============================================================================
// Scalar values
// ============================================================================

TEST(ScalarCodec, FixedWidthValuesAreLittleEndian) {
    std::vector<std::byte> bytes(4);
    store_scalar(ScalarValue{int32_t{-2}}, bytes);
    EXPECT_EQ(bytes[0], std::byte{0xFE});
    EXPECT_EQ(bytes[3], std::byte{0xFF});

    auto value = load_scalar(PrimitiveType::Int32, bytes);
    ASSERT_TRUE(std::holds_alternative<int32_t>(value));
    EXPECT_EQ(std::get<int32_t>(value), -2);
}

TEST(ScalarCodec, BoolReadsAnyNonZeroByte) {
    std::vector<std::byte> bytes = {std::byte{0x02}};
    auto value = load_scalar(PrimitiveType::Bool, bytes);
    ASSERT_TRUE(std::holds_alternative<bool>(value));
    EXPECT_TRUE(std::get<bool>(value));
}

template <typename Policy>
class ScalarStreamTest : public ::testing::Test {};

using Policies = ::testing::Types<DM3, DM4>;
TYPED_TEST_SUITE(ScalarStreamTest, Policies);

TYPED_TEST(ScalarStreamTest, EveryPrimitiveSurvivesTheStream) {
    using Policy = TypeParam;
    const std::vector<ScalarValue> values = {
        ScalarValue{int16_t{-300}},   ScalarValue{int32_t{-70000}}, ScalarValue{uint16_t{65000}},
        ScalarValue{uint32_t{4000000000u}}, ScalarValue{1.5f},      ScalarValue{-2.25},
        ScalarValue{true},            ScalarValue{int8_t{-5}},      ScalarValue{uint8_t{250}},
        ScalarValue{int64_t{-1} << 40}, ScalarValue{uint64_t{1} << 63},
        ScalarValue{std::u16string(u"Ångström")},
    };

    std::size_t total = 0;
    for (const auto& value : values) {
        total += encoded_scalar_size<Policy>(value);
    }

    BufferWriter sink(total);
    TagStreamWriter<BufferWriter> writer(sink);
    for (const auto& value : values) {
        ASSERT_TRUE(encode_scalar<Policy>(value, writer).is_ok());
    }
    EXPECT_EQ(writer.tell(), total);
    ASSERT_TRUE(writer.flush().is_ok());

    BufferViewReader source{std::span<const std::byte>(sink.data())};
    auto reader = std::move(TagStreamReader<BufferViewReader>::open(source).value());
    for (const auto& expected : values) {
        auto decoded = decode_scalar<Policy>(type_of(expected), reader);
        ASSERT_TRUE(decoded.is_ok()) << decoded.error().message;
        EXPECT_TRUE(decoded.value() == expected) << "type " << type_name(type_of(expected));
    }
    EXPECT_EQ(reader.remaining(), 0u);
}

TYPED_TEST(ScalarStreamTest, StringLengthUsesThePolicyWidth) {
    using Policy = TypeParam;
    const ScalarValue text{std::u16string(u"eV")};
    EXPECT_EQ(encoded_scalar_size<Policy>(text), Policy::length_width + 4);
}

TEST(ScalarCodec, OddStringLengthIsMalformed) {
    std::vector<std::byte> bytes = {std::byte{0}, std::byte{0}, std::byte{0}, std::byte{3},
                                    std::byte{0x61}, std::byte{0}, std::byte{0x62}};
    BufferViewReader source{std::span<const std::byte>(bytes)};
    auto reader = std::move(TagStreamReader<BufferViewReader>::open(source).value());

    auto decoded = decode_scalar<DM3>(PrimitiveType::String, reader);
    ASSERT_TRUE(decoded.is_error());
    EXPECT_EQ(decoded.error().code, Error::Code::MalformedTag);
}

TEST(ScalarCodec, StringPastEndIsTruncated) {
    std::vector<std::byte> bytes = {std::byte{0}, std::byte{0}, std::byte{0}, std::byte{8},
                                    std::byte{0x61}, std::byte{0}};
    BufferViewReader source{std::span<const std::byte>(bytes)};
    auto reader = std::move(TagStreamReader<BufferViewReader>::open(source).value());

    auto decoded = decode_scalar<DM3>(PrimitiveType::String, reader);
    ASSERT_TRUE(decoded.is_error());
    EXPECT_EQ(decoded.error().code, Error::Code::TruncatedInput);
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
