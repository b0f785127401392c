#include <gtest/gtest.h>
#include <array>
#include <bit>
#include <cstdint>
#include <cstring>
#include <limits>
#include <span>
#include <vector>

#include "../frameio/include/frameio/corrections.hpp"
#include "../frameio/include/frameio/decoder.hpp"

using namespace frameio;

namespace {

template <typename T>
MutableFrameView view_of(std::vector<T>& data, std::size_t frames, std::size_t elements) {
    return MutableFrameView{reinterpret_cast<std::byte*>(data.data()), frames, elements,
                            elements * sizeof(T), element_type_of<T>()};
}

} // namespace

// ============================================================================
// Element conversion
// ============================================================================

TEST(ConvertElementsTest, BigEndianU16ToFloat) {
    // 0x0102 = 258 and 0xFF00 = 65280 stored big-endian
    const std::array<std::byte, 4> input{std::byte{0x01}, std::byte{0x02}, std::byte{0xFF}, std::byte{0x00}};
    std::array<float, 2> output{};

    auto result = convert_elements(input, ElementType{DType::U16, std::endian::big},
                                   std::as_writable_bytes(std::span(output)), element_type_of<float>());
    ASSERT_TRUE(result.is_ok());
    EXPECT_FLOAT_EQ(output[0], 258.0f);
    EXPECT_FLOAT_EQ(output[1], 65280.0f);
}

TEST(ConvertElementsTest, SameTypeIsPlainCopy) {
    const std::array<uint32_t, 3> input{7, 8, 9};
    std::array<uint32_t, 3> output{};
    auto result = convert_elements(std::as_bytes(std::span(input)), element_type_of<uint32_t>(),
                                   std::as_writable_bytes(std::span(output)), element_type_of<uint32_t>());
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(output, input);
}

TEST(ConvertElementsTest, SignedToDoubleKeepsSign) {
    const std::array<int16_t, 2> input{-5, 1200};
    std::array<double, 2> output{};
    auto result = convert_elements(std::as_bytes(std::span(input)), element_type_of<int16_t>(),
                                   std::as_writable_bytes(std::span(output)), element_type_of<double>());
    ASSERT_TRUE(result.is_ok());
    EXPECT_DOUBLE_EQ(output[0], -5.0);
    EXPECT_DOUBLE_EQ(output[1], 1200.0);
}

TEST(ConvertElementsTest, FloatToIntegerSaturates) {
    const std::array<float, 6> input{-1.0f, 70000.0f, 1e20f, std::numeric_limits<float>::quiet_NaN(),
                                     1234.75f, -std::numeric_limits<float>::infinity()};
    std::array<uint16_t, 6> output{};
    auto result = convert_elements(std::as_bytes(std::span(input)), element_type_of<float>(),
                                   std::as_writable_bytes(std::span(output)), element_type_of<uint16_t>());
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(output[0], 0u);
    EXPECT_EQ(output[1], 65535u);
    EXPECT_EQ(output[2], 65535u);
    EXPECT_EQ(output[3], 0u);
    EXPECT_EQ(output[4], 1234u);
    EXPECT_EQ(output[5], 0u);

    const std::array<double, 4> wide{-1e300, 1e300, -3.5, 3e9};
    std::array<int32_t, 4> narrow{};
    ASSERT_TRUE(convert_elements(std::as_bytes(std::span(wide)), element_type_of<double>(),
                                 std::as_writable_bytes(std::span(narrow)), element_type_of<int32_t>()).is_ok());
    EXPECT_EQ(narrow[0], std::numeric_limits<int32_t>::min());
    EXPECT_EQ(narrow[1], std::numeric_limits<int32_t>::max());
    EXPECT_EQ(narrow[2], -3);
    EXPECT_EQ(narrow[3], std::numeric_limits<int32_t>::max());
}

TEST(ConvertElementsTest, DoubleBeyondFloatRangeBecomesInfinity) {
    const std::array<double, 2> input{1e300, -1e300};
    std::array<float, 2> output{};
    ASSERT_TRUE(convert_elements(std::as_bytes(std::span(input)), element_type_of<double>(),
                                 std::as_writable_bytes(std::span(output)), element_type_of<float>()).is_ok());
    EXPECT_EQ(output[0], std::numeric_limits<float>::infinity());
    EXPECT_EQ(output[1], -std::numeric_limits<float>::infinity());
}

TEST(ConvertElementsTest, RejectsSizeMismatch) {
    const std::array<std::byte, 6> input{};
    std::array<float, 2> output{};

    auto partial = convert_elements(std::span(input).first(5), element_type_of<uint16_t>(),
                                    std::as_writable_bytes(std::span(output)), element_type_of<float>());
    ASSERT_FALSE(partial.is_ok());
    EXPECT_EQ(partial.error().code, Error::Code::InvalidArgument);

    auto overflow = convert_elements(input, element_type_of<uint16_t>(),
                                     std::as_writable_bytes(std::span(output)), element_type_of<float>());
    ASSERT_FALSE(overflow.is_ok());
    EXPECT_EQ(overflow.error().code, Error::Code::OutOfBounds);
}

TEST(DecodeRangeTest, UsesDecoderWhenGiven) {
    class NegatingDecoder : public Decoder {
    public:
        [[nodiscard]] Result<void> decode(std::span<const std::byte> input, ElementType,
                                          std::span<std::byte> output, ElementType) const noexcept override {
            for (std::size_t i = 0; i < input.size(); ++i) {
                output[i] = ~input[i];
            }
            return Ok();
        }
    };

    NegatingDecoder decoder;
    const std::array<std::byte, 2> input{std::byte{0x0F}, std::byte{0xF0}};
    std::array<std::byte, 2> output{};
    ASSERT_TRUE(decode_range(&decoder, input, element_type_of<uint8_t>(), output, element_type_of<uint8_t>()).is_ok());
    EXPECT_EQ(output[0], std::byte{0xF0});
    EXPECT_EQ(output[1], std::byte{0x0F});

    ASSERT_TRUE(decode_range(nullptr, input, element_type_of<uint8_t>(), output, element_type_of<uint8_t>()).is_ok());
    EXPECT_EQ(output[0], std::byte{0x0F});
}

// ============================================================================
// PixelCorrections
// ============================================================================

TEST(PixelCorrectionsTest, PresenceFlag) {
    EXPECT_FALSE(PixelCorrections{}.has_corrections());
    EXPECT_TRUE(PixelCorrections({1.0f}, {}).has_corrections());
    EXPECT_TRUE(PixelCorrections({}, {}, {3, 3, 1}).has_corrections());
    EXPECT_EQ(PixelCorrections({}, {}, {3, 3, 1}).excluded_pixels(), (std::vector<std::size_t>{1, 3}));
}

TEST(PixelCorrectionsTest, DarkAndGainUseSignalIndex) {
    // Tile covers signal elements [1, 3) of a 4-element frame
    std::vector<float> data{10.0f, 20.0f, 30.0f, 40.0f};
    PixelCorrections corrections({0.0f, 1.0f, 2.0f, 3.0f}, {1.0f, 10.0f, 100.0f, 1000.0f});
    TileSlice slice{0, 2, 1, 2, {4}};

    ASSERT_TRUE(corrections.apply(view_of(data, 2, 2), slice).is_ok());
    EXPECT_FLOAT_EQ(data[0], (10.0f - 1.0f) * 10.0f);
    EXPECT_FLOAT_EQ(data[1], (20.0f - 2.0f) * 100.0f);
    EXPECT_FLOAT_EQ(data[2], (30.0f - 1.0f) * 10.0f);
    EXPECT_FLOAT_EQ(data[3], (40.0f - 2.0f) * 100.0f);
}

TEST(PixelCorrectionsTest, ExcludedPixelTakesNeighbourMean) {
    std::vector<double> data{1.0, 100.0, 5.0, 7.0, 100.0};
    PixelCorrections corrections({}, {}, {1, 4});
    TileSlice slice{0, 1, 0, 5, {5}};

    ASSERT_TRUE(corrections.apply(view_of(data, 1, 5), slice).is_ok());
    EXPECT_DOUBLE_EQ(data[1], 3.0);
    // Last element only has a left neighbour
    EXPECT_DOUBLE_EQ(data[4], 7.0);
    EXPECT_DOUBLE_EQ(data[0], 1.0);
    EXPECT_DOUBLE_EQ(data[2], 5.0);
}

TEST(PixelCorrectionsTest, ExcludedPixelsOutsideTileAreIgnored) {
    std::vector<float> data{1.0f, 2.0f};
    PixelCorrections corrections({}, {}, {0, 5});
    TileSlice slice{0, 1, 2, 2, {8}};

    ASSERT_TRUE(corrections.apply(view_of(data, 1, 2), slice).is_ok());
    EXPECT_FLOAT_EQ(data[0], 1.0f);
    EXPECT_FLOAT_EQ(data[1], 2.0f);
}

TEST(PixelCorrectionsTest, RejectsIntegerBuffers) {
    std::vector<uint16_t> data{1, 2};
    PixelCorrections corrections({}, {}, {0});
    TileSlice slice{0, 1, 0, 2, {2}};

    auto result = corrections.apply(view_of(data, 1, 2), slice);
    ASSERT_FALSE(result.is_ok());
    EXPECT_EQ(result.error().code, Error::Code::UnsupportedType);
}

TEST(PixelCorrectionsTest, RejectsTooSmallCorrectionData) {
    std::vector<float> data{1.0f, 2.0f, 3.0f};
    PixelCorrections corrections({0.0f, 0.0f}, {});
    TileSlice slice{0, 1, 0, 3, {3}};

    auto result = corrections.apply(view_of(data, 1, 3), slice);
    ASSERT_FALSE(result.is_ok());
    EXPECT_EQ(result.error().code, Error::Code::OutOfBounds);
}

TEST(PixelCorrectionsTest, RejectsRowSizeMismatch) {
    std::vector<float> data{1.0f, 2.0f, 3.0f, 4.0f};
    PixelCorrections corrections({}, {}, {0});
    TileSlice slice{0, 1, 0, 3, {4}};

    auto result = corrections.apply(view_of(data, 1, 4), slice);
    ASSERT_FALSE(result.is_ok());
    EXPECT_EQ(result.error().code, Error::Code::InvalidArgument);
}
