#include <gtest/gtest.h>
#include <web_tiles/image/image_decoder.h>
#include <cstdint>
#include <vector>

namespace web_tiles::tests {

class StbImageDecoderTest : public ::testing::Test {
protected:
    void SetUp() override {
        decoder_ = CreateStbImageDecoder();
    }

    std::shared_ptr<ImageDecoder> decoder_;

    // 2x1 RGBA PNG: opaque red, then half transparent blue
    const std::vector<std::uint8_t> rgba_png_ = {
        0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A, 0x00, 0x00, 0x00, 0x0D,
        0x49, 0x48, 0x44, 0x52, 0x00, 0x00, 0x00, 0x02, 0x00, 0x00, 0x00, 0x01,
        0x08, 0x06, 0x00, 0x00, 0x00, 0xF4, 0x22, 0x7F, 0x8A, 0x00, 0x00, 0x00,
        0x0E, 0x49, 0x44, 0x41, 0x54, 0x78, 0x9C, 0x63, 0xF8, 0xCF, 0xC0, 0x00,
        0x42, 0x0D, 0x00, 0x0F, 0x7A, 0x03, 0x7E, 0x77, 0xE9, 0x7F, 0x97, 0x00,
        0x00, 0x00, 0x00, 0x49, 0x45, 0x4E, 0x44, 0xAE, 0x42, 0x60, 0x82
    };

    // 1x1 RGB PNG (10, 20, 30)
    const std::vector<std::uint8_t> rgb_png_ = {
        0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A, 0x00, 0x00, 0x00, 0x0D,
        0x49, 0x48, 0x44, 0x52, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x01,
        0x08, 0x02, 0x00, 0x00, 0x00, 0x90, 0x77, 0x53, 0xDE, 0x00, 0x00, 0x00,
        0x0C, 0x49, 0x44, 0x41, 0x54, 0x78, 0x9C, 0x63, 0xE0, 0x12, 0x91, 0x03,
        0x00, 0x00, 0x68, 0x00, 0x3D, 0x54, 0x08, 0xA3, 0xF7, 0x00, 0x00, 0x00,
        0x00, 0x49, 0x45, 0x4E, 0x44, 0xAE, 0x42, 0x60, 0x82
    };
};

TEST_F(StbImageDecoderTest, DecodesPngToRgba) {
    auto image = decoder_->Decode(rgba_png_);

    ASSERT_TRUE(image.has_value());
    EXPECT_TRUE(image->IsValid());
    EXPECT_EQ(image->width, 2u);
    EXPECT_EQ(image->height, 1u);
    EXPECT_EQ(image->channels, constants::tiles::IMAGE_CHANNELS);
    EXPECT_EQ(image->PixelAt(0, 0), (std::array<std::uint8_t, 4>{255, 0, 0, 255}));
    EXPECT_EQ(image->PixelAt(1, 0), (std::array<std::uint8_t, 4>{0, 0, 255, 128}));
}

TEST_F(StbImageDecoderTest, ExpandsRgbToOpaqueRgba) {
    auto image = decoder_->Decode(rgb_png_);

    ASSERT_TRUE(image.has_value());
    EXPECT_EQ(image->channels, constants::tiles::IMAGE_CHANNELS);
    EXPECT_EQ(image->GetDataSize(), 4u);
    EXPECT_EQ(image->PixelAt(0, 0), (std::array<std::uint8_t, 4>{10, 20, 30, 255}));
}

TEST_F(StbImageDecoderTest, RejectsGarbageAndEmptyInput) {
    EXPECT_FALSE(decoder_->Decode({}).has_value());
    EXPECT_FALSE(decoder_->Decode({'<', 'h', 't', 'm', 'l', '>'}).has_value());

    std::vector<std::uint8_t> truncated(rgba_png_.begin(), rgba_png_.begin() + 20);
    EXPECT_FALSE(decoder_->Decode(truncated).has_value());
}

} // namespace web_tiles::tests
