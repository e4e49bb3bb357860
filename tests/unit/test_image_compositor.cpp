#include <gtest/gtest.h>
#include <web_tiles/image/image_compositor.h>
#include "test_support.h"

namespace web_tiles::tests {

class ImageCompositorTest : public ::testing::Test {
protected:
    const std::array<std::uint8_t, 4> red_{255, 0, 0, 255};
    const std::array<std::uint8_t, 4> blue_{0, 0, 255, 255};
    const std::array<std::uint8_t, 4> clear_{0, 0, 0, 0};
};

TEST_F(ImageCompositorTest, NoLayersYieldsNothing) {
    EXPECT_FALSE(ImageCompositor::Composite({}).has_value());
    EXPECT_FALSE(ImageCompositor::Composite({std::nullopt, std::nullopt}).has_value());
}

TEST_F(ImageCompositorTest, SingleLayerIsReturnedUnchanged) {
    TileImage image = MakeSolidImage(4, 4, {10, 20, 30, 128});
    image.SetPixel(1, 2, {1, 2, 3, 4});

    auto result = ImageCompositor::Composite({std::nullopt, image, std::nullopt});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, image);
}

TEST_F(ImageCompositorTest, NonRgbaLayersAreSkipped) {
    TileImage rgb;
    rgb.width = 1;
    rgb.height = 1;
    rgb.channels = 3;
    rgb.pixels = {1, 2, 3};
    EXPECT_FALSE(rgb.IsValid());

    EXPECT_FALSE(ImageCompositor::Composite({rgb, rgb}).has_value());

    auto result = ImageCompositor::Composite({rgb, MakeSolidImage(1, 1, red_), rgb});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, MakeSolidImage(1, 1, red_));
}

TEST_F(ImageCompositorTest, OpaqueTopLayerReplacesBase) {
    auto result = ImageCompositor::Composite({MakeSolidImage(2, 2, red_),
                                              MakeSolidImage(2, 2, blue_)});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, MakeSolidImage(2, 2, blue_));
}

TEST_F(ImageCompositorTest, TransparentTopLayerKeepsBase) {
    auto result = ImageCompositor::Composite({MakeSolidImage(2, 2, red_),
                                              MakeSolidImage(2, 2, clear_)});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, MakeSolidImage(2, 2, red_));
}

TEST_F(ImageCompositorTest, LayersAreDrawnInOrder) {
    TileImage overlay = MakeSolidImage(2, 2, clear_);
    overlay.SetPixel(0, 0, blue_);

    auto result = ImageCompositor::Composite({MakeSolidImage(2, 2, red_), overlay});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->PixelAt(0, 0), blue_);
    EXPECT_EQ(result->PixelAt(1, 1), red_);

    auto reversed = ImageCompositor::Composite({overlay, MakeSolidImage(2, 2, red_)});
    ASSERT_TRUE(reversed.has_value());
    EXPECT_EQ(reversed->PixelAt(0, 0), red_);
}

TEST_F(ImageCompositorTest, MissingBaseUsesFirstAvailableLayer) {
    auto result = ImageCompositor::Composite({std::nullopt, MakeSolidImage(2, 2, red_),
                                              MakeSolidImage(2, 2, clear_)});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, MakeSolidImage(2, 2, red_));
}

TEST_F(ImageCompositorTest, HalfTransparentBlend) {
    TileImage canvas = MakeSolidImage(1, 1, {0, 0, 0, 255});
    ImageCompositor::DrawOver(canvas, MakeSolidImage(1, 1, {255, 255, 255, 128}));

    const auto pixel = canvas.PixelAt(0, 0);
    EXPECT_EQ(pixel[0], 128);
    EXPECT_EQ(pixel[1], 128);
    EXPECT_EQ(pixel[2], 128);
    EXPECT_EQ(pixel[3], 255);
}

TEST_F(ImageCompositorTest, SmallerLayerIsClippedToCanvas) {
    TileImage canvas = MakeSolidImage(4, 4, red_);
    ImageCompositor::DrawOver(canvas, MakeSolidImage(2, 2, blue_));

    EXPECT_EQ(canvas.width, 4u);
    EXPECT_EQ(canvas.PixelAt(1, 1), blue_);
    EXPECT_EQ(canvas.PixelAt(2, 2), red_);
    EXPECT_EQ(canvas.PixelAt(3, 0), red_);
}

TEST_F(ImageCompositorTest, LargerLayerDoesNotGrowCanvas) {
    TileImage canvas = MakeSolidImage(2, 2, red_);
    ImageCompositor::DrawOver(canvas, MakeSolidImage(3, 3, blue_));

    EXPECT_EQ(canvas.width, 2u);
    EXPECT_EQ(canvas.height, 2u);
    EXPECT_EQ(canvas, MakeSolidImage(2, 2, blue_));
}

} // namespace web_tiles::tests
