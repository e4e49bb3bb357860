#include <gtest/gtest.h>
#include <web_tiles/source/default_image_registry.h>
#include "test_support.h"
#include <atomic>
#include <thread>
#include <vector>

namespace web_tiles::tests {

TEST(DefaultImageRegistryTest, EmptyByDefault) {
    DefaultImageRegistry registry;
    EXPECT_EQ(registry.Size(), 0u);
    EXPECT_FALSE(registry.Lookup(3).has_value());
}

TEST(DefaultImageRegistryTest, LookupIsPerZoom) {
    DefaultImageRegistry registry;
    const TileImage image = MakeSolidImage(2, 2, {9, 9, 9, 255});

    ASSERT_TRUE(registry.Register(5, image));
    EXPECT_TRUE(registry.Contains(5));
    EXPECT_EQ(*registry.Lookup(5), image);
    EXPECT_FALSE(registry.Lookup(4).has_value());
    EXPECT_FALSE(registry.Lookup(6).has_value());
}

TEST(DefaultImageRegistryTest, RegisterReplaces) {
    DefaultImageRegistry registry;
    registry.Register(5, MakeSolidImage(2, 2, {1, 1, 1, 255}));
    registry.Register(5, MakeSolidImage(2, 2, {2, 2, 2, 255}));

    EXPECT_EQ(registry.Size(), 1u);
    EXPECT_EQ(registry.Lookup(5)->PixelAt(0, 0)[0], 2);
}

TEST(DefaultImageRegistryTest, RejectsInvalidImage) {
    DefaultImageRegistry registry;
    EXPECT_FALSE(registry.Register(1, TileImage{}));

    TileImage rgb;
    rgb.width = 2;
    rgb.height = 2;
    rgb.channels = 3;
    rgb.pixels.assign(12, 0);
    EXPECT_FALSE(registry.Register(2, rgb));

    EXPECT_EQ(registry.Size(), 0u);
}

TEST(DefaultImageRegistryTest, ConcurrentRegisterAndLookup) {
    DefaultImageRegistry registry;
    constexpr std::uint32_t kZoomLevels = 8;
    constexpr int kRounds = 200;

    std::atomic<int> torn_reads{0};
    std::vector<std::thread> threads;

    for (int writer = 0; writer < 2; ++writer) {
        threads.emplace_back([&registry, writer] {
            for (int round = 0; round < kRounds; ++round) {
                const auto shade = static_cast<std::uint8_t>(writer * 100 + round % 100);
                registry.Register(static_cast<std::uint32_t>(round) % kZoomLevels,
                                  MakeSolidImage(8, 8, {shade, shade, shade, 255}));
            }
        });
    }
    for (int reader = 0; reader < 4; ++reader) {
        threads.emplace_back([&registry, &torn_reads] {
            for (int round = 0; round < kRounds; ++round) {
                auto image = registry.Lookup(static_cast<std::uint32_t>(round) % kZoomLevels);
                if (!image) {
                    continue;
                }
                // Every registered image is one solid color
                const auto first = image->PixelAt(0, 0);
                if (!image->IsValid() || image->PixelAt(7, 7) != first) {
                    ++torn_reads;
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(torn_reads.load(), 0);
    EXPECT_EQ(registry.Size(), kZoomLevels);
    for (std::uint32_t zoom = 0; zoom < kZoomLevels; ++zoom) {
        EXPECT_TRUE(registry.Contains(zoom));
    }
}

} // namespace web_tiles::tests
