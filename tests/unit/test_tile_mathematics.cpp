#include <gtest/gtest.h>
#include <web_tiles/math/tile_mathematics.h>
#include <unordered_set>

namespace web_tiles::tests {

TEST(TileKeyTest, PacksZoomXAndY) {
    const TileCoordinates tile(3, 5, 4);
    const std::uint64_t key = GetTileKey(tile);

    EXPECT_EQ(key, (4ULL << 56) | (3ULL << 28) | 5ULL);
    EXPECT_EQ(TileFromKey(key), tile);
}

TEST(TileKeyTest, DistinctTilesGetDistinctKeys) {
    std::unordered_set<std::uint64_t> keys;
    for (int32_t zoom = 0; zoom <= 3; ++zoom) {
        const int32_t span = 1 << zoom;
        for (int32_t x = 0; x < span; ++x) {
            for (int32_t y = 0; y < span; ++y) {
                keys.insert(GetTileKey(TileCoordinates(x, y, zoom)));
            }
        }
    }
    EXPECT_EQ(keys.size(), 1u + 4u + 16u + 64u);
}

TEST(TileKeyTest, RoundTripsDeepZoom) {
    const TileCoordinates tile(123456, 654321, 20);
    EXPECT_EQ(TileFromKey(GetTileKey(tile)), tile);
}

TEST(QuadKeyTest, MatchesBingScheme) {
    EXPECT_EQ(GetQuadKey(TileCoordinates(3, 5, 3)), "213");
    EXPECT_EQ(GetQuadKey(TileCoordinates(0, 0, 1)), "0");
    EXPECT_EQ(GetQuadKey(TileCoordinates(1, 1, 1)), "3");
    EXPECT_EQ(GetQuadKey(TileCoordinates(0, 0, 0)), "");
}

TEST(QuadKeyTest, InvalidTileHasNoQuadKey) {
    EXPECT_EQ(GetQuadKey(TileCoordinates(4, 0, 2)), "");
}

class MercatorProjectionTest : public ::testing::Test {
protected:
    MercatorTileProjection projection_{0, 18};
};

TEST_F(MercatorProjectionTest, WrapsXAroundTheAntimeridian) {
    EXPECT_EQ(projection_.Normalize(TileCoordinates(4, 1, 2)), TileCoordinates(0, 1, 2));
    EXPECT_EQ(projection_.Normalize(TileCoordinates(-1, 1, 2)), TileCoordinates(3, 1, 2));
    EXPECT_EQ(projection_.Normalize(TileCoordinates(-9, 1, 2)), TileCoordinates(3, 1, 2));
}

TEST_F(MercatorProjectionTest, NormalizeLeavesYAlone) {
    EXPECT_EQ(projection_.Normalize(TileCoordinates(1, 7, 2)), TileCoordinates(1, 7, 2));
}

TEST_F(MercatorProjectionTest, NormalizeIsIdempotent) {
    const TileCoordinates once = projection_.Normalize(TileCoordinates(-37, 2, 5));
    EXPECT_EQ(projection_.Normalize(once), once);
}

TEST_F(MercatorProjectionTest, TileExistsChecksRowAndZoomRange) {
    EXPECT_TRUE(projection_.TileExists(TileCoordinates(0, 0, 0)));
    EXPECT_TRUE(projection_.TileExists(TileCoordinates(3, 3, 2)));
    EXPECT_FALSE(projection_.TileExists(TileCoordinates(0, 4, 2)));
    EXPECT_FALSE(projection_.TileExists(TileCoordinates(0, -1, 2)));
    EXPECT_FALSE(projection_.TileExists(TileCoordinates(0, 0, 19)));
}

TEST(MercatorProjectionConfigTest, SwapsInvertedZoomRange) {
    MercatorTileProjection projection(10, 2);
    EXPECT_EQ(projection.GetMinZoom(), 2);
    EXPECT_EQ(projection.GetMaxZoom(), 10);
}

TEST(MercatorProjectionConfigTest, ClampsToSupportedZoom) {
    MercatorTileProjection projection(-3, 40);
    EXPECT_EQ(projection.GetMinZoom(), 0);
    EXPECT_EQ(projection.GetMaxZoom(), 28);
}

TEST(MercatorProjectionConfigTest, MinimumZoomExcludesShallowTiles) {
    auto projection = CreateMercatorProjection(3, 5);
    EXPECT_FALSE(projection->TileExists(TileCoordinates(0, 0, 2)));
    EXPECT_TRUE(projection->TileExists(TileCoordinates(0, 0, 3)));
}

} // namespace web_tiles::tests
