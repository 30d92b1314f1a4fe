#include <gtest/gtest.h>

#include <stdexcept>

#include "mercator.hpp"

using namespace cbers_tiler;
using namespace cbers_tiler::mercator;

namespace {

constexpr GeographicBounds SCENE{-54.0, -25.0, -53.0, -24.0};

}  // namespace

TEST(MercatorTest, ProjectsOriginAndLimits) {
    auto origin = xy(0.0, 0.0);
    EXPECT_NEAR(origin.x, 0.0, 1e-6);
    EXPECT_NEAR(origin.y, 0.0, 1e-6);

    auto corner = xy(180.0, MAX_LATITUDE);
    EXPECT_NEAR(corner.x, ORIGIN_SHIFT, 1e-3);
    EXPECT_NEAR(corner.y, ORIGIN_SHIFT, 1.0);

    // 極付近は丸められる
    EXPECT_DOUBLE_EQ(xy(0.0, 89.9).y, xy(0.0, MAX_LATITUDE).y);
}

TEST(MercatorTest, TileBounds) {
    auto world = xy_bounds({0, 0, 0});
    EXPECT_NEAR(world.min_x, -ORIGIN_SHIFT, 1e-6);
    EXPECT_NEAR(world.max_x, ORIGIN_SHIFT, 1e-6);
    EXPECT_NEAR(world.min_y, -ORIGIN_SHIFT, 1e-6);
    EXPECT_NEAR(world.max_y, ORIGIN_SHIFT, 1e-6);

    auto quarter = xy_bounds({1, 0, 1});
    EXPECT_NEAR(quarter.min_x, 0.0, 1e-6);
    EXPECT_NEAR(quarter.min_y, 0.0, 1e-6);
    EXPECT_NEAR(quarter.max_y, ORIGIN_SHIFT, 1e-6);
}

TEST(MercatorTest, TileForPoint) {
    EXPECT_EQ(tile_for(-53.5, -24.5, 10), (TileAddress{359, 583, 10}));
    EXPECT_EQ(tile_for(180.0, -90.0, 2), (TileAddress{3, 3, 2}));
    EXPECT_EQ(tile_for(-180.0, 90.0, 2), (TileAddress{0, 0, 2}));
}

TEST(MercatorTest, ValidateRejectsOutOfRange) {
    EXPECT_NO_THROW(validate({1023, 1023, 10}));
    EXPECT_THROW(validate({1024, 0, 10}), std::invalid_argument);
    EXPECT_THROW(validate({0, -1, 10}), std::invalid_argument);
    EXPECT_THROW(validate({0, 0, -1}), std::invalid_argument);
    EXPECT_THROW(validate({0, 0, MAX_ZOOM + 1}), std::invalid_argument);
}

TEST(MercatorTest, TileInsideSceneIntersects) {
    EXPECT_TRUE(tile_intersects(SCENE, {359, 583, 10}));
    // 部分的に重なるタイル
    EXPECT_TRUE(tile_intersects(SCENE, {358, 582, 10}));
}

TEST(MercatorTest, DistantTileDoesNotIntersect) {
    EXPECT_FALSE(tile_intersects(SCENE, {0, 0, 10}));
    EXPECT_FALSE(tile_intersects(SCENE, {359, 500, 10}));
    EXPECT_FALSE(tile_intersects(SCENE, {700, 583, 10}));
}

TEST(MercatorTest, EdgeContactIsNotIntersection) {
    // z=1の(0,1)タイルの東端と北端は経度0、緯度0
    const GeographicBounds touching{0.0, 0.0, 10.0, 10.0};
    EXPECT_FALSE(tile_intersects(touching, {0, 1, 1}));
    EXPECT_TRUE(tile_intersects(touching, {1, 0, 1}));
}

TEST(MercatorTest, AntimeridianSceneIsSplit) {
    const GeographicBounds crossing{179.0, -10.0, -179.0, -9.0};

    auto boxes = project_bounds(crossing);
    ASSERT_EQ(boxes.size(), 2U);

    EXPECT_TRUE(tile_intersects(crossing, tile_for(179.5, -9.5, 8)));
    EXPECT_TRUE(tile_intersects(crossing, tile_for(-179.5, -9.5, 8)));
    EXPECT_FALSE(tile_intersects(crossing, tile_for(0.0, -9.5, 8)));
}

TEST(MercatorTest, TilesCoveringScene) {
    auto tiles = tiles_covering(SCENE, 10);

    // x 358..361, y 582..585
    EXPECT_EQ(tiles.size(), 16U);
    EXPECT_EQ(tiles.front(), (TileAddress{358, 582, 10}));
    EXPECT_EQ(tiles.back(), (TileAddress{361, 585, 10}));
    for (const auto& tile : tiles) {
        EXPECT_TRUE(tile_intersects(SCENE, tile));
    }
}
