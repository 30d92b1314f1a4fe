#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <vector>

#include "crs_transform.hpp"
#include "errors.hpp"
#include "geotiff.hpp"
#include "test_fixtures.hpp"

using namespace cbers_tiler;
using namespace cbers_tiler::testing;

class GeoTiffTest : public ::testing::Test {
   protected:
    void SetUp() override {
        path_ = dir_.path() / "gradient.tif";
        reference_ = geographic_reference(SCENE_BOUNDS, 300, -9999.0);
        // 値 = row * 1000 + col (2つ以上のタイルにまたがるサイズ)
        write_band(path_, reference_, [](size_t row, size_t col) {
            return static_cast<float>(row * 1000 + col);
        });
    }

    TempDir dir_;
    std::filesystem::path path_;
    GeoReference reference_;
};

TEST_F(GeoTiffTest, ReadsGeoreference) {
    GeoTiffReader reader(path_);
    const auto& ref = reader.georeference();

    EXPECT_EQ(ref.crs, "EPSG:4326");
    EXPECT_EQ(ref.width, 300);
    EXPECT_EQ(ref.height, 300);
    ASSERT_TRUE(ref.nodata.has_value());
    EXPECT_DOUBLE_EQ(*ref.nodata, -9999.0);
    for (size_t i = 0; i < 6; ++i) {
        EXPECT_NEAR(ref.geo_transform[i], reference_.geo_transform[i], 1e-9) << "index " << i;
    }

    auto bounds = ref.native_bounds();
    EXPECT_NEAR(bounds.min_x, -54.0, 1e-9);
    EXPECT_NEAR(bounds.min_y, -25.0, 1e-9);
    EXPECT_NEAR(bounds.max_x, -53.0, 1e-9);
    EXPECT_NEAR(bounds.max_y, -24.0, 1e-9);

    ASSERT_EQ(reader.levels().size(), 1U);
    EXPECT_DOUBLE_EQ(reader.levels()[0].decimation, 1.0);
}

TEST_F(GeoTiffTest, ReadsProjectedGeoreference) {
    auto utm = dir_.path() / "utm.tif";
    write_constant_band(utm, projected_reference(UTM_SCENE_BOUNDS, UTM_CRS, 100), 1.0F);

    GeoTiffReader reader(utm);
    const auto& ref = reader.georeference();
    EXPECT_EQ(ref.crs, UTM_CRS);

    auto bounds = ref.native_bounds();
    EXPECT_NEAR(bounds.min_x, UTM_SCENE_BOUNDS.min_x, 1e-6);
    EXPECT_NEAR(bounds.min_y, UTM_SCENE_BOUNDS.min_y, 1e-6);
    EXPECT_NEAR(bounds.max_x, UTM_SCENE_BOUNDS.max_x, 1e-6);
    EXPECT_NEAR(bounds.max_y, UTM_SCENE_BOUNDS.max_y, 1e-6);
}

TEST(CrsTransformerTest, DensifiedBoundsToGeographic) {
    CrsTransformer to_wgs84(UTM_CRS, WGS84);
    auto bounds = to_wgs84.transform_bounds(UTM_SCENE_BOUNDS, 21);

    EXPECT_NEAR(bounds.min_x, UTM_SCENE_GEOGRAPHIC.west, 1e-3);
    EXPECT_NEAR(bounds.min_y, UTM_SCENE_GEOGRAPHIC.south, 1e-3);
    EXPECT_NEAR(bounds.max_x, UTM_SCENE_GEOGRAPHIC.east, 1e-3);
    EXPECT_NEAR(bounds.max_y, UTM_SCENE_GEOGRAPHIC.north, 1e-3);

    EXPECT_THROW((void)to_wgs84.transform_bounds(UTM_SCENE_BOUNDS, -1), std::invalid_argument);
}

TEST_F(GeoTiffTest, ReadsWindowAcrossTiles) {
    GeoTiffReader reader(path_);
    auto window = reader.read_window(0, {250, 250, 20, 10});

    ASSERT_EQ(window.width(), 20U);
    ASSERT_EQ(window.height(), 10U);
    EXPECT_FLOAT_EQ(window(0, 0), 250250.0F);
    EXPECT_FLOAT_EQ(window(9, 19), 259269.0F);
    EXPECT_FLOAT_EQ(window(6, 6), 256256.0F);
}

TEST_F(GeoTiffTest, WindowOutsideRasterIsNodata) {
    GeoTiffReader reader(path_);
    auto window = reader.read_window(0, {-2, 298, 4, 4});

    EXPECT_FLOAT_EQ(window(0, 0), -9999.0F);  // 左の範囲外
    EXPECT_FLOAT_EQ(window(0, 2), 298000.0F);
    EXPECT_FLOAT_EQ(window(3, 3), -9999.0F);  // 下の範囲外

    EXPECT_THROW((void)reader.read_window(0, {0, 0, 0, 4}), std::invalid_argument);
    EXPECT_THROW((void)reader.read_window(3, {0, 0, 4, 4}), std::invalid_argument);
}

TEST_F(GeoTiffTest, MissingFileThrowsIOError) {
    EXPECT_THROW(GeoTiffReader(dir_.path() / "missing.tif"), IOError);
}

TEST_F(GeoTiffTest, NonTiffFileThrowsIOError) {
    auto bogus = dir_.path() / "bogus.tif";
    std::ofstream(bogus) << "not a tiff";
    EXPECT_THROW(GeoTiffReader{bogus}, IOError);
}

TEST_F(GeoTiffTest, GeoreferenceFromMemory) {
    std::ifstream file(path_, std::ios::binary);
    std::vector<char> chars((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());
    std::vector<std::byte> bytes(chars.size());
    std::transform(chars.begin(), chars.end(), bytes.begin(),
                   [](char c) { return static_cast<std::byte>(c); });

    auto ref = read_georeference_from_memory(bytes);
    EXPECT_EQ(ref.crs, "EPSG:4326");
    EXPECT_EQ(ref.width, 300);
    EXPECT_NEAR(ref.geo_transform[0], -54.0, 1e-9);

    std::vector<std::byte> garbage(64, std::byte{0x42});
    EXPECT_THROW((void)read_georeference_from_memory(garbage), IOError);
}

TEST_F(GeoTiffTest, OpenRasterGeoreferenceDispatchesOnExtension) {
    auto ref = open_raster_georeference(path_);
    EXPECT_EQ(ref.width, 300);

    auto jp2 = dir_.path() / "preview.jp2";
    write_geojp2(jp2, geographic_reference(SCENE_BOUNDS, 64));
    auto preview = open_raster_georeference(jp2);
    EXPECT_EQ(preview.width, 64);
    EXPECT_EQ(preview.height, 64);
}

TEST_F(GeoTiffTest, WritesRgb8) {
    std::vector<FlatArray2D<uint8_t>> bands;
    bands.emplace_back(16, 16, uint8_t{10});
    bands.emplace_back(16, 16, uint8_t{20});
    bands.emplace_back(16, 16, uint8_t{30});

    auto out = dir_.path() / "rgb.tif";
    std::error_code ec;
    ASSERT_TRUE(write_geotiff_rgb8(out, bands, geographic_reference(SCENE_BOUNDS, 16), ec))
        << ec.message();

    // 先頭サンプル (R) を読む
    GeoTiffReader reader(out);
    EXPECT_FLOAT_EQ(reader.read_window(0, {0, 0, 1, 1})(0, 0), 10.0F);
}

TEST_F(GeoTiffTest, WriteRejectsEmptyImage) {
    std::error_code ec;
    EXPECT_FALSE(write_geotiff(dir_.path() / "empty.tif", TileImage{}, reference_, ec));
    EXPECT_TRUE(ec);
}

TEST(GeoTransformTest, InvertRoundTripsPixelCorners) {
    GeoTransform gt{-54.0, 0.005, 0.0, -24.0, 0.0, -0.005};
    auto inv = invert_geo_transform(gt);
    ASSERT_TRUE(inv.has_value());

    double x = -53.5;
    double y = -24.25;
    double col = (*inv)[0] + (*inv)[1] * x + (*inv)[2] * y;
    double row = (*inv)[3] + (*inv)[4] * x + (*inv)[5] * y;
    EXPECT_NEAR(col, 100.0, 1e-9);
    EXPECT_NEAR(row, 50.0, 1e-9);

    EXPECT_FALSE(invert_geo_transform({0.0, 0.0, 0.0, 0.0, 0.0, 0.0}).has_value());
}

TEST(SelectLevelTest, PicksCoarsestLevelNotExceedingTarget) {
    std::array<RasterLevel, 4> levels{{{0, 1024, 1024, 1.0},
                                       {1, 512, 512, 2.0},
                                       {2, 256, 256, 4.0},
                                       {3, 128, 128, 8.0}}};

    EXPECT_EQ(select_level(levels, 0.5), 0U);
    EXPECT_EQ(select_level(levels, 1.9), 0U);
    EXPECT_EQ(select_level(levels, 2.0), 1U);
    EXPECT_EQ(select_level(levels, 5.0), 2U);
    EXPECT_EQ(select_level(levels, 100.0), 3U);
}
