#include <gtest/gtest.h>

#include <fstream>
#include <vector>

#include "errors.hpp"
#include "jp2_header.hpp"
#include "test_fixtures.hpp"

using namespace cbers_tiler;
using namespace cbers_tiler::testing;

namespace {

std::vector<std::byte> bytes_of(std::initializer_list<int> values) {
    std::vector<std::byte> out;
    for (int v : values) {
        out.push_back(static_cast<std::byte>(v));
    }
    return out;
}

}  // namespace

TEST(Jp2BoxTest, ParsesSequentialBoxes) {
    auto data = bytes_of({0, 0, 0, 12, 'j', 'P', ' ', ' ', 0x0D, 0x0A, 0x87, 0x0A,  //
                          0, 0, 0, 10, 'f', 'r', 'e', 'e', 1, 2});
    auto boxes = parse_jp2_boxes(data);

    ASSERT_EQ(boxes.size(), 2U);
    EXPECT_TRUE(boxes[0].is("jP  "));
    EXPECT_EQ(boxes[0].payload.size(), 4U);
    EXPECT_TRUE(boxes[1].is("free"));
    EXPECT_EQ(boxes[1].payload.size(), 2U);
}

TEST(Jp2BoxTest, ExtendedAndToEndLengths) {
    auto data = bytes_of({0, 0, 0, 1, 'x', 'l', 'b', 'x', 0, 0, 0, 0, 0, 0, 0, 18, 7, 8,  //
                          0, 0, 0, 0, 'j', 'p', '2', 'c', 1, 2, 3});
    auto boxes = parse_jp2_boxes(data);

    ASSERT_EQ(boxes.size(), 2U);
    EXPECT_TRUE(boxes[0].is("xlbx"));
    EXPECT_EQ(boxes[0].payload.size(), 2U);
    EXPECT_TRUE(boxes[1].is("jp2c"));
    EXPECT_EQ(boxes[1].payload.size(), 3U);
}

TEST(Jp2BoxTest, RejectsTruncatedBoxes) {
    EXPECT_THROW((void)parse_jp2_boxes(bytes_of({0, 0, 0, 40, 'j', 'p', '2', 'h', 0})), IOError);
    EXPECT_THROW((void)parse_jp2_boxes(bytes_of({0, 0, 0, 4, 'j', 'p', '2', 'h'})), IOError);
    EXPECT_THROW((void)parse_jp2_boxes(bytes_of({0, 0, 0})), IOError);
}

TEST(Jp2GeoreferenceTest, ReadsGeoJp2Header) {
    TempDir dir;
    auto path = dir.path() / "preview.jp2";
    write_geojp2(path, geographic_reference(SCENE_BOUNDS, 128));

    auto ref = read_jp2_georeference(path);
    EXPECT_EQ(ref.crs, "EPSG:4326");
    EXPECT_EQ(ref.width, 128);
    EXPECT_EQ(ref.height, 128);

    auto bounds = ref.native_bounds();
    EXPECT_NEAR(bounds.min_x, -54.0, 1e-9);
    EXPECT_NEAR(bounds.min_y, -25.0, 1e-9);
    EXPECT_NEAR(bounds.max_x, -53.0, 1e-9);
    EXPECT_NEAR(bounds.max_y, -24.0, 1e-9);
}

TEST(Jp2GeoreferenceTest, MissingOrInvalidFileThrows) {
    TempDir dir;
    EXPECT_THROW((void)read_jp2_georeference(dir.path() / "missing.jp2"), IOError);

    auto not_jp2 = dir.path() / "plain.jp2";
    {
        std::ofstream out(not_jp2, std::ios::binary);
        const char box[] = {0, 0, 0, 12, 'f', 'r', 'e', 'e', 0, 0, 0, 0};
        out.write(box, sizeof(box));
    }
    EXPECT_THROW((void)read_jp2_georeference(not_jp2), IOError);
}

TEST(Jp2GeoreferenceTest, MissingGeoJp2BoxThrows) {
    TempDir dir;
    auto path = dir.path() / "nogeo.jp2";
    {
        std::ofstream out(path, std::ios::binary);
        const unsigned char data[] = {0, 0, 0, 12,  'j', 'P', ' ', ' ', 0x0D, 0x0A, 0x87, 0x0A,
                                      0, 0, 0, 30,  'j', 'p', '2', 'h', 0,    0,    0,    22,
                                      'i', 'h', 'd', 'r', 0, 0, 0, 8, 0, 0, 0, 8, 0, 1, 7, 7, 0, 0};
        out.write(reinterpret_cast<const char*>(data), sizeof(data));
    }
    EXPECT_THROW((void)read_jp2_georeference(path), IOError);
}
