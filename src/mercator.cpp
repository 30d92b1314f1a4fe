#include "mercator.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <sstream>
#include <stdexcept>

namespace cbers_tiler::mercator {

namespace {

int64_t tile_count(int z) { return int64_t{1} << z; }

void validate_zoom(int z) {
    if (z < 0 || z > MAX_ZOOM) {
        std::stringstream ss;
        ss << "ズームレベルが範囲外です: " << z;
        throw std::invalid_argument(ss.str());
    }
}

bool overlaps(const ProjectedBounds& a, const ProjectedBounds& b) noexcept {
    return a.min_x < b.max_x && a.max_x > b.min_x && a.min_y < b.max_y && a.max_y > b.min_y;
}

}  // namespace

auto xy(double lng, double lat) noexcept -> Point {
    lat = std::clamp(lat, -MAX_LATITUDE, MAX_LATITUDE);

    constexpr double deg_to_rad = std::numbers::pi / 180.0;
    double x = EARTH_RADIUS * lng * deg_to_rad;
    double y = EARTH_RADIUS * std::log(std::tan(std::numbers::pi / 4.0 + lat * deg_to_rad / 2.0));
    return {x, y};
}

void validate(const TileAddress& tile) {
    validate_zoom(tile.z);

    const int64_t n = tile_count(tile.z);
    if (tile.x < 0 || tile.x >= n || tile.y < 0 || tile.y >= n) {
        std::stringstream ss;
        ss << "タイル " << tile.z << "/" << tile.x << "/" << tile.y << " はズーム " << tile.z
           << " の範囲外です";
        throw std::invalid_argument(ss.str());
    }
}

auto xy_bounds(const TileAddress& tile) -> ProjectedBounds {
    validate(tile);

    const double tile_size = 2.0 * ORIGIN_SHIFT / static_cast<double>(tile_count(tile.z));

    ProjectedBounds bounds;
    bounds.min_x = -ORIGIN_SHIFT + static_cast<double>(tile.x) * tile_size;
    bounds.max_x = bounds.min_x + tile_size;
    bounds.max_y = ORIGIN_SHIFT - static_cast<double>(tile.y) * tile_size;
    bounds.min_y = bounds.max_y - tile_size;
    return bounds;
}

auto tile_for(double lng, double lat, int z) -> TileAddress {
    validate_zoom(z);

    const int64_t n = tile_count(z);
    lat = std::clamp(lat, -MAX_LATITUDE, MAX_LATITUDE);
    double lat_rad = lat * std::numbers::pi / 180.0;

    double fx = (lng + 180.0) / 360.0 * static_cast<double>(n);
    double fy = (1.0 - std::log(std::tan(lat_rad) + 1.0 / std::cos(lat_rad)) / std::numbers::pi) /
                2.0 * static_cast<double>(n);

    // 東端/南端ちょうどの点は最後のタイルに含める
    TileAddress tile;
    tile.x = std::clamp(static_cast<int64_t>(std::floor(fx)), int64_t{0}, n - 1);
    tile.y = std::clamp(static_cast<int64_t>(std::floor(fy)), int64_t{0}, n - 1);
    tile.z = z;
    return tile;
}

auto project_bounds(const GeographicBounds& bounds) -> std::vector<ProjectedBounds> {
    auto project = [](double west, double south, double east, double north) {
        Point lower_left = xy(west, south);
        Point upper_right = xy(east, north);
        return ProjectedBounds{lower_left.x, lower_left.y, upper_right.x, upper_right.y};
    };

    if (bounds.west <= bounds.east) {
        return {project(bounds.west, bounds.south, bounds.east, bounds.north)};
    }

    // 日付変更線を跨ぐシーン
    return {project(bounds.west, bounds.south, 180.0, bounds.north),
            project(-180.0, bounds.south, bounds.east, bounds.north)};
}

bool tile_intersects(const GeographicBounds& bounds, const TileAddress& tile) {
    const ProjectedBounds footprint = xy_bounds(tile);

    for (const auto& scene_box : project_bounds(bounds)) {
        if (overlaps(scene_box, footprint)) {
            return true;
        }
    }
    return false;
}

auto tiles_covering(const GeographicBounds& bounds, int z) -> std::vector<TileAddress> {
    validate_zoom(z);

    std::vector<GeographicBounds> pieces;
    if (bounds.west <= bounds.east) {
        pieces.push_back(bounds);
    } else {
        pieces.push_back({bounds.west, bounds.south, 180.0, bounds.north});
        pieces.push_back({-180.0, bounds.south, bounds.east, bounds.north});
    }

    std::vector<TileAddress> tiles;
    for (const auto& piece : pieces) {
        TileAddress upper_left = tile_for(piece.west, piece.north, z);
        TileAddress lower_right = tile_for(piece.east, piece.south, z);

        for (int64_t x = upper_left.x; x <= lower_right.x; ++x) {
            for (int64_t y = upper_left.y; y <= lower_right.y; ++y) {
                TileAddress tile{x, y, z};
                if (tile_intersects(bounds, tile)) {
                    tiles.push_back(tile);
                }
            }
        }
    }

    std::sort(tiles.begin(), tiles.end());
    tiles.erase(std::unique(tiles.begin(), tiles.end()), tiles.end());
    return tiles;
}

}  // namespace cbers_tiler::mercator
