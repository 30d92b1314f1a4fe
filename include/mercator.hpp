#pragma once

#include <cstdint>
#include <vector>

#include "types.hpp"

// 球面メルカトル (EPSG:3857) タイルピラミッドの計算
namespace cbers_tiler::mercator {

constexpr double EARTH_RADIUS = 6378137.0;
constexpr double ORIGIN_SHIFT = 20037508.342789244;  // pi * EARTH_RADIUS
constexpr double MAX_LATITUDE = 85.0511287798066;
constexpr int MAX_ZOOM = 30;

struct TileAddress {
    int64_t x{};
    int64_t y{};
    int z{};

    auto operator<=>(const TileAddress&) const = default;
};

struct Point {
    double x{};
    double y{};
};

// 経緯度 -> EPSG:3857 (緯度は±MAX_LATITUDEに丸める)
[[nodiscard]] auto xy(double lng, double lat) noexcept -> Point;

// z/x/yが有効範囲外ならstd::invalid_argumentを送出
void validate(const TileAddress& tile);

// タイルの投影座標上の範囲 (原点は左上)
[[nodiscard]] auto xy_bounds(const TileAddress& tile) -> ProjectedBounds;

// 指定点を含むズームzのタイル
[[nodiscard]] auto tile_for(double lng, double lat, int z) -> TileAddress;

// シーン範囲をEPSG:3857の矩形に変換。日付変更線を跨ぐ場合は2つに分割される
[[nodiscard]] auto project_bounds(const GeographicBounds& bounds) -> std::vector<ProjectedBounds>;

/**
 * @brief タイルがシーン範囲と交差するか判定
 *
 * 両者をEPSG:3857で軸平行矩形として比較する。
 * 辺が接するだけの場合は交差とみなさない。
 */
[[nodiscard]] bool tile_intersects(const GeographicBounds& bounds, const TileAddress& tile);

// シーン範囲と交差する全タイル (x, yの昇順)
[[nodiscard]] auto tiles_covering(const GeographicBounds& bounds, int z) -> std::vector<TileAddress>;

}  // namespace cbers_tiler::mercator
