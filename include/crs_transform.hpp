#pragma once

#include <memory>
#include <span>
#include <string>
#include <string_view>

#include "types.hpp"

namespace cbers_tiler {

inline constexpr std::string_view WGS84 = "EPSG:4326";
inline constexpr std::string_view WEB_MERCATOR = "EPSG:3857";

/**
 * @brief PROJによる座標変換
 *
 * 軸順序は proj_normalize_for_visualization で常に x=経度/東距 に揃える。
 * PJ_CONTEXTはスレッド間で共有できないため、スレッド毎に別インスタンスを使うこと。
 */
class CrsTransformer {
   public:
    CrsTransformer(std::string_view src_crs, std::string_view dst_crs);
    ~CrsTransformer();

    // ムーブのみ可能な型
    CrsTransformer(const CrsTransformer&) = delete;
    CrsTransformer& operator=(const CrsTransformer&) = delete;
    CrsTransformer(CrsTransformer&&) noexcept;
    CrsTransformer& operator=(CrsTransformer&&) noexcept;

    /**
     * @brief 矩形を変換 (各辺をdensify_pts点で補間)
     *
     * 投影の非線形性による誤差を抑えるため、四隅だけでなく辺上の点も変換する。
     * 変換に失敗した場合はIOErrorを送出する。
     */
    [[nodiscard]] auto transform_bounds(const ProjectedBounds& bounds, int densify_pts) const
        -> ProjectedBounds;

    // 点列をその場で変換。変換できない点はHUGE_VALになる
    void transform_points(std::span<double> xs, std::span<double> ys) const;

   private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// CRSが地理座標系 (経緯度) かどうか
[[nodiscard]] bool is_geographic_crs(std::string_view crs);

// EPSG:4326の矩形としてGeographicBoundsに詰め替える
[[nodiscard]] inline auto to_geographic(const ProjectedBounds& bounds) -> GeographicBounds {
    return {bounds.min_x, bounds.min_y, bounds.max_x, bounds.max_y};
}

}  // namespace cbers_tiler
