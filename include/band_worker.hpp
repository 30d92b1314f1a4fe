#pragma once

#include <filesystem>
#include <vector>

#include "flat_array_2d.hpp"
#include "types.hpp"

namespace cbers_tiler {

struct WarpOptions {
    size_t tilesize{256};
    Resampling resampling{Resampling::bilinear};
    double nodata{0.0};  // 出力のnodata値。ファイルにGDAL_NODATAが無ければ入力側にも使う
    int densify_pts{21};
};

/**
 * @brief 1バンド分のメルカトルタイルを生成する
 *
 * バンドをEPSG:3857へ再投影し、tile_boundsをtilesize x tilesizeでサンプリングする。
 * ソースの範囲外や、カーネル内にnodataを含む画素はnodataになる。
 * 読み込みは必要な窓 (カーネル分の余白込み) だけに限定し、
 * 目標解像度に最も近いオーバービューを使う。
 *
 * @param band_path バンドのGeoTIFF
 * @param tile_bounds タイルのEPSG:3857上の範囲
 * @param options 出力サイズ、リサンプリング方式、nodata
 * @return tilesize x tilesize の画素値
 */
[[nodiscard]] auto tile_band_worker(const std::filesystem::path& band_path,
                                    const ProjectedBounds& tile_bounds, const WarpOptions& options)
    -> FlatArray2D<float>;

/**
 * @brief バンドのパーセンタイルカット値を求める
 *
 * 長辺がmax_size以下になるよう最近傍で間引いた画素から、nodataとNaNを除いて計算する。
 * 有効な画素が1つも無い場合はIOErrorを送出する。
 */
[[nodiscard]] auto min_max_worker(const std::filesystem::path& band_path, double pmin, double pmax,
                                  size_t max_size = 1024) -> PercentileCut;

// numpy.percentileと同じ線形補間。valuesは並べ替えられる
[[nodiscard]] double percentile(std::vector<float>& values, double p);

}  // namespace cbers_tiler
