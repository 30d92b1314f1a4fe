#pragma once

#include <cstdint>
#include <vector>

#include "flat_array_2d.hpp"
#include "types.hpp"

namespace cbers_tiler {

// [in_min, in_max] を [out_min, out_max] に線形に写し、出力範囲に丸める
[[nodiscard]] double linear_rescale(double value, double in_min, double in_max,
                                    double out_min = 0.0, double out_max = 255.0) noexcept;

/**
 * @brief タイルを表示用の8bit画像に変換する
 *
 * 各バンドはstatisticsのカット値で0-255に伸張される。nodataの画素は0になる。
 * statisticsに無いバンドを含む場合はstd::invalid_argumentを送出する。
 */
[[nodiscard]] auto stretch_to_rgb8(const TileImage& image, const BandStatistics& statistics,
                                   double nodata = 0.0) -> std::vector<FlatArray2D<uint8_t>>;

}  // namespace cbers_tiler
