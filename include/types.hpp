#pragma once

#include <array>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "flat_array_2d.hpp"

namespace cbers_tiler {

// 地理座標 (EPSG:4326) の範囲
struct GeographicBounds {
    double west{};
    double south{};
    double east{};
    double north{};

    auto operator<=>(const GeographicBounds&) const = default;

    [[nodiscard]] auto to_array() const -> std::array<double, 4> {
        return {west, south, east, north};
    }
};

// 投影座標の範囲 (メルカトルタイルではEPSG:3857のメートル)
struct ProjectedBounds {
    double min_x{};
    double min_y{};
    double max_x{};
    double max_y{};

    auto operator<=>(const ProjectedBounds&) const = default;

    [[nodiscard]] double width() const noexcept { return max_x - min_x; }
    [[nodiscard]] double height() const noexcept { return max_y - min_y; }
};

// 呼び出し側が指定するバンドIDの並び (順序は出力の積み重ね順になる)
using BandList = std::vector<std::string>;

// 表示ストレッチ用のパーセンタイルカット値
struct PercentileCut {
    double min{};
    double max{};

    auto operator<=>(const PercentileCut&) const = default;
};

// バンドID -> カット値。重複したバンドIDは後勝ち
using BandStatistics = std::map<std::string, PercentileCut>;

enum class Resampling { nearest, bilinear, cubic };

[[nodiscard]] auto parse_resampling(std::string_view name) -> std::optional<Resampling>;
[[nodiscard]] auto to_string(Resampling resampling) -> std::string_view;

/**
 * @brief 複数バンドを積み重ねたタイル画像
 *
 * 全バンドが tilesize x tilesize の同じ形状を持つ。
 * バンドの並びは要求されたBandListの順序と一致する。
 */
class TileImage {
   public:
    TileImage() = default;
    TileImage(BandList bands, std::vector<FlatArray2D<float>> planes);

    [[nodiscard]] size_t band_count() const noexcept { return planes_.size(); }
    [[nodiscard]] size_t tilesize() const noexcept {
        return planes_.empty() ? 0 : planes_.front().width();
    }
    // (bands, height, width)
    [[nodiscard]] auto shape() const noexcept -> std::array<size_t, 3> {
        return {band_count(), tilesize(), tilesize()};
    }

    [[nodiscard]] auto bands() const noexcept -> const BandList& { return bands_; }
    [[nodiscard]] auto plane(size_t index) const -> const FlatArray2D<float>& {
        return planes_.at(index);
    }

   private:
    BandList bands_;
    std::vector<FlatArray2D<float>> planes_;
};

}  // namespace cbers_tiler
