#include "stretch.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace cbers_tiler {

double linear_rescale(double value, double in_min, double in_max, double out_min,
                      double out_max) noexcept {
    // 入力範囲が潰れている場合は下限に寄せる
    if (in_max <= in_min) {
        return value > in_min ? out_max : out_min;
    }

    double scaled = (value - in_min) / (in_max - in_min) * (out_max - out_min) + out_min;
    return std::clamp(scaled, std::min(out_min, out_max), std::max(out_min, out_max));
}

auto stretch_to_rgb8(const TileImage& image, const BandStatistics& statistics, double nodata)
    -> std::vector<FlatArray2D<uint8_t>> {
    std::vector<FlatArray2D<uint8_t>> bands;
    bands.reserve(image.band_count());

    for (size_t b = 0; b < image.band_count(); ++b) {
        const auto& band_id = image.bands()[b];
        auto it = statistics.find(band_id);
        if (it == statistics.end()) {
            std::stringstream ss;
            ss << "バンド " << band_id << " の統計値がありません";
            throw std::invalid_argument(ss.str());
        }
        const PercentileCut& cut = it->second;

        const auto& plane = image.plane(b);
        FlatArray2D<uint8_t> out(plane.height(), plane.width());
        const float* src = plane.data();
        uint8_t* dst = out.data();
        for (size_t i = 0; i < plane.size(); ++i) {
            if (std::isnan(src[i]) || static_cast<double>(src[i]) == nodata) {
                continue;
            }
            dst[i] = static_cast<uint8_t>(std::lround(linear_rescale(src[i], cut.min, cut.max)));
        }
        bands.push_back(std::move(out));
    }

    return bands;
}

}  // namespace cbers_tiler
