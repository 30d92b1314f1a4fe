#include "types.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace cbers_tiler {

auto parse_resampling(std::string_view name) -> std::optional<Resampling> {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "nearest") {
        return Resampling::nearest;
    }
    if (lower == "bilinear") {
        return Resampling::bilinear;
    }
    if (lower == "cubic") {
        return Resampling::cubic;
    }
    return std::nullopt;
}

auto to_string(Resampling resampling) -> std::string_view {
    switch (resampling) {
        case Resampling::nearest:
            return "nearest";
        case Resampling::bilinear:
            return "bilinear";
        case Resampling::cubic:
            return "cubic";
    }
    return "unknown";
}

TileImage::TileImage(BandList bands, std::vector<FlatArray2D<float>> planes)
    : bands_(std::move(bands)), planes_(std::move(planes)) {
    if (bands_.size() != planes_.size()) {
        throw std::invalid_argument("バンド数とプレーン数が一致しません");
    }

    // 全プレーンが同じ正方形であることを保証
    for (const auto& plane : planes_) {
        if (plane.width() != plane.height() || plane.width() != planes_.front().width()) {
            throw std::invalid_argument("タイルの全バンドは同じ正方形サイズである必要があります");
        }
    }
}

}  // namespace cbers_tiler
