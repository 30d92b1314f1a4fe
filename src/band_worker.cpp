#include "band_worker.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>

#include "crs_transform.hpp"
#include "errors.hpp"
#include "geotiff.hpp"

namespace cbers_tiler {

namespace {

// 各カーネルが参照する最大の余白 (cubicは中心から2画素)
constexpr int64_t KERNEL_MARGIN = 2;

// 統計用に一度に読み込む行数
constexpr int64_t STATS_CHUNK_ROWS = 256;

// Catmull-Rom (a = -0.5) のキュービック重み
double cubic_weight(double t) {
    constexpr double a = -0.5;
    t = std::abs(t);
    if (t <= 1.0) {
        return ((a + 2.0) * t - (a + 3.0)) * t * t + 1.0;
    }
    if (t < 2.0) {
        return ((a * t - 5.0 * a) * t + 8.0 * a) * t - 4.0 * a;
    }
    return 0.0;
}

class WindowSampler {
   public:
    WindowSampler(const FlatArray2D<float>& data, double src_nodata)
        : data_(data), src_nodata_(src_nodata) {}

    // x, yは窓内の連続座標 (画素iは [i, i+1) を占める)
    [[nodiscard]] std::optional<double> sample(double x, double y, Resampling resampling) const {
        switch (resampling) {
            case Resampling::nearest:
                return nearest(x, y);
            case Resampling::bilinear:
                return bilinear(x, y);
            case Resampling::cubic:
                return cubic(x, y);
        }
        return std::nullopt;
    }

   private:
    [[nodiscard]] std::optional<double> at(int64_t col, int64_t row) const {
        // ラスタ端では端の画素を繰り返す
        col = std::clamp<int64_t>(col, 0, static_cast<int64_t>(data_.width()) - 1);
        row = std::clamp<int64_t>(row, 0, static_cast<int64_t>(data_.height()) - 1);
        float value = data_(static_cast<size_t>(row), static_cast<size_t>(col));
        if (std::isnan(value) || static_cast<double>(value) == src_nodata_) {
            return std::nullopt;
        }
        return value;
    }

    [[nodiscard]] std::optional<double> nearest(double x, double y) const {
        return at(static_cast<int64_t>(std::floor(x)), static_cast<int64_t>(std::floor(y)));
    }

    [[nodiscard]] std::optional<double> bilinear(double x, double y) const {
        const double fx = x - 0.5;
        const double fy = y - 0.5;
        const auto x0 = static_cast<int64_t>(std::floor(fx));
        const auto y0 = static_cast<int64_t>(std::floor(fy));
        const double tx = fx - static_cast<double>(x0);
        const double ty = fy - static_cast<double>(y0);

        auto v00 = at(x0, y0);
        auto v10 = at(x0 + 1, y0);
        auto v01 = at(x0, y0 + 1);
        auto v11 = at(x0 + 1, y0 + 1);
        if (!v00 || !v10 || !v01 || !v11) {
            return std::nullopt;
        }

        const double top = *v00 + (*v10 - *v00) * tx;
        const double bottom = *v01 + (*v11 - *v01) * tx;
        return top + (bottom - top) * ty;
    }

    [[nodiscard]] std::optional<double> cubic(double x, double y) const {
        const double fx = x - 0.5;
        const double fy = y - 0.5;
        const auto x0 = static_cast<int64_t>(std::floor(fx));
        const auto y0 = static_cast<int64_t>(std::floor(fy));
        const double tx = fx - static_cast<double>(x0);
        const double ty = fy - static_cast<double>(y0);

        std::array<double, 4> wx{};
        std::array<double, 4> wy{};
        for (int i = 0; i < 4; ++i) {
            wx[i] = cubic_weight(tx - (i - 1));
            wy[i] = cubic_weight(ty - (i - 1));
        }

        double sum = 0.0;
        for (int j = 0; j < 4; ++j) {
            double row_sum = 0.0;
            for (int i = 0; i < 4; ++i) {
                auto v = at(x0 + i - 1, y0 + j - 1);
                if (!v) {
                    return std::nullopt;
                }
                row_sum += *v * wx[i];
            }
            sum += row_sum * wy[j];
        }
        return sum;
    }

    const FlatArray2D<float>& data_;
    double src_nodata_;
};

// ソースCRS上の矩形を、指定レベルの画素窓 (余白付き、レベル内にクリップ) に変換
std::optional<PixelWindow> source_window(const ProjectedBounds& bounds, const GeoTransform& inverse,
                                         const RasterLevel& level, double scale_x, double scale_y) {
    const double corners[4][2] = {{bounds.min_x, bounds.min_y},
                                  {bounds.max_x, bounds.min_y},
                                  {bounds.min_x, bounds.max_y},
                                  {bounds.max_x, bounds.max_y}};

    double min_col = std::numeric_limits<double>::max();
    double min_row = std::numeric_limits<double>::max();
    double max_col = std::numeric_limits<double>::lowest();
    double max_row = std::numeric_limits<double>::lowest();
    for (const auto& corner : corners) {
        double col = (inverse[0] + inverse[1] * corner[0] + inverse[2] * corner[1]) / scale_x;
        double row = (inverse[3] + inverse[4] * corner[0] + inverse[5] * corner[1]) / scale_y;
        min_col = std::min(min_col, col);
        max_col = std::max(max_col, col);
        min_row = std::min(min_row, row);
        max_row = std::max(max_row, row);
    }

    int64_t col0 = std::max<int64_t>(static_cast<int64_t>(std::floor(min_col)) - KERNEL_MARGIN, 0);
    int64_t row0 = std::max<int64_t>(static_cast<int64_t>(std::floor(min_row)) - KERNEL_MARGIN, 0);
    int64_t col1 = std::min<int64_t>(static_cast<int64_t>(std::ceil(max_col)) + KERNEL_MARGIN,
                                     static_cast<int64_t>(level.width));
    int64_t row1 = std::min<int64_t>(static_cast<int64_t>(std::ceil(max_row)) + KERNEL_MARGIN,
                                     static_cast<int64_t>(level.height));

    if (col1 <= col0 || row1 <= row0) {
        return std::nullopt;
    }
    return PixelWindow{col0, row0, col1 - col0, row1 - row0};
}

double pixel_size(double a, double b) { return std::hypot(a, b); }

// 2つの矩形の共通部分。面積を持たなければnullopt
std::optional<ProjectedBounds> intersection(const ProjectedBounds& a, const ProjectedBounds& b) {
    ProjectedBounds out{std::max(a.min_x, b.min_x), std::max(a.min_y, b.min_y),
                        std::min(a.max_x, b.max_x), std::min(a.max_y, b.max_y)};
    if (out.min_x >= out.max_x || out.min_y >= out.max_y) {
        return std::nullopt;
    }
    return out;
}

}  // namespace

auto tile_band_worker(const std::filesystem::path& band_path, const ProjectedBounds& tile_bounds,
                      const WarpOptions& options) -> FlatArray2D<float> {
    if (options.tilesize == 0) {
        throw std::invalid_argument("tilesizeは1以上である必要があります");
    }

    const size_t tilesize = options.tilesize;
    const auto nodata = static_cast<float>(options.nodata);
    FlatArray2D<float> output(tilesize, tilesize, nodata);

    GeoTiffReader reader(band_path);
    const auto& reference = reader.georeference();
    const double src_nodata = reference.nodata.value_or(options.nodata);

    auto inverse = invert_geo_transform(reference.geo_transform);
    if (!inverse) {
        std::stringstream ss;
        ss << "ジオ変換が逆変換できません: " << band_path.string();
        throw IOError(ss.str());
    }

    // 低ズームではタイル全体がソースCRSの定義域を外れるため、ソースの範囲で切り詰めてから投影する
    const ProjectedBounds footprint = CrsTransformer(reference.crs, WEB_MERCATOR)
                                          .transform_bounds(reference.native_bounds(),
                                                            options.densify_pts);
    const auto clipped = intersection(tile_bounds, footprint);
    if (!clipped) {
        return output;
    }

    const double res_x = tile_bounds.width() / static_cast<double>(tilesize);
    const double res_y = tile_bounds.height() / static_cast<double>(tilesize);

    CrsTransformer to_source(WEB_MERCATOR, reference.crs);
    const ProjectedBounds src_bounds = to_source.transform_bounds(*clipped, options.densify_pts);

    // 目標解像度とフル解像度の比からオーバービューを選ぶ
    const auto& gt = reference.geo_transform;
    const double src_res_x = pixel_size(gt[1], gt[4]);
    const double src_res_y = pixel_size(gt[2], gt[5]);
    const double out_cols = clipped->width() / res_x;
    const double out_rows = clipped->height() / res_y;
    const double target_decimation = std::min(src_bounds.width() / out_cols / src_res_x,
                                              src_bounds.height() / out_rows / src_res_y);

    const auto& levels = reader.levels();
    const size_t level_index = select_level(levels, target_decimation);
    const RasterLevel& level = levels[level_index];
    const double scale_x = static_cast<double>(reference.width) / level.width;
    const double scale_y = static_cast<double>(reference.height) / level.height;

    auto window = source_window(src_bounds, *inverse, level, scale_x, scale_y);
    if (!window) {
        // タイルがソースと重ならない
        return output;
    }

    const FlatArray2D<float> data = reader.read_window(level_index, *window);
    const WindowSampler sampler(data, src_nodata);

    std::vector<double> xs(tilesize);
    std::vector<double> ys(tilesize);
    std::vector<char> inside(tilesize);

    // 出力画素の中心を1行ずつソースCRSへ逆変換してサンプリング
    for (size_t row = 0; row < tilesize; ++row) {
        for (size_t col = 0; col < tilesize; ++col) {
            xs[col] = tile_bounds.min_x + (static_cast<double>(col) + 0.5) * res_x;
            ys[col] = tile_bounds.max_y - (static_cast<double>(row) + 0.5) * res_y;
            inside[col] = xs[col] >= clipped->min_x && xs[col] <= clipped->max_x &&
                          ys[col] >= clipped->min_y && ys[col] <= clipped->max_y;
        }
        to_source.transform_points(xs, ys);

        auto out_row = output.row(row);
        for (size_t col = 0; col < tilesize; ++col) {
            if (!inside[col] || !std::isfinite(xs[col]) || !std::isfinite(ys[col])) {
                continue;
            }

            const double full_col = (*inverse)[0] + (*inverse)[1] * xs[col] + (*inverse)[2] * ys[col];
            const double full_row = (*inverse)[3] + (*inverse)[4] * xs[col] + (*inverse)[5] * ys[col];
            if (full_col < 0.0 || full_row < 0.0 || full_col >= reference.width ||
                full_row >= reference.height) {
                continue;
            }

            const double x = full_col / scale_x - static_cast<double>(window->col);
            const double y = full_row / scale_y - static_cast<double>(window->row);
            if (auto value = sampler.sample(x, y, options.resampling)) {
                out_row[col] = static_cast<float>(*value);
            }
        }
    }

    return output;
}

double percentile(std::vector<float>& values, double p) {
    if (values.empty()) {
        throw std::invalid_argument("空の配列のパーセンタイルは計算できません");
    }
    if (p < 0.0 || p > 100.0) {
        throw std::invalid_argument("パーセンタイルは0から100の範囲で指定してください");
    }

    if (!std::is_sorted(values.begin(), values.end())) {
        std::sort(values.begin(), values.end());
    }

    const double rank = p / 100.0 * static_cast<double>(values.size() - 1);
    const auto lower = static_cast<size_t>(std::floor(rank));
    const auto upper = static_cast<size_t>(std::ceil(rank));
    const double fraction = rank - static_cast<double>(lower);
    return values[lower] + (static_cast<double>(values[upper]) - values[lower]) * fraction;
}

auto min_max_worker(const std::filesystem::path& band_path, double pmin, double pmax,
                    size_t max_size) -> PercentileCut {
    if (max_size == 0) {
        throw std::invalid_argument("max_sizeは1以上である必要があります");
    }

    GeoTiffReader reader(band_path);
    const auto& reference = reader.georeference();
    const double src_nodata = reference.nodata.value_or(0.0);

    const double long_side = std::max(reference.width, reference.height);
    const auto& levels = reader.levels();
    const size_t level_index = select_level(levels, long_side / static_cast<double>(max_size));
    const RasterLevel& level = levels[level_index];

    // 長辺がmax_size以下になる間引き幅
    const auto width = static_cast<int64_t>(level.width);
    const auto height = static_cast<int64_t>(level.height);
    const int64_t step = std::max<int64_t>(
        1, (std::max(width, height) + static_cast<int64_t>(max_size) - 1) /
               static_cast<int64_t>(max_size));

    std::vector<float> values;
    values.reserve(static_cast<size_t>((width / step + 1) * (height / step + 1)));

    for (int64_t start = 0; start < height; start += STATS_CHUNK_ROWS) {
        const int64_t rows = std::min(STATS_CHUNK_ROWS, height - start);
        const auto block = reader.read_window(level_index, PixelWindow{0, start, width, rows});

        for (int64_t i = 0; i < rows; ++i) {
            if ((start + i) % step != 0) {
                continue;
            }
            const auto row = block.row(static_cast<size_t>(i));
            for (int64_t col = 0; col < width; col += step) {
                float value = row[static_cast<size_t>(col)];
                if (!std::isnan(value) && static_cast<double>(value) != src_nodata) {
                    values.push_back(value);
                }
            }
        }
    }

    if (values.empty()) {
        std::stringstream ss;
        ss << "有効な画素がありません: " << band_path.string();
        throw IOError(ss.str());
    }

    std::sort(values.begin(), values.end());
    return PercentileCut{percentile(values, pmin), percentile(values, pmax)};
}

}  // namespace cbers_tiler
