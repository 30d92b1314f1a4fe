#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include "flat_array_2d.hpp"
#include "types.hpp"

namespace cbers_tiler {

// geo_transform: [origin_x, pixel_width, row_rotation, origin_y, col_rotation, -pixel_height]
using GeoTransform = std::array<double, 6>;

struct GeoReference {
    GeoTransform geo_transform{0.0, 1.0, 0.0, 0.0, 0.0, -1.0};
    std::string crs;  // "EPSG:<code>"
    int width{};
    int height{};
    std::optional<double> nodata;

    // ネイティブCRSでの範囲
    [[nodiscard]] auto native_bounds() const -> ProjectedBounds;
};

// 逆アフィン変換。回転項を含む場合も扱う
[[nodiscard]] auto invert_geo_transform(const GeoTransform& gt) -> std::optional<GeoTransform>;

// TIFF内の解像度レベル (0はフル解像度、以降はオーバービュー)
struct RasterLevel {
    uint32_t directory{};
    uint32_t width{};
    uint32_t height{};
    double decimation{1.0};
};

struct PixelWindow {
    int64_t col{};
    int64_t row{};
    int64_t width{};
    int64_t height{};
};

/**
 * @brief 目標の縮小率に最も適したレベルを選ぶ
 *
 * 縮小率が目標以下のレベルのうち最も粗いものを返す。
 * 該当するオーバービューが無ければ0 (フル解像度)。
 */
[[nodiscard]] auto select_level(std::span<const RasterLevel> levels, double target_decimation)
    -> size_t;

/**
 * @brief GeoTIFF (COGを含む) の読み込み
 *
 * 1インスタンスは1スレッドから使用すること。
 * 開けない場合や地理参照が無い場合はIOErrorを送出する。
 */
class GeoTiffReader {
   public:
    explicit GeoTiffReader(const std::filesystem::path& path);
    ~GeoTiffReader();

    // ムーブのみ可能な型
    GeoTiffReader(const GeoTiffReader&) = delete;
    GeoTiffReader& operator=(const GeoTiffReader&) = delete;
    GeoTiffReader(GeoTiffReader&&) noexcept;
    GeoTiffReader& operator=(GeoTiffReader&&) noexcept;

    [[nodiscard]] auto georeference() const noexcept -> const GeoReference&;
    [[nodiscard]] auto levels() const noexcept -> const std::vector<RasterLevel>&;

    /**
     * @brief 指定レベルの矩形領域を読み込む (1番目のサンプルのみ)
     *
     * 範囲外の部分はnodata (未設定なら0) で埋められる。
     */
    [[nodiscard]] auto read_window(size_t level, const PixelWindow& window) -> FlatArray2D<float>;

   private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// メモリ上のTIFF (GeoJP2のuuidボックス等) から地理参照を読む
[[nodiscard]] auto read_georeference_from_memory(std::span<const std::byte> tiff_bytes)
    -> GeoReference;

// .jp2はGeoJP2ヘッダ、それ以外はGeoTIFFとして地理参照を読む
[[nodiscard]] auto open_raster_georeference(const std::filesystem::path& path) -> GeoReference;

// Float32のマルチバンドGeoTIFFを書き込む
[[nodiscard]] bool write_geotiff(const std::filesystem::path& path, const TileImage& image,
                                 const GeoReference& reference, std::error_code& ec);

// ストレッチ済み8bit画像を書き込む (3バンドならRGB)
[[nodiscard]] bool write_geotiff_rgb8(const std::filesystem::path& path,
                                      std::span<const FlatArray2D<uint8_t>> bands,
                                      const GeoReference& reference, std::error_code& ec);

}  // namespace cbers_tiler
