#include "geotiff.hpp"

#include <geo_tiffp.h>
#include <geotiff.h>
#include <geotiffio.h>
#include <tiffio.h>
#include <xtiffio.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

#include "crs_transform.hpp"
#include "errors.hpp"
#include "jp2_header.hpp"

namespace cbers_tiler {

// GDAL互換 NODATA タグ (42113) を libtiff に登録
#ifndef TIFFTAG_GDAL_NODATA
#    define TIFFTAG_GDAL_NODATA 42113
#endif

static const TIFFFieldInfo gdal_field_info[] = {
    {TIFFTAG_GDAL_NODATA, -1, -1, TIFF_ASCII, FIELD_CUSTOM, TRUE, FALSE,
     const_cast<char*>("GDALNoDataValue")}};

static TIFFExtendProc parent_extender = nullptr;

static void gdal_tiff_extender(TIFF* tif) {
    TIFFMergeFieldInfo(tif, gdal_field_info,
                       sizeof(gdal_field_info) / sizeof(gdal_field_info[0]));
    if (parent_extender) {
        (*parent_extender)(tif);
    }
}

// バンドワーカーが並列に呼ぶためcall_onceで登録する
static void register_gdal_nodata_tag() {
    static std::once_flag registered;
    std::call_once(registered, [] { parent_extender = TIFFSetTagExtender(gdal_tiff_extender); });
}

namespace {

using SampleLoader = float (*)(const uint8_t*);

template <typename T>
float load_sample(const uint8_t* ptr) {
    T value;
    std::memcpy(&value, ptr, sizeof(T));
    return static_cast<float>(value);
}

// サンプル形式とビット深度に対応する読み出し関数
SampleLoader select_loader(uint16_t sample_format, uint16_t bits_per_sample) {
    switch (sample_format) {
        case SAMPLEFORMAT_UINT:
            switch (bits_per_sample) {
                case 8:
                    return &load_sample<uint8_t>;
                case 16:
                    return &load_sample<uint16_t>;
                case 32:
                    return &load_sample<uint32_t>;
                case 64:
                    return &load_sample<uint64_t>;
            }
            break;
        case SAMPLEFORMAT_INT:
            switch (bits_per_sample) {
                case 8:
                    return &load_sample<int8_t>;
                case 16:
                    return &load_sample<int16_t>;
                case 32:
                    return &load_sample<int32_t>;
                case 64:
                    return &load_sample<int64_t>;
            }
            break;
        case SAMPLEFORMAT_IEEEFP:
            switch (bits_per_sample) {
                case 32:
                    return &load_sample<float>;
                case 64:
                    return &load_sample<double>;
            }
            break;
    }
    return nullptr;
}

std::string path_string(const std::filesystem::path& path) { return path.string(); }

bool read_georeference(TIFF* tif, GeoReference& result, std::error_code& ec) {
    uint32_t width = 0, height = 0;
    TIFFGetField(tif, TIFFTAG_IMAGEWIDTH, &width);
    TIFFGetField(tif, TIFFTAG_IMAGELENGTH, &height);

    result.width = static_cast<int>(width);
    result.height = static_cast<int>(height);

    // GeoTIFF情報を読み込み
    GTIF* gtif = GTIFNew(tif);
    if (!gtif) {
        ec = std::make_error_code(std::errc::not_supported);
        return false;
    }

    unsigned short projected_cs = 0;
    unsigned short geographic_cs = 0;
    unsigned short raster_type = RasterPixelIsArea;
    int epsg = 0;
    if (GTIFKeyGet(gtif, ProjectedCSTypeGeoKey, &projected_cs, 0, 1) &&
        projected_cs != KvUserDefined) {
        epsg = projected_cs;
    } else if (GTIFKeyGet(gtif, GeographicTypeGeoKey, &geographic_cs, 0, 1) &&
               geographic_cs != KvUserDefined) {
        epsg = geographic_cs;
    }
    GTIFKeyGet(gtif, GTRasterTypeGeoKey, &raster_type, 0, 1);
    GTIFFree(gtif);

    if (epsg <= 0) {
        ec = std::make_error_code(std::errc::not_supported);
        return false;
    }
    result.crs = "EPSG:" + std::to_string(epsg);

    // PixelScaleとTiepoint、またはModelTransformationを読み込み
    double* pixel_scale = nullptr;
    double* tiepoints = nullptr;
    double* matrix = nullptr;
    uint16_t scale_count = 0;
    uint16_t tiepoint_count = 0;
    uint16_t matrix_count = 0;

    bool has_scale = TIFFGetField(tif, GTIFF_PIXELSCALE, &scale_count, &pixel_scale) &&
                     scale_count >= 2;
    bool has_tiepoint = TIFFGetField(tif, GTIFF_TIEPOINTS, &tiepoint_count, &tiepoints) &&
                        tiepoint_count >= 6;

    if (has_scale && has_tiepoint) {
        // タイポイントのラスター座標 (I, J) が原点でない場合も考慮
        result.geo_transform = {tiepoints[3] - tiepoints[0] * pixel_scale[0],
                                pixel_scale[0],
                                0.0,
                                tiepoints[4] + tiepoints[1] * pixel_scale[1],
                                0.0,
                                -pixel_scale[1]};
    } else if (TIFFGetField(tif, GTIFF_TRANSMATRIX, &matrix_count, &matrix) &&
               matrix_count >= 16) {
        result.geo_transform = {matrix[3], matrix[0], matrix[1], matrix[7], matrix[4], matrix[5]};
    } else {
        ec = std::make_error_code(std::errc::not_supported);
        return false;
    }

    // PixelIsPointは画素中心が基準なので半画素ずらす
    if (raster_type == RasterPixelIsPoint) {
        auto& gt = result.geo_transform;
        gt[0] -= 0.5 * gt[1] + 0.5 * gt[2];
        gt[3] -= 0.5 * gt[4] + 0.5 * gt[5];
    }

    // NODATA値を読み込み
    result.nodata.reset();
    char* nodata_str = nullptr;
    if (TIFFGetField(tif, TIFFTAG_GDAL_NODATA, &nodata_str) && nodata_str) {
        char* end = nullptr;
        double value = std::strtod(nodata_str, &end);
        if (end != nodata_str) {
            result.nodata = value;
        }
    }

    return true;
}

auto list_levels(TIFF* tif, const GeoReference& reference) -> std::vector<RasterLevel> {
    std::vector<RasterLevel> levels;
    levels.push_back({0, static_cast<uint32_t>(reference.width),
                      static_cast<uint32_t>(reference.height), 1.0});

    // COGのオーバービューは後続のIFDに縮小画像として格納されている
    const auto directory_count = TIFFNumberOfDirectories(tif);
    for (uint32_t dir = 1; dir < static_cast<uint32_t>(directory_count); ++dir) {
        if (!TIFFSetDirectory(tif, static_cast<tdir_t>(dir))) {
            break;
        }

        uint32_t subfile_type = 0;
        TIFFGetField(tif, TIFFTAG_SUBFILETYPE, &subfile_type);
        if (!(subfile_type & FILETYPE_REDUCEDIMAGE) || (subfile_type & FILETYPE_MASK)) {
            continue;
        }

        uint32_t width = 0, height = 0;
        TIFFGetField(tif, TIFFTAG_IMAGEWIDTH, &width);
        TIFFGetField(tif, TIFFTAG_IMAGELENGTH, &height);
        if (width == 0 || height == 0) {
            continue;
        }

        levels.push_back(
            {dir, width, height, static_cast<double>(reference.width) / static_cast<double>(width)});
    }

    TIFFSetDirectory(tif, 0);

    std::sort(levels.begin(), levels.end(),
              [](const auto& a, const auto& b) { return a.decimation < b.decimation; });
    return levels;
}

// メモリ上のTIFFを読むためのクライアントI/O
struct MemoryStream {
    std::span<const std::byte> bytes;
    toff_t position{0};
};

tmsize_t memory_read(thandle_t handle, void* buffer, tmsize_t size) {
    auto* stream = static_cast<MemoryStream*>(handle);
    if (size <= 0 || stream->position >= stream->bytes.size()) {
        return 0;
    }
    auto available = static_cast<tmsize_t>(stream->bytes.size() - stream->position);
    tmsize_t count = std::min(size, available);
    std::memcpy(buffer, stream->bytes.data() + stream->position, static_cast<size_t>(count));
    stream->position += static_cast<toff_t>(count);
    return count;
}

tmsize_t memory_write(thandle_t, void*, tmsize_t) { return 0; }

toff_t memory_seek(thandle_t handle, toff_t offset, int whence) {
    auto* stream = static_cast<MemoryStream*>(handle);
    switch (whence) {
        case SEEK_SET:
            stream->position = offset;
            break;
        case SEEK_CUR:
            stream->position += offset;
            break;
        case SEEK_END:
            stream->position = stream->bytes.size() + offset;
            break;
        default:
            return static_cast<toff_t>(-1);
    }
    return stream->position;
}

int memory_close(thandle_t) { return 0; }

toff_t memory_size(thandle_t handle) { return static_cast<MemoryStream*>(handle)->bytes.size(); }

int memory_map(thandle_t, void**, toff_t*) { return 0; }

void memory_unmap(thandle_t, void*, toff_t) {}

// 地理参照タグとGeoKeyを書き込む
bool write_georeference(TIFF* tif, const GeoReference& reference, std::error_code& ec) {
    int epsg = 0;
    if (reference.crs.rfind("EPSG:", 0) == 0) {
        epsg = std::atoi(reference.crs.c_str() + 5);
    }
    if (epsg <= 0) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }

    GTIF* gtif = GTIFNew(tif);
    if (!gtif) {
        ec = std::make_error_code(std::errc::io_error);
        return false;
    }

    const auto& gt = reference.geo_transform;
    if (gt[2] == 0.0 && gt[4] == 0.0) {
        // ModelPixelScaleTag: [ScaleX, ScaleY, ScaleZ]
        double pixel_scale[3] = {gt[1], -gt[5], 0.0};
        TIFFSetField(tif, GTIFF_PIXELSCALE, 3, pixel_scale);

        // ModelTiepointTag: [I, J, K, X, Y, Z]
        double tiepoint[6] = {0.0, 0.0, 0.0, gt[0], gt[3], 0.0};
        TIFFSetField(tif, GTIFF_TIEPOINTS, 6, tiepoint);
    } else {
        double matrix[16] = {gt[1], gt[2], 0.0, gt[0], gt[4], gt[5], 0.0, gt[3],
                             0.0,   0.0,   0.0, 0.0,   0.0,   0.0,   0.0, 1.0};
        TIFFSetField(tif, GTIFF_TRANSMATRIX, 16, matrix);
    }

    bool geographic = false;
    try {
        geographic = is_geographic_crs(reference.crs);
    } catch (const std::invalid_argument&) {
        GTIFFree(gtif);
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }

    if (geographic) {
        GTIFKeySet(gtif, GTModelTypeGeoKey, TYPE_SHORT, 1, ModelTypeGeographic);
        GTIFKeySet(gtif, GTRasterTypeGeoKey, TYPE_SHORT, 1, RasterPixelIsArea);
        GTIFKeySet(gtif, GeographicTypeGeoKey, TYPE_SHORT, 1, epsg);
    } else {
        GTIFKeySet(gtif, GTModelTypeGeoKey, TYPE_SHORT, 1, ModelTypeProjected);
        GTIFKeySet(gtif, GTRasterTypeGeoKey, TYPE_SHORT, 1, RasterPixelIsArea);
        GTIFKeySet(gtif, ProjectedCSTypeGeoKey, TYPE_SHORT, 1, epsg);
    }

    GTIFWriteKeys(gtif);
    GTIFFree(gtif);

    if (reference.nodata) {
        std::string nodata_str = std::to_string(*reference.nodata);
        TIFFSetField(tif, TIFFTAG_GDAL_NODATA, nodata_str.c_str());
    }
    return true;
}

struct TiledLayout {
    uint32_t width;
    uint32_t height;
    uint16_t samples_per_pixel;
    uint16_t bits_per_sample;
    uint16_t sample_format;
    uint16_t photometric;
};

// タイル形式のTIFFを書き込む共通処理
template <typename T, typename FillTile>
bool write_tiled(const std::filesystem::path& path, const TiledLayout& layout,
                 const GeoReference& reference, FillTile fill_tile, std::error_code& ec) {
    register_gdal_nodata_tag();

    // 出力ディレクトリが存在しない場合は作成
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return false;
        }
    }

    TIFF* tif = XTIFFOpen(path_string(path).c_str(), "w");
    if (!tif) {
        ec = std::make_error_code(std::errc::io_error);
        return false;
    }

    TIFFSetField(tif, TIFFTAG_IMAGEWIDTH, layout.width);
    TIFFSetField(tif, TIFFTAG_IMAGELENGTH, layout.height);
    TIFFSetField(tif, TIFFTAG_SAMPLESPERPIXEL, layout.samples_per_pixel);
    TIFFSetField(tif, TIFFTAG_BITSPERSAMPLE, layout.bits_per_sample);
    TIFFSetField(tif, TIFFTAG_SAMPLEFORMAT, layout.sample_format);
    TIFFSetField(tif, TIFFTAG_PHOTOMETRIC, layout.photometric);
    TIFFSetField(tif, TIFFTAG_PLANARCONFIG, PLANARCONFIG_CONTIG);

    // RGB以外の追加バンドはExtraSamplesとして宣言
    uint16_t color_channels = layout.photometric == PHOTOMETRIC_RGB ? 3 : 1;
    if (layout.samples_per_pixel > color_channels) {
        std::vector<uint16_t> extra(layout.samples_per_pixel - color_channels,
                                    EXTRASAMPLE_UNSPECIFIED);
        TIFFSetField(tif, TIFFTAG_EXTRASAMPLES, static_cast<uint16_t>(extra.size()),
                     extra.data());
    }

    // タイル形式で圧縮
    const uint32_t tile_width = 256;
    const uint32_t tile_height = 256;
    TIFFSetField(tif, TIFFTAG_TILEWIDTH, tile_width);
    TIFFSetField(tif, TIFFTAG_TILELENGTH, tile_height);
    TIFFSetField(tif, TIFFTAG_COMPRESSION, COMPRESSION_ADOBE_DEFLATE);

    if (!write_georeference(tif, reference, ec)) {
        XTIFFClose(tif);
        return false;
    }

    std::vector<T> tile_buffer(static_cast<size_t>(tile_width) * tile_height *
                               layout.samples_per_pixel);

    for (uint32_t ty = 0; ty < layout.height; ty += tile_height) {
        for (uint32_t tx = 0; tx < layout.width; tx += tile_width) {
            fill_tile(tile_buffer, tx, ty, tile_width, tile_height);

            if (TIFFWriteTile(tif, tile_buffer.data(), tx, ty, 0, 0) < 0) {
                XTIFFClose(tif);
                ec = std::make_error_code(std::errc::io_error);
                return false;
            }
        }
    }

    XTIFFClose(tif);
    return true;
}

}  // namespace

auto GeoReference::native_bounds() const -> ProjectedBounds {
    const auto& gt = geo_transform;
    const double corners[4][2] = {{0.0, 0.0},
                                  {static_cast<double>(width), 0.0},
                                  {0.0, static_cast<double>(height)},
                                  {static_cast<double>(width), static_cast<double>(height)}};

    ProjectedBounds bounds{std::numeric_limits<double>::max(), std::numeric_limits<double>::max(),
                           std::numeric_limits<double>::lowest(),
                           std::numeric_limits<double>::lowest()};

    for (const auto& corner : corners) {
        double x = gt[0] + corner[0] * gt[1] + corner[1] * gt[2];
        double y = gt[3] + corner[0] * gt[4] + corner[1] * gt[5];
        bounds.min_x = std::min(bounds.min_x, x);
        bounds.max_x = std::max(bounds.max_x, x);
        bounds.min_y = std::min(bounds.min_y, y);
        bounds.max_y = std::max(bounds.max_y, y);
    }
    return bounds;
}

auto invert_geo_transform(const GeoTransform& gt) -> std::optional<GeoTransform> {
    const double det = gt[1] * gt[5] - gt[2] * gt[4];
    if (std::abs(det) < 1e-15) {
        return std::nullopt;
    }

    const double inv_det = 1.0 / det;
    return GeoTransform{(gt[2] * gt[3] - gt[0] * gt[5]) * inv_det, gt[5] * inv_det,
                        -gt[2] * inv_det, (-gt[1] * gt[3] + gt[0] * gt[4]) * inv_det,
                        -gt[4] * inv_det, gt[1] * inv_det};
}

auto select_level(std::span<const RasterLevel> levels, double target_decimation) -> size_t {
    size_t best = 0;
    for (size_t i = 0; i < levels.size(); ++i) {
        // 浮動小数点誤差を許容
        if (levels[i].decimation <= target_decimation * 1.001 &&
            levels[i].decimation > levels[best].decimation) {
            best = i;
        }
    }
    return best;
}

class GeoTiffReader::Impl {
   public:
    explicit Impl(std::filesystem::path path) : path(std::move(path)) {}
    ~Impl() {
        if (tif) {
            XTIFFClose(tif);
        }
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    std::filesystem::path path;
    TIFF* tif = nullptr;
    GeoReference reference;
    std::vector<RasterLevel> levels;
};

GeoTiffReader::GeoTiffReader(const std::filesystem::path& path)
    : pImpl(std::make_unique<Impl>(path)) {
    register_gdal_nodata_tag();

    if (!std::filesystem::exists(path)) {
        std::stringstream ss;
        ss << "ファイルが見つかりません: " << path.string();
        throw IOError(ss.str());
    }

    pImpl->tif = XTIFFOpen(path_string(path).c_str(), "r");
    if (!pImpl->tif) {
        std::stringstream ss;
        ss << "GeoTIFFを開けません: " << path.string();
        throw IOError(ss.str());
    }

    std::error_code ec;
    if (!read_georeference(pImpl->tif, pImpl->reference, ec)) {
        std::stringstream ss;
        ss << "地理参照を読み取れません: " << path.string() << " (" << ec.message() << ")";
        throw IOError(ss.str());
    }

    pImpl->levels = list_levels(pImpl->tif, pImpl->reference);
}

GeoTiffReader::~GeoTiffReader() = default;

GeoTiffReader::GeoTiffReader(GeoTiffReader&&) noexcept = default;
GeoTiffReader& GeoTiffReader::operator=(GeoTiffReader&&) noexcept = default;

auto GeoTiffReader::georeference() const noexcept -> const GeoReference& {
    return pImpl->reference;
}

auto GeoTiffReader::levels() const noexcept -> const std::vector<RasterLevel>& {
    return pImpl->levels;
}

auto GeoTiffReader::read_window(size_t level, const PixelWindow& window) -> FlatArray2D<float> {
    if (level >= pImpl->levels.size()) {
        throw std::invalid_argument("存在しない解像度レベルです");
    }
    if (window.width <= 0 || window.height <= 0) {
        throw std::invalid_argument("読み込み範囲が空です");
    }

    TIFF* tif = pImpl->tif;
    const RasterLevel& info = pImpl->levels[level];
    if (!TIFFSetDirectory(tif, static_cast<tdir_t>(info.directory))) {
        std::stringstream ss;
        ss << "IFD " << info.directory << " に移動できません: " << pImpl->path.string();
        throw IOError(ss.str());
    }

    uint16_t bits_per_sample = 0, sample_format = 0, samples_per_pixel = 0, planar = 0;
    TIFFGetFieldDefaulted(tif, TIFFTAG_BITSPERSAMPLE, &bits_per_sample);
    TIFFGetFieldDefaulted(tif, TIFFTAG_SAMPLEFORMAT, &sample_format);
    TIFFGetFieldDefaulted(tif, TIFFTAG_SAMPLESPERPIXEL, &samples_per_pixel);
    TIFFGetFieldDefaulted(tif, TIFFTAG_PLANARCONFIG, &planar);

    SampleLoader loader = select_loader(sample_format, bits_per_sample);
    if (!loader) {
        std::stringstream ss;
        ss << "未対応のサンプル形式です (format=" << sample_format
           << ", bits=" << bits_per_sample << "): " << pImpl->path.string();
        throw IOError(ss.str());
    }

    const float fill_value = static_cast<float>(pImpl->reference.nodata.value_or(0.0));
    FlatArray2D<float> out(static_cast<size_t>(window.height), static_cast<size_t>(window.width),
                           fill_value);

    // レベルの範囲にクリップ
    const int64_t level_width = info.width;
    const int64_t level_height = info.height;
    const int64_t c0 = std::max<int64_t>(window.col, 0);
    const int64_t r0 = std::max<int64_t>(window.row, 0);
    const int64_t c1 = std::min<int64_t>(window.col + window.width, level_width);
    const int64_t r1 = std::min<int64_t>(window.row + window.height, level_height);
    if (c0 >= c1 || r0 >= r1) {
        return out;
    }

    const size_t bytes_per_sample = bits_per_sample / 8;
    const size_t stride = planar == PLANARCONFIG_CONTIG ? samples_per_pixel : 1;

    auto store = [&](const uint8_t* buffer, size_t sample_index, int64_t y, int64_t x) {
        out(static_cast<size_t>(y - window.row), static_cast<size_t>(x - window.col)) =
            loader(buffer + sample_index * bytes_per_sample);
    };

    // タイル形式かストリップ形式かを判定
    if (TIFFIsTiled(tif)) {
        uint32_t tile_width = 0, tile_height = 0;
        TIFFGetField(tif, TIFFTAG_TILEWIDTH, &tile_width);
        TIFFGetField(tif, TIFFTAG_TILELENGTH, &tile_height);
        if (tile_width == 0 || tile_height == 0) {
            throw IOError("タイルサイズが不正です: " + pImpl->path.string());
        }

        std::vector<uint8_t> tile_buffer(static_cast<size_t>(TIFFTileSize(tif)));

        for (int64_t ty = (r0 / tile_height) * tile_height; ty < r1; ty += tile_height) {
            for (int64_t tx = (c0 / tile_width) * tile_width; tx < c1; tx += tile_width) {
                if (TIFFReadTile(tif, tile_buffer.data(), static_cast<uint32_t>(tx),
                                 static_cast<uint32_t>(ty), 0, 0) < 0) {
                    std::stringstream ss;
                    ss << "タイルを読み込めません (" << tx << ", " << ty
                       << "): " << pImpl->path.string();
                    throw IOError(ss.str());
                }

                const int64_t y_end = std::min<int64_t>(ty + tile_height, r1);
                const int64_t x_end = std::min<int64_t>(tx + tile_width, c1);
                for (int64_t y = std::max(ty, r0); y < y_end; ++y) {
                    for (int64_t x = std::max(tx, c0); x < x_end; ++x) {
                        size_t index = static_cast<size_t>((y - ty) * tile_width + (x - tx));
                        store(tile_buffer.data(), index * stride, y, x);
                    }
                }
            }
        }
    } else {
        // ストリップ形式
        uint32_t rows_per_strip = 0;
        TIFFGetFieldDefaulted(tif, TIFFTAG_ROWSPERSTRIP, &rows_per_strip);
        int64_t strip_rows = std::clamp<int64_t>(rows_per_strip, 1, level_height);

        std::vector<uint8_t> strip_buffer(static_cast<size_t>(TIFFStripSize(tif)));

        for (int64_t sy = (r0 / strip_rows) * strip_rows; sy < r1; sy += strip_rows) {
            tstrip_t strip = TIFFComputeStrip(tif, static_cast<uint32_t>(sy), 0);
            if (TIFFReadEncodedStrip(tif, strip, strip_buffer.data(), static_cast<tmsize_t>(-1)) <
                0) {
                std::stringstream ss;
                ss << "ストリップ " << strip << " を読み込めません: " << pImpl->path.string();
                throw IOError(ss.str());
            }

            const int64_t y_end = std::min<int64_t>(sy + strip_rows, r1);
            for (int64_t y = std::max(sy, r0); y < y_end; ++y) {
                for (int64_t x = c0; x < c1; ++x) {
                    size_t index = static_cast<size_t>((y - sy) * level_width + x);
                    store(strip_buffer.data(), index * stride, y, x);
                }
            }
        }
    }

    return out;
}

auto read_georeference_from_memory(std::span<const std::byte> tiff_bytes) -> GeoReference {
    register_gdal_nodata_tag();

    MemoryStream stream{tiff_bytes, 0};
    TIFF* tif = XTIFFClientOpen("geojp2", "rm", static_cast<thandle_t>(&stream), memory_read,
                                memory_write, memory_seek, memory_close, memory_size, memory_map,
                                memory_unmap);
    if (!tif) {
        throw IOError("埋め込みGeoTIFFを開けません");
    }

    GeoReference reference;
    std::error_code ec;
    bool ok = read_georeference(tif, reference, ec);
    XTIFFClose(tif);

    if (!ok) {
        throw IOError("埋め込みGeoTIFFの地理参照を読み取れません (" + ec.message() + ")");
    }
    return reference;
}

auto open_raster_georeference(const std::filesystem::path& path) -> GeoReference {
    std::string extension = path.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (extension == ".jp2") {
        return read_jp2_georeference(path);
    }

    GeoTiffReader reader(path);
    return reader.georeference();
}

bool write_geotiff(const std::filesystem::path& path, const TileImage& image,
                   const GeoReference& reference, std::error_code& ec) {
    if (image.band_count() == 0) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }

    const uint32_t size = static_cast<uint32_t>(image.tilesize());
    const uint16_t band_count = static_cast<uint16_t>(image.band_count());
    const float fill_value = static_cast<float>(reference.nodata.value_or(0.0));

    TiledLayout layout{size, size, band_count, 32, SAMPLEFORMAT_IEEEFP, PHOTOMETRIC_MINISBLACK};

    return write_tiled<float>(
        path, layout, reference,
        [&](std::vector<float>& buffer, uint32_t tx, uint32_t ty, uint32_t tile_width,
            uint32_t tile_height) {
            std::fill(buffer.begin(), buffer.end(), fill_value);

            uint32_t actual_tile_width = std::min(tile_width, size - tx);
            uint32_t actual_tile_height = std::min(tile_height, size - ty);

            for (uint32_t row = 0; row < actual_tile_height; ++row) {
                for (uint32_t col = 0; col < actual_tile_width; ++col) {
                    size_t dst_idx = (static_cast<size_t>(row) * tile_width + col) * band_count;
                    for (uint16_t band = 0; band < band_count; ++band) {
                        buffer[dst_idx + band] = image.plane(band)(ty + row, tx + col);
                    }
                }
            }
        },
        ec);
}

bool write_geotiff_rgb8(const std::filesystem::path& path,
                        std::span<const FlatArray2D<uint8_t>> bands,
                        const GeoReference& reference, std::error_code& ec) {
    if (bands.empty()) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }

    const uint32_t width = static_cast<uint32_t>(bands.front().width());
    const uint32_t height = static_cast<uint32_t>(bands.front().height());
    for (const auto& band : bands) {
        if (band.width() != width || band.height() != height) {
            ec = std::make_error_code(std::errc::invalid_argument);
            return false;
        }
    }

    const uint16_t band_count = static_cast<uint16_t>(bands.size());
    TiledLayout layout{width,
                       height,
                       band_count,
                       8,
                       SAMPLEFORMAT_UINT,
                       static_cast<uint16_t>(band_count == 3 ? PHOTOMETRIC_RGB
                                                             : PHOTOMETRIC_MINISBLACK)};

    return write_tiled<uint8_t>(
        path, layout, reference,
        [&](std::vector<uint8_t>& buffer, uint32_t tx, uint32_t ty, uint32_t tile_width,
            uint32_t tile_height) {
            std::fill(buffer.begin(), buffer.end(), 0);

            uint32_t actual_tile_width = std::min(tile_width, width - tx);
            uint32_t actual_tile_height = std::min(tile_height, height - ty);

            for (uint32_t row = 0; row < actual_tile_height; ++row) {
                for (uint32_t col = 0; col < actual_tile_width; ++col) {
                    size_t dst_idx = (static_cast<size_t>(row) * tile_width + col) * band_count;
                    for (uint16_t band = 0; band < band_count; ++band) {
                        buffer[dst_idx + band] = bands[band](ty + row, tx + col);
                    }
                }
            }
        },
        ec);
}

}  // namespace cbers_tiler
