#include "scene_tiler.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "band_worker.hpp"
#include "crs_transform.hpp"
#include "errors.hpp"
#include "geotiff.hpp"
#include "parallel.hpp"

namespace cbers_tiler {

namespace {

void validate_band_list(const BandList& bands) {
    for (const auto& band : bands) {
        bool digits = !band.empty() && std::all_of(band.begin(), band.end(), [](unsigned char c) {
            return std::isdigit(c) != 0;
        });
        if (!digits) {
            std::stringstream ss;
            ss << "バンドIDが不正です: '" << band << "'";
            throw std::invalid_argument(ss.str());
        }
    }
}

// ネイティブ範囲をEPSG:4326へ変換
auto geographic_bounds(const GeoReference& reference, int densify_pts) -> GeographicBounds {
    CrsTransformer to_wgs84(reference.crs, WGS84);
    return to_geographic(to_wgs84.transform_bounds(reference.native_bounds(), densify_pts));
}

}  // namespace

auto SceneTiler::Caches::from_config(const CacheConfig& config) -> Caches {
    return Caches{
        std::make_shared<RequestCache<SceneBounds>>(make_eviction_policy(config.bounds)),
        std::make_shared<RequestCache<SceneMetadata>>(make_eviction_policy(config.metadata)),
        std::make_shared<RequestCache<TileImage>>(make_eviction_policy(config.tile))};
}

SceneTiler::SceneTiler(Config config) : config_(std::move(config)) {
    caches_ = Caches::from_config(config_.cache);
}

SceneTiler::SceneTiler(Config config, Caches caches)
    : config_(std::move(config)), caches_(std::move(caches)) {
    if (!caches_.bounds || !caches_.metadata || !caches_.tile) {
        throw std::invalid_argument("キャッシュが設定されていません");
    }
}

auto SceneTiler::address_of(std::string_view scene_id) const -> SceneAddress {
    return SceneAddress(config_.storage_root, parse_scene_id(scene_id));
}

auto SceneTiler::bounds(std::string_view scene_id) -> SceneBounds {
    // キャッシュ照会の前にIDを検証する (不正なIDはキャッシュに残らない)
    SceneAddress address = address_of(scene_id);

    return caches_.bounds->get_or_compute(fingerprint("bounds", scene_id), [&] {
        GeoTiffReader reader(address.reference_band());
        return SceneBounds{address.scene().str(),
                           geographic_bounds(reader.georeference(), config_.densify_pts)};
    });
}

auto SceneTiler::metadata(std::string_view scene_id, double pmin, double pmax,
                          const BandList& bands) -> SceneMetadata {
    SceneAddress address = address_of(scene_id);

    if (pmin < 0.0 || pmax > 100.0 || pmin >= pmax) {
        std::stringstream ss;
        ss << "パーセンタイルの指定が不正です: pmin=" << pmin << ", pmax=" << pmax;
        throw std::invalid_argument(ss.str());
    }
    validate_band_list(bands);

    const BandList band_list = bands.empty() ? address.scene().instrument_info().bands : bands;

    return caches_.metadata->get_or_compute(
        fingerprint("metadata", scene_id, pmin, pmax, band_list), [&] {
            // 範囲は低解像度のプレビューから取る
            GeoReference preview = open_raster_georeference(address.preview());
            GeographicBounds scene_bounds = geographic_bounds(preview, config_.densify_pts);

            auto cuts = ordered_parallel_map(
                band_list, config_.metadata_workers, [&](const std::string& band) {
                    return min_max_worker(address.band(band), pmin, pmax,
                                          config_.stats_max_size);
                });

            BandStatistics statistics;
            for (size_t i = 0; i < band_list.size(); ++i) {
                statistics.insert_or_assign(band_list[i], cuts[i]);
            }
            return SceneMetadata{address.scene().str(), scene_bounds, std::move(statistics)};
        });
}

auto SceneTiler::tile(std::string_view scene_id, const mercator::TileAddress& tile,
                      const BandList& bands, size_t tilesize) -> TileImage {
    // 引数検証より先にIDを解釈し、不正なIDは常にParseErrorとする
    SceneAddress address = address_of(scene_id);

    mercator::validate(tile);
    if (tilesize == 0 || tilesize > MAX_TILESIZE) {
        std::stringstream ss;
        ss << "tilesizeは1から" << MAX_TILESIZE << "の範囲で指定してください: " << tilesize;
        throw std::invalid_argument(ss.str());
    }
    validate_band_list(bands);

    const BandList band_list = bands.empty() ? address.scene().instrument_info().default_rgb : bands;

    return caches_.tile->get_or_compute(
        fingerprint("tile", scene_id, tile.x, tile.y, tile.z, band_list, tilesize), [&] {
            SceneBounds scene = bounds(scene_id);
            if (!mercator::tile_intersects(scene.bounds, tile)) {
                std::stringstream ss;
                ss << "タイル " << tile.z << "/" << tile.x << "/" << tile.y
                   << " はシーン " << scene.sceneid << " の範囲外です";
                throw TileOutsideBounds(ss.str());
            }

            const ProjectedBounds tile_bounds = mercator::xy_bounds(tile);
            const WarpOptions options{.tilesize = tilesize,
                                      .resampling = config_.resampling,
                                      .nodata = config_.nodata,
                                      .densify_pts = config_.densify_pts};

            auto planes = ordered_parallel_map(
                band_list, config_.tile_workers, [&](const std::string& band) {
                    return tile_band_worker(address.band(band), tile_bounds, options);
                });

            return TileImage(band_list, std::move(planes));
        });
}

auto parse_band_list(std::string_view text) -> BandList {
    BandList bands;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find(',', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }

        std::string_view item = text.substr(start, end - start);
        while (!item.empty() && std::isspace(static_cast<unsigned char>(item.front()))) {
            item.remove_prefix(1);
        }
        while (!item.empty() && std::isspace(static_cast<unsigned char>(item.back()))) {
            item.remove_suffix(1);
        }
        if (!item.empty()) {
            bands.emplace_back(item);
        }
        start = end + 1;
    }
    return bands;
}

}  // namespace cbers_tiler
