#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include "mercator.hpp"
#include "request_cache.hpp"
#include "scene_id.hpp"
#include "types.hpp"

namespace cbers_tiler {

struct SceneBounds {
    std::string sceneid;
    GeographicBounds bounds;
};

struct SceneMetadata {
    std::string sceneid;
    GeographicBounds bounds;
    BandStatistics statistics;
};

/**
 * @brief CBERS-4シーンの範囲、統計値、メルカトルタイルを提供する
 *
 * 各操作は呼び出し単位でメモ化される。キャッシュはインスタンスが所有し、
 * 複数スレッドから同時に呼び出してよい。
 */
class SceneTiler {
   public:
    struct CacheConfig {
        CachePolicyConfig bounds;
        CachePolicyConfig metadata;
        CachePolicyConfig tile;
    };

    struct Config {
        std::filesystem::path storage_root{"cbers-pds"};
        size_t metadata_workers{2};
        size_t tile_workers{3};
        int densify_pts{21};
        Resampling resampling{Resampling::bilinear};
        double nodata{0.0};
        size_t stats_max_size{1024};
        CacheConfig cache;
    };

    struct Caches {
        std::shared_ptr<RequestCache<SceneBounds>> bounds;
        std::shared_ptr<RequestCache<SceneMetadata>> metadata;
        std::shared_ptr<RequestCache<TileImage>> tile;

        // CacheConfigに従って3つのキャッシュを作る
        [[nodiscard]] static auto from_config(const CacheConfig& config) -> Caches;
    };

    explicit SceneTiler(Config config);
    // 既存のキャッシュを共有する場合
    SceneTiler(Config config, Caches caches);

    [[nodiscard]] auto config() const noexcept -> const Config& { return config_; }

    /**
     * @brief 参照バンドから求めたシーンの経緯度範囲
     *
     * シーンIDが不正ならParseError、参照バンドが読めなければIOError。
     */
    [[nodiscard]] auto bounds(std::string_view scene_id) -> SceneBounds;

    /**
     * @brief プレビューの範囲とバンド毎のパーセンタイルカット値
     *
     * @param bands 空ならセンサーの全バンド。重複したバンドIDは後勝ち
     */
    [[nodiscard]] auto metadata(std::string_view scene_id, double pmin = 2.0, double pmax = 98.0,
                                const BandList& bands = {}) -> SceneMetadata;

    /**
     * @brief メルカトルタイルを生成する
     *
     * タイルがシーン範囲と交差しない場合はTileOutsideBoundsを送出する。
     *
     * @param bands 出力のバンド順。空ならセンサーの既定RGB
     */
    [[nodiscard]] auto tile(std::string_view scene_id, const mercator::TileAddress& tile,
                            const BandList& bands = {}, size_t tilesize = 256) -> TileImage;

    [[nodiscard]] auto bounds_cache_stats() const -> CacheStats { return caches_.bounds->stats(); }
    [[nodiscard]] auto metadata_cache_stats() const -> CacheStats {
        return caches_.metadata->stats();
    }
    [[nodiscard]] auto tile_cache_stats() const -> CacheStats { return caches_.tile->stats(); }

   private:
    [[nodiscard]] auto address_of(std::string_view scene_id) const -> SceneAddress;

    Config config_;
    Caches caches_;
};

// tilesizeの上限
inline constexpr size_t MAX_TILESIZE = 4096;

// "5,6,7" -> {"5", "6", "7"}。空要素は無視する
[[nodiscard]] auto parse_band_list(std::string_view text) -> BandList;

}  // namespace cbers_tiler
