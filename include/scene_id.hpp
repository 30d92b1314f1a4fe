#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "types.hpp"

namespace cbers_tiler {

// CBERS-4 センサー毎のバンド構成
struct InstrumentInfo {
    std::string_view name;
    BandList bands;
    std::string reference_band;
    BandList default_rgb;
};

[[nodiscard]] auto instrument_info(std::string_view instrument) -> const InstrumentInfo&;

// 例: CBERS_4_MUX_20171121_057_094_L2
class SceneId {
   public:
    [[nodiscard]] auto str() const noexcept -> const std::string& { return scene_id_; }
    [[nodiscard]] auto satellite() const noexcept -> const std::string& { return satellite_; }
    [[nodiscard]] auto mission() const noexcept -> const std::string& { return mission_; }
    [[nodiscard]] auto instrument() const noexcept -> const std::string& { return instrument_; }
    [[nodiscard]] int acquisition_year() const noexcept { return year_; }
    [[nodiscard]] int acquisition_month() const noexcept { return month_; }
    [[nodiscard]] int acquisition_day() const noexcept { return day_; }
    [[nodiscard]] auto path() const noexcept -> const std::string& { return path_; }
    [[nodiscard]] auto row() const noexcept -> const std::string& { return row_; }
    [[nodiscard]] auto processing_level() const noexcept -> const std::string& {
        return processing_level_;
    }

    // ストレージ上のキー: CBERS4/<instrument>/<path>/<row>/<sceneid>
    [[nodiscard]] auto key() const -> std::string;

    [[nodiscard]] auto instrument_info() const -> const InstrumentInfo& {
        return cbers_tiler::instrument_info(instrument_);
    }

   private:
    friend auto parse_scene_id(std::string_view scene_id) -> SceneId;

    std::string scene_id_;
    std::string satellite_;
    std::string mission_;
    std::string instrument_;
    int year_{};
    int month_{};
    int day_{};
    std::string path_;
    std::string row_;
    std::string processing_level_;
};

/**
 * @brief シーンIDを解析
 *
 * I/Oは行わない。書式が不正な場合はParseErrorを送出する。
 */
[[nodiscard]] auto parse_scene_id(std::string_view scene_id) -> SceneId;

// シーンを構成するアセットのパス
class SceneAddress {
   public:
    SceneAddress(std::filesystem::path storage_root, SceneId scene);

    [[nodiscard]] auto scene() const noexcept -> const SceneId& { return scene_; }
    [[nodiscard]] auto prefix() const -> std::filesystem::path;

    // <root>/<key>/<sceneid>_BAND<n>.tif
    [[nodiscard]] auto band(std::string_view band_id) const -> std::filesystem::path;
    [[nodiscard]] auto reference_band() const -> std::filesystem::path;
    // <root>/<key>/preview.jp2
    [[nodiscard]] auto preview() const -> std::filesystem::path;

   private:
    std::filesystem::path storage_root_;
    SceneId scene_;
};

}  // namespace cbers_tiler
