#include "scene_id.hpp"

#include <array>
#include <charconv>
#include <regex>
#include <sstream>
#include <utility>

#include "errors.hpp"

namespace cbers_tiler {

namespace {

const std::array<InstrumentInfo, 4>& instrument_table() {
    static const std::array<InstrumentInfo, 4> table{{
        {"MUX", {"5", "6", "7", "8"}, "5", {"5", "6", "7"}},
        {"AWFI", {"13", "14", "15", "16"}, "14", {"15", "14", "13"}},
        {"PAN10M", {"2", "3", "4"}, "4", {"3", "4", "2"}},
        {"PAN5M", {"1"}, "1", {"1", "1", "1"}},
    }};
    return table;
}

int to_int(const std::string& digits) {
    int value = 0;
    std::from_chars(digits.data(), digits.data() + digits.size(), value);
    return value;
}

}  // namespace

auto instrument_info(std::string_view instrument) -> const InstrumentInfo& {
    for (const auto& info : instrument_table()) {
        if (info.name == instrument) {
            return info;
        }
    }

    std::stringstream ss;
    ss << "未対応のセンサーです: " << instrument;
    throw ParseError(ss.str());
}

auto SceneId::key() const -> std::string {
    std::stringstream ss;
    ss << satellite_ << mission_ << "/" << instrument_ << "/" << path_ << "/" << row_ << "/"
       << scene_id_;
    return ss.str();
}

auto parse_scene_id(std::string_view scene_id) -> SceneId {
    // 衛星_ミッション_センサー_取得日_パス_ロウ_処理レベル
    static const std::regex pattern(
        R"(^(CBERS)_(4)_(MUX|AWFI|PAN5M|PAN10M)_([0-9]{4})([0-9]{2})([0-9]{2})_([0-9]{3})_([0-9]{3})_(L[0-9])$)");

    std::string input(scene_id);
    std::smatch match;
    if (input.empty() || !std::regex_match(input, match, pattern)) {
        std::stringstream ss;
        ss << "CBERSシーンIDとして解析できません: '" << input << "'";
        throw ParseError(ss.str());
    }

    SceneId id;
    id.scene_id_ = input;
    id.satellite_ = match[1].str();
    id.mission_ = match[2].str();
    id.instrument_ = match[3].str();
    id.year_ = to_int(match[4].str());
    id.month_ = to_int(match[5].str());
    id.day_ = to_int(match[6].str());
    id.path_ = match[7].str();
    id.row_ = match[8].str();
    id.processing_level_ = match[9].str();

    if (id.month_ < 1 || id.month_ > 12 || id.day_ < 1 || id.day_ > 31) {
        std::stringstream ss;
        ss << "シーンIDの取得日が不正です: '" << input << "'";
        throw ParseError(ss.str());
    }

    return id;
}

SceneAddress::SceneAddress(std::filesystem::path storage_root, SceneId scene)
    : storage_root_(std::move(storage_root)), scene_(std::move(scene)) {}

auto SceneAddress::prefix() const -> std::filesystem::path {
    return storage_root_ / scene_.key();
}

auto SceneAddress::band(std::string_view band_id) const -> std::filesystem::path {
    std::string file_name = scene_.str() + "_BAND" + std::string(band_id) + ".tif";
    return prefix() / file_name;
}

auto SceneAddress::reference_band() const -> std::filesystem::path {
    return band(scene_.instrument_info().reference_band);
}

auto SceneAddress::preview() const -> std::filesystem::path { return prefix() / "preview.jp2"; }

}  // namespace cbers_tiler
