#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

#include "geotiff.hpp"

namespace cbers_tiler {

// GeoJP2の埋め込みGeoTIFFを示すuuid
inline constexpr std::array<uint8_t, 16> GEOJP2_UUID = {0xb1, 0x4b, 0xf8, 0xbd, 0x08, 0x3d,
                                                        0x4b, 0x43, 0xa5, 0xae, 0x8c, 0xd7,
                                                        0xd5, 0xa6, 0xce, 0x03};

struct Jp2Box {
    std::array<char, 4> type{};
    std::span<const std::byte> payload;

    [[nodiscard]] bool is(std::string_view name) const noexcept {
        return name.size() == 4 && std::string_view(type.data(), 4) == name;
    }
};

// ボックス列を分解する。長さが不正ならIOErrorを送出
[[nodiscard]] auto parse_jp2_boxes(std::span<const std::byte> data) -> std::vector<Jp2Box>;

/**
 * @brief JP2ファイルの地理参照を読む
 *
 * 画像サイズはihdrボックス、座標系と変換はGeoJP2 uuidボックス内の
 * 縮退GeoTIFFから取得する。コードストリームのデコードは行わない。
 */
[[nodiscard]] auto read_jp2_georeference(const std::filesystem::path& path) -> GeoReference;

}  // namespace cbers_tiler
