#include "jp2_header.hpp"

#include <algorithm>
#include <cstring>
#include <optional>
#include <sstream>

#include "errors.hpp"
#include "memory_mapped_file.hpp"

namespace cbers_tiler {

namespace {

constexpr uint32_t JP2_SIGNATURE = 0x0D0A870A;

uint32_t read_be32(const std::byte* ptr) {
    return (static_cast<uint32_t>(ptr[0]) << 24) | (static_cast<uint32_t>(ptr[1]) << 16) |
           (static_cast<uint32_t>(ptr[2]) << 8) | static_cast<uint32_t>(ptr[3]);
}

uint64_t read_be64(const std::byte* ptr) {
    return (static_cast<uint64_t>(read_be32(ptr)) << 32) | read_be32(ptr + 4);
}

struct ImageHeader {
    uint32_t height;
    uint32_t width;
};

std::optional<ImageHeader> find_image_header(std::span<const Jp2Box> boxes) {
    for (const auto& box : boxes) {
        if (!box.is("jp2h")) {
            continue;
        }
        for (const auto& child : parse_jp2_boxes(box.payload)) {
            // ihdr: HEIGHT(4) WIDTH(4) NC(2) BPC(1) C(1) UnkC(1) IPR(1)
            if (child.is("ihdr") && child.payload.size() >= 14) {
                return ImageHeader{read_be32(child.payload.data()),
                                   read_be32(child.payload.data() + 4)};
            }
        }
    }
    return std::nullopt;
}

std::optional<std::span<const std::byte>> find_geojp2(std::span<const Jp2Box> boxes) {
    for (const auto& box : boxes) {
        if (!box.is("uuid") || box.payload.size() <= GEOJP2_UUID.size()) {
            continue;
        }
        if (std::memcmp(box.payload.data(), GEOJP2_UUID.data(), GEOJP2_UUID.size()) == 0) {
            return box.payload.subspan(GEOJP2_UUID.size());
        }
    }
    return std::nullopt;
}

}  // namespace

auto parse_jp2_boxes(std::span<const std::byte> data) -> std::vector<Jp2Box> {
    std::vector<Jp2Box> boxes;
    size_t offset = 0;

    while (offset < data.size()) {
        if (data.size() - offset < 8) {
            throw IOError("JP2ボックスヘッダが途中で切れています");
        }

        uint64_t length = read_be32(data.data() + offset);
        size_t header_size = 8;

        Jp2Box box;
        std::memcpy(box.type.data(), data.data() + offset + 4, 4);

        if (length == 1) {
            // XLBox (64bit長)
            if (data.size() - offset < 16) {
                throw IOError("JP2拡張ボックス長が途中で切れています");
            }
            length = read_be64(data.data() + offset + 8);
            header_size = 16;
        } else if (length == 0) {
            // ファイル末尾まで
            length = data.size() - offset;
        }

        if (length < header_size || length > data.size() - offset) {
            std::stringstream ss;
            ss << "JP2ボックス '" << std::string_view(box.type.data(), 4)
               << "' の長さが不正です: " << length;
            throw IOError(ss.str());
        }

        box.payload = data.subspan(offset + header_size, static_cast<size_t>(length) - header_size);
        boxes.push_back(box);
        offset += static_cast<size_t>(length);
    }

    return boxes;
}

auto read_jp2_georeference(const std::filesystem::path& path) -> GeoReference {
    if (!std::filesystem::exists(path)) {
        std::stringstream ss;
        ss << "ファイルが見つかりません: " << path.string();
        throw IOError(ss.str());
    }

    MemoryMappedFile file(path);
    if (!file.is_open()) {
        std::stringstream ss;
        ss << "ファイルを開けません: " << path.string();
        throw IOError(ss.str());
    }

    auto boxes = parse_jp2_boxes(file.bytes());

    // 先頭は署名ボックスでなければならない
    if (boxes.empty() || !boxes.front().is("jP  ") || boxes.front().payload.size() != 4 ||
        read_be32(boxes.front().payload.data()) != JP2_SIGNATURE) {
        std::stringstream ss;
        ss << "JP2ファイルではありません: " << path.string();
        throw IOError(ss.str());
    }

    auto header = find_image_header(boxes);
    if (!header || header->width == 0 || header->height == 0) {
        std::stringstream ss;
        ss << "ihdrボックスが見つかりません: " << path.string();
        throw IOError(ss.str());
    }

    auto geotiff = find_geojp2(boxes);
    if (!geotiff) {
        std::stringstream ss;
        ss << "GeoJP2の地理参照がありません: " << path.string();
        throw IOError(ss.str());
    }

    GeoReference reference = read_georeference_from_memory(*geotiff);
    reference.width = static_cast<int>(header->width);
    reference.height = static_cast<int>(header->height);
    return reference;
}

}  // namespace cbers_tiler
