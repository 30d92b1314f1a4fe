#include "test_fixtures.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string_view>
#include <system_error>

#include "jp2_header.hpp"
#include "scene_id.hpp"

namespace cbers_tiler::testing {

namespace {

void append_be32(std::vector<std::byte>& out, uint32_t value) {
    out.push_back(static_cast<std::byte>((value >> 24) & 0xFF));
    out.push_back(static_cast<std::byte>((value >> 16) & 0xFF));
    out.push_back(static_cast<std::byte>((value >> 8) & 0xFF));
    out.push_back(static_cast<std::byte>(value & 0xFF));
}

void append_text(std::vector<std::byte>& out, std::string_view text) {
    for (char c : text) {
        out.push_back(static_cast<std::byte>(c));
    }
}

void append_box(std::vector<std::byte>& out, std::string_view type,
                const std::vector<std::byte>& payload) {
    append_be32(out, static_cast<uint32_t>(payload.size() + 8));
    append_text(out, type);
    out.insert(out.end(), payload.begin(), payload.end());
}

std::vector<std::byte> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    std::vector<char> chars((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());
    std::vector<std::byte> bytes(chars.size());
    for (size_t i = 0; i < chars.size(); ++i) {
        bytes[i] = static_cast<std::byte>(chars[i]);
    }
    return bytes;
}

}  // namespace

TempDir::TempDir() {
    static std::atomic<int> counter{0};
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = std::filesystem::temp_directory_path() /
            ("cbers_tiler_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
    std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

auto geographic_reference(const GeographicBounds& bounds, int size, std::optional<double> nodata)
    -> GeoReference {
    GeoReference reference;
    reference.geo_transform = {bounds.west, (bounds.east - bounds.west) / size, 0.0,
                               bounds.north, 0.0, -(bounds.north - bounds.south) / size};
    reference.crs = "EPSG:4326";
    reference.width = size;
    reference.height = size;
    reference.nodata = nodata;
    return reference;
}

auto projected_reference(const ProjectedBounds& bounds, const std::string& crs, int size,
                         std::optional<double> nodata) -> GeoReference {
    GeoReference reference;
    reference.geo_transform = {bounds.min_x, bounds.width() / size, 0.0,
                               bounds.max_y, 0.0, -bounds.height() / size};
    reference.crs = crs;
    reference.width = size;
    reference.height = size;
    reference.nodata = nodata;
    return reference;
}

void write_band(const std::filesystem::path& path, const GeoReference& reference,
                const std::function<float(size_t, size_t)>& value) {
    const auto size = static_cast<size_t>(reference.width);
    FlatArray2D<float> plane(size, size);
    for (size_t row = 0; row < size; ++row) {
        for (size_t col = 0; col < size; ++col) {
            plane(row, col) = value(row, col);
        }
    }

    std::vector<FlatArray2D<float>> planes;
    planes.push_back(std::move(plane));
    TileImage image({"1"}, std::move(planes));

    std::filesystem::create_directories(path.parent_path());
    std::error_code ec;
    if (!write_geotiff(path, image, reference, ec)) {
        throw std::runtime_error("fixture write failed: " + path.string() + ": " + ec.message());
    }
}

void write_constant_band(const std::filesystem::path& path, const GeoReference& reference,
                         float value) {
    write_band(path, reference, [value](size_t, size_t) { return value; });
}

void write_geojp2(const std::filesystem::path& path, const GeoReference& reference) {
    // 縮退GeoTIFF: 1x1画素で地理参照だけを運ぶ
    auto degenerate_path = path;
    degenerate_path.replace_extension(".geojp2.tif");
    GeoReference degenerate = reference;
    degenerate.width = 1;
    degenerate.height = 1;
    write_constant_band(degenerate_path, degenerate, 0.0F);
    auto tiff_bytes = read_file(degenerate_path);
    std::filesystem::remove(degenerate_path);

    std::vector<std::byte> jp2;

    std::vector<std::byte> signature;
    append_be32(signature, 0x0D0A870A);
    append_box(jp2, "jP  ", signature);

    std::vector<std::byte> ftyp;
    append_text(ftyp, "jp2 ");
    append_be32(ftyp, 0);
    append_text(ftyp, "jp2 ");
    append_box(jp2, "ftyp", ftyp);

    std::vector<std::byte> ihdr;
    append_be32(ihdr, static_cast<uint32_t>(reference.height));
    append_be32(ihdr, static_cast<uint32_t>(reference.width));
    ihdr.push_back(std::byte{0});  // NC
    ihdr.push_back(std::byte{1});
    ihdr.push_back(std::byte{7});  // BPC
    ihdr.push_back(std::byte{7});  // C
    ihdr.push_back(std::byte{0});  // UnkC
    ihdr.push_back(std::byte{0});  // IPR
    std::vector<std::byte> jp2h;
    append_box(jp2h, "ihdr", ihdr);
    append_box(jp2, "jp2h", jp2h);

    std::vector<std::byte> uuid;
    for (uint8_t b : GEOJP2_UUID) {
        uuid.push_back(static_cast<std::byte>(b));
    }
    uuid.insert(uuid.end(), tiff_bytes.begin(), tiff_bytes.end());
    append_box(jp2, "uuid", uuid);

    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(jp2.data()), static_cast<std::streamsize>(jp2.size()));
}

void make_mux_scene(const std::filesystem::path& storage_root,
                    const std::map<std::string, float>& band_values, int size) {
    make_mux_scene(storage_root, band_values, geographic_reference(SCENE_BOUNDS, size));
}

void make_mux_scene(const std::filesystem::path& storage_root,
                    const std::map<std::string, float>& band_values,
                    const GeoReference& reference) {
    SceneAddress address(storage_root, parse_scene_id(SCENE_ID));

    for (const auto& [band, value] : band_values) {
        write_constant_band(address.band(band), reference, value);
    }
    write_geojp2(address.preview(), reference);
}

}  // namespace cbers_tiler::testing
