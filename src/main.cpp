#ifdef _WIN32
#include <windows.h>
#endif

#include <json/json.h>
#include <tbb/parallel_for_each.h>

#include <atomic>
#include <chrono>
#include <cxxopts.hpp>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

#include "errors.hpp"
#include "geotiff.hpp"
#include "mercator.hpp"
#include "scene_tiler.hpp"
#include "stretch.hpp"

namespace fs = std::filesystem;

namespace {

// タイルがシーン範囲外だった場合の終了コード
constexpr int EXIT_TILE_OUTSIDE = 2;

Json::Value bounds_to_json(const cbers_tiler::GeographicBounds &bounds) {
    Json::Value array(Json::arrayValue);
    for (double value : bounds.to_array()) {
        array.append(value);
    }
    return array;
}

void print_json(const Json::Value &value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::cout << Json::writeString(builder, value) << std::endl;
}

// タイルのEPSG:3857上の地理参照
cbers_tiler::GeoReference tile_georeference(const cbers_tiler::mercator::TileAddress &tile,
                                            size_t tilesize, double nodata) {
    auto bounds = cbers_tiler::mercator::xy_bounds(tile);
    double res_x = bounds.width() / static_cast<double>(tilesize);
    double res_y = bounds.height() / static_cast<double>(tilesize);

    cbers_tiler::GeoReference reference;
    reference.geo_transform = {bounds.min_x, res_x, 0.0, bounds.max_y, 0.0, -res_y};
    reference.crs = std::string(cbers_tiler::WEB_MERCATOR);
    reference.width = static_cast<int>(tilesize);
    reference.height = static_cast<int>(tilesize);
    reference.nodata = nodata;
    return reference;
}

struct TileRequest {
    std::string scene_id;
    cbers_tiler::BandList bands;
    size_t tilesize{256};
    bool stretch{false};
    double pmin{2.0};
    double pmax{98.0};
};

// タイルを生成してGeoTIFFに書き込む。範囲外ならTileOutsideBoundsがそのまま伝搬する
void render_tile(cbers_tiler::SceneTiler &tiler, const TileRequest &request,
                 const cbers_tiler::mercator::TileAddress &tile, const fs::path &output) {
    auto image = tiler.tile(request.scene_id, tile, request.bands, request.tilesize);
    auto reference = tile_georeference(tile, request.tilesize, tiler.config().nodata);

    if (output.has_parent_path()) {
        fs::create_directories(output.parent_path());
    }

    std::error_code ec;
    if (request.stretch) {
        auto metadata =
            tiler.metadata(request.scene_id, request.pmin, request.pmax, image.bands());
        auto rgb = cbers_tiler::stretch_to_rgb8(image, metadata.statistics, tiler.config().nodata);
        reference.nodata = 0.0;
        if (!cbers_tiler::write_geotiff_rgb8(output, rgb, reference, ec)) {
            throw cbers_tiler::IOError("書き込み失敗 " + output.string() + ": " + ec.message());
        }
        return;
    }

    if (!cbers_tiler::write_geotiff(output, image, reference, ec)) {
        throw cbers_tiler::IOError("書き込み失敗 " + output.string() + ": " + ec.message());
    }
}

int run_tiles(cbers_tiler::SceneTiler &tiler, const TileRequest &request, int zoom,
              const fs::path &output_folder) {
    auto scene = tiler.bounds(request.scene_id);
    auto tiles = cbers_tiler::mercator::tiles_covering(scene.bounds, zoom);
    std::cout << "ズーム " << zoom << " で " << tiles.size() << " 個のタイルを生成中 (リサンプリング: "
              << cbers_tiler::to_string(tiler.config().resampling) << ")...\n";

    std::mutex cout_mutex;  // std::coutを競合状態から保護
    std::atomic<size_t> written{0};
    std::atomic<size_t> skipped{0};
    std::atomic<size_t> failed{0};

    auto start = std::chrono::steady_clock::now();
    tbb::parallel_for_each(tiles, [&](const cbers_tiler::mercator::TileAddress &tile) {
        fs::path output = output_folder / std::to_string(tile.z) / std::to_string(tile.x) /
                          (std::to_string(tile.y) + ".tif");
        try {
            render_tile(tiler, request, tile, output);
            ++written;

            std::lock_guard<std::mutex> lock(cout_mutex);
            std::cout << "出力: " << output.string() << "\n";
        } catch (const cbers_tiler::TileOutsideBounds &) {
            // 外接矩形の角のタイルはシーンと重ならないことがある
            ++skipped;
        } catch (const std::exception &e) {
            ++failed;

            std::lock_guard<std::mutex> lock(cout_mutex);
            std::cerr << "タイル生成エラー " << tile.z << "/" << tile.x << "/" << tile.y << ": "
                      << e.what() << "\n";
        }
    });
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    std::stringstream ss;
    ss << "生成完了: " << written << " 個出力, " << skipped << " 個範囲外, " << failed
       << " 個失敗 (" << elapsed.count() << " ms)";
    std::cout << ss.str() << "\n";
    return failed > 0 ? 1 : 0;
}

}  // namespace

int main(int argc, char *argv[]) {
#ifdef _WIN32
    // Windowsコンソール出力をUTF-8に設定
    SetConsoleOutputCP(CP_UTF8);
#endif

    cxxopts::Options options("cbers_tiler", "CBERS-4シーンからメルカトルタイルと表示用統計値を生成");
    options.positional_help("<bounds|metadata|tile|tiles> <scene_id>");

    options.add_options()("command", "実行するコマンド (bounds, metadata, tile, tiles)",
                          cxxopts::value<std::string>())(
        "scene", "シーンID (例: CBERS_4_MUX_20171121_057_094_L2)", cxxopts::value<std::string>())(
        "r,storage-root", "CBERSバケットをマウントしたディレクトリ",
        cxxopts::value<std::string>()->default_value("cbers-pds"))(
        "b,bands", "バンドIDのカンマ区切り (例: 7,6,5)",
        cxxopts::value<std::string>()->default_value(""))(
        "pmin", "下側パーセンタイル", cxxopts::value<double>()->default_value("2"))(
        "pmax", "上側パーセンタイル", cxxopts::value<double>()->default_value("98"))(
        "z,zoom", "タイルのズームレベル", cxxopts::value<int>()->default_value("10"))(
        "x", "タイルのX", cxxopts::value<int64_t>()->default_value("0"))(
        "y", "タイルのY", cxxopts::value<int64_t>()->default_value("0"))(
        "s,tilesize", "タイルの画素数", cxxopts::value<size_t>()->default_value("256"))(
        "resampling", "リサンプリング方式 (nearest, bilinear, cubic)",
        cxxopts::value<std::string>()->default_value("bilinear"))(
        "stretch", "統計値で8bitに伸張して出力する",
        cxxopts::value<bool>()->default_value("false"))(
        "o,output", "出力ファイル (tile) または出力フォルダ (tiles)",
        cxxopts::value<std::string>()->default_value(""))(
        "metadata-workers", "統計計算の同時実行数", cxxopts::value<size_t>()->default_value("2"))(
        "tile-workers", "タイル生成の同時実行数", cxxopts::value<size_t>()->default_value("3"))(
        "densify", "範囲変換時の辺あたりの補間点数", cxxopts::value<int>()->default_value("21"))(
        "cache-size", "タイルキャッシュの上限件数 (0は無制限)",
        cxxopts::value<size_t>()->default_value("0"))("h,help", "ヘルプを表示する");
    options.parse_positional({"command", "scene"});

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help") || !result.count("command") || !result.count("scene")) {
            std::cout << options.help() << std::endl;
            return 0;
        }

        std::string command = result["command"].as<std::string>();
        std::string scene_id = result["scene"].as<std::string>();

        auto resampling = cbers_tiler::parse_resampling(result["resampling"].as<std::string>());
        if (!resampling) {
            std::cerr << "エラー: 未対応のリサンプリング方式です: "
                      << result["resampling"].as<std::string>() << "\n";
            return 1;
        }

        cbers_tiler::SceneTiler::Config config;
        config.storage_root = fs::path(result["storage-root"].as<std::string>()).lexically_normal();
        config.metadata_workers = result["metadata-workers"].as<size_t>();
        config.tile_workers = result["tile-workers"].as<size_t>();
        config.densify_pts = result["densify"].as<int>();
        config.resampling = *resampling;
        config.cache.tile.capacity = result["cache-size"].as<size_t>();

        cbers_tiler::SceneTiler tiler(config);

        TileRequest request{.scene_id = scene_id,
                            .bands = cbers_tiler::parse_band_list(result["bands"].as<std::string>()),
                            .tilesize = result["tilesize"].as<size_t>(),
                            .stretch = result["stretch"].as<bool>(),
                            .pmin = result["pmin"].as<double>(),
                            .pmax = result["pmax"].as<double>()};

        if (command == "bounds") {
            auto bounds = tiler.bounds(scene_id);
            Json::Value out;
            out["sceneid"] = bounds.sceneid;
            out["bounds"] = bounds_to_json(bounds.bounds);
            print_json(out);
            return 0;
        }

        if (command == "metadata") {
            auto metadata = tiler.metadata(scene_id, request.pmin, request.pmax, request.bands);
            Json::Value minmax(Json::objectValue);
            for (const auto &[band, cut] : metadata.statistics) {
                Json::Value pair(Json::arrayValue);
                pair.append(cut.min);
                pair.append(cut.max);
                minmax[band] = pair;
            }
            Json::Value out;
            out["sceneid"] = metadata.sceneid;
            out["bounds"] = bounds_to_json(metadata.bounds);
            out["rgbMinMax"] = minmax;
            print_json(out);
            return 0;
        }

        if (command == "tile") {
            cbers_tiler::mercator::TileAddress tile{result["x"].as<int64_t>(),
                                                    result["y"].as<int64_t>(),
                                                    result["zoom"].as<int>()};
            fs::path output = result["output"].as<std::string>();
            if (output.empty()) {
                std::stringstream ss;
                ss << scene_id << "_" << tile.z << "-" << tile.x << "-" << tile.y << ".tif";
                output = ss.str();
            }

            try {
                render_tile(tiler, request, tile, output);
            } catch (const cbers_tiler::TileOutsideBounds &e) {
                std::cout << "範囲外: " << e.what() << "\n";
                return EXIT_TILE_OUTSIDE;
            }
            std::cout << "出力先: " << output.string() << "\n";
            return 0;
        }

        if (command == "tiles") {
            fs::path output_folder = result["output"].as<std::string>();
            if (output_folder.empty()) {
                output_folder = "./output";
            }
            output_folder = output_folder.lexically_normal();
            fs::create_directories(output_folder);
            return run_tiles(tiler, request, result["zoom"].as<int>(), output_folder);
        }

        std::cerr << "エラー: 不明なコマンドです: " << command << "\n";
        std::cout << options.help() << std::endl;
        return 1;

    } catch (const cxxopts::exceptions::exception &e) {
        std::cerr << "オプション解析エラー: " << e.what() << std::endl;
        return 1;
    } catch (const cbers_tiler::ParseError &e) {
        std::cerr << "シーンIDエラー: " << e.what() << std::endl;
        return 1;
    } catch (const cbers_tiler::IOError &e) {
        std::cerr << "読み込みエラー: " << e.what() << std::endl;
        return 1;
    } catch (const std::invalid_argument &e) {
        std::cerr << "引数エラー: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "エラー: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
