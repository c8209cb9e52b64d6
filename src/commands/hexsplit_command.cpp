#include "command_support.h"
#include "core/batch.h"
#include "core/cli_parse.h"
#include "core/grid_extract.h"
#include "core/image_io.h"
#include "core/matte_clean.h"
#include "core/tar_stream.h"

#include <cstdint>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#ifdef _WIN32
#include <fcntl.h>
#include <io.h>
#include <stdio.h>
#endif

namespace fs = std::filesystem;

namespace hexprep::commands {

namespace {

using core::FileOutcome;
using core::GridTile;

constexpr const char* k_default_split_output_dir = "extracted_hexes";

struct EncodedTile {
    std::string name;
    std::vector<std::uint8_t> bytes;
};

void print_usage() {
    std::cout << "Usage: hexsplit [OPTIONS] SOURCE [OUTPUT_DIR]\n"
              << "\n"
              << "Split grid sheets of hex tiles into one PNG per non-empty cell, cropped to content.\n"
              << "SOURCE is a PNG file or a directory of PNG files. Tiles are written to OUTPUT_DIR\n"
              << "(default: " << k_default_split_output_dir << "), or to stdout as a tar archive with --tar.\n"
              << "\n"
              << "Options:\n"
              << "  --cols N               Grid columns (default: " << core::k_default_grid_cols << ")\n"
              << "  --rows N               Grid rows (default: " << core::k_default_grid_rows << ")\n"
              << "  --alpha-threshold N    Alpha above which a pixel is content (0-255, default: "
              << core::k_default_content_alpha_threshold << ")\n"
              << "  --prefix P             Tile name prefix (default: " << core::k_default_tile_prefix
              << "_{source stem})\n"
              << "  --clean                Run the matte cleaner on every tile; tiles left empty are dropped\n"
              << "  --white-threshold N    Cleaner white threshold (default: "
              << core::k_default_white_threshold << ")\n"
              << "  --tolerance N          Cleaner tolerance (default: " << core::k_default_white_tolerance << ")\n"
              << "  --mode MODE            Cleaner mode, standard or strict (default: standard)\n"
              << "  --strict-threshold N   Cleaner strict-mode floor (default: "
              << core::k_default_strict_white_threshold << ")\n"
              << "  --tar                  Write the tiles to stdout as a tar archive\n"
              << "  --force, -f            Overwrite existing tile files\n"
              << "  --profile NAME         Load defaults from a profile in hexprep.cfg\n"
              << "  --profiles-config PATH Profile file to use instead of the search path\n"
              << "  --threads N            Number of worker threads\n"
              << "  --verbose, -v          Print per-tile details\n"
              << "  --help, -h             Show this help message\n";
}

} // namespace

int run_hexsplit(int argc, char** argv) {
    CommonArgs common;
    std::string requested_prefix;
    bool force = false;
    bool tar_mode = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        std::string error;
        ArgMatch match = parse_common_arg(argc, argv, i, common, error);
        if (match == ArgMatch::NotMatched) {
            match = parse_matte_arg(argc, argv, i, common.overrides, error);
        }
        if (match == ArgMatch::Consumed) {
            continue;
        }
        if (match == ArgMatch::Invalid) {
            std::cerr << "Error: " << error << "\n";
            return 1;
        }

        std::string value;
        int parsed = 0;
        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg == "--cols" || arg == "--rows") {
            if (!take_value(argc, argv, i, value) || !core::parse_positive_int(value, parsed)) {
                std::cerr << "Error: invalid " << (arg == "--cols" ? "column" : "row") << " count: " << value << "\n";
                return 1;
            }
            (arg == "--cols" ? common.overrides.cols : common.overrides.rows) = parsed;
        } else if (arg == "--alpha-threshold") {
            if (!take_value(argc, argv, i, value) || !core::parse_channel_value(value, parsed)) {
                std::cerr << "Error: invalid alpha threshold: " << value << "\n";
                return 1;
            }
            common.overrides.alpha_threshold = parsed;
        } else if (arg == "--prefix") {
            if (!take_value(argc, argv, i, requested_prefix) || requested_prefix.empty()) {
                std::cerr << "Error: --prefix requires a value\n";
                return 1;
            }
        } else if (arg == "--clean") {
            common.overrides.clean = true;
        } else if (arg == "--tar") {
            tar_mode = true;
        } else if (arg == "--force" || arg == "-f") {
            force = true;
        } else {
            std::cerr << "Error: unknown option: " << arg << "\n";
            print_usage();
            return 1;
        }
    }

    fs::path source;
    fs::path output_dir;
    std::string error;
    if (!resolve_paths(common, source, output_dir, error)) {
        std::cerr << "Error: " << error << "\n";
        print_usage();
        return 1;
    }
    if (tar_mode && !output_dir.empty()) {
        std::cerr << "Error: --tar writes to stdout and takes no OUTPUT_DIR\n";
        return 1;
    }
    if (!tar_mode && output_dir.empty()) {
        output_dir = k_default_split_output_dir;
    }

    std::optional<core::ProfileDefinition> profile;
    if (!load_requested_profile(common, argc > 0 ? argv[0] : nullptr, profile, error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }
    const ResolvedSettings settings = resolve_settings(common.overrides, profile);
    const core::GridOptions& grid = settings.grid;

    std::vector<fs::path> inputs;
    if (!core::collect_input_images(source, inputs, error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }
    if (!tar_mode && !core::ensure_directory(output_dir, error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }
    const bool single_input = inputs.size() == 1;

    // stdout carries the archive in tar mode.
    core::SyncLog log(tar_mode ? std::cerr : std::cout, std::cerr, common.verbose);
    log.info("hexsplit: " + std::to_string(inputs.size()) + " file(s), grid " + std::to_string(grid.cols) + "x"
             + std::to_string(grid.rows) + ", alpha threshold " + std::to_string(grid.content_alpha_threshold)
             + (settings.clean ? std::string(", clean ") + core::matte_mode_name(settings.matte.mode) : std::string())
             + (tar_mode ? ", tar to stdout" : ", output " + output_dir.string()));

    std::mutex archived_mutex;
    std::map<fs::path, std::vector<EncodedTile>> archived;

    auto job = [&](const fs::path& input, std::string& job_error) -> FileOutcome {
        core::RasterBuffer raster;
        const core::LoadStatus status = core::load_image(input, raster, job_error);
        if (status != core::LoadStatus::Ok) {
            job_error = std::string(core::load_status_name(status)) + ": " + job_error;
            return FileOutcome::Failed;
        }

        std::vector<GridTile> tiles = core::extract_grid_tiles(raster, grid);
        if (tiles.empty()) {
            log.warning(input.string() + ": no content above alpha threshold "
                        + std::to_string(grid.content_alpha_threshold));
            return FileOutcome::Empty;
        }
        log.info(input.string() + ": " + std::to_string(raster.width()) + "x" + std::to_string(raster.height())
                 + ", " + std::to_string(tiles.size()) + " tile(s)");

        const std::string prefix = core::tile_prefix(requested_prefix, input, single_input);
        std::vector<EncodedTile> encoded;
        size_t kept = 0;
        for (GridTile& tile : tiles) {
            const std::string name = core::tile_filename(prefix, tile.index);
            if (settings.clean) {
                core::MatteResult cleaned = core::clean_matte(tile.raster, settings.matte);
                if (cleaned.empty) {
                    log.warning(input.string() + ": tile " + std::to_string(tile.index)
                                + " is only matte, skipping " + name);
                    continue;
                }
                tile.raster = std::move(cleaned.raster);
            }
            ++kept;

            log.info("  " + name + " row " + std::to_string(tile.row) + " col " + std::to_string(tile.col)
                     + " at " + std::to_string(tile.source.x_min) + "," + std::to_string(tile.source.y_min)
                     + " size " + std::to_string(tile.raster.width()) + "x" + std::to_string(tile.raster.height()));

            if (tar_mode) {
                EncodedTile entry;
                entry.name = name;
                if (!core::encode_png(tile.raster, entry.bytes, job_error)) {
                    return FileOutcome::Failed;
                }
                encoded.push_back(std::move(entry));
                continue;
            }

            const fs::path target = output_dir / name;
            std::error_code ec;
            if (!force && fs::exists(target, ec)) {
                log.warning(target.string() + " already exists, skipping (use --force to overwrite)");
                continue;
            }
            if (!core::write_png(target, tile.raster, job_error)) {
                return FileOutcome::Failed;
            }
        }

        if (tar_mode) {
            std::scoped_lock lock(archived_mutex);
            archived[input] = std::move(encoded);
        }
        return kept > 0 ? FileOutcome::Done : FileOutcome::Empty;
    };

    const core::BatchSummary summary = core::run_batch(inputs, settings.threads, job, log);

    if (tar_mode) {
#ifdef _WIN32
        if (_setmode(_fileno(stdout), _O_BINARY) == -1) {
            std::cerr << "Error: failed to set stdout to binary mode\n";
            return 1;
        }
#endif
        core::TarStream tar;
        if (!tar.open(error)) {
            std::cerr << "Error: " << error << "\n";
            return 1;
        }
        for (const fs::path& input : inputs) {
            auto it = archived.find(input);
            if (it == archived.end()) {
                continue;
            }
            for (const EncodedTile& entry : it->second) {
                if (!tar.add_file(entry.name, entry.bytes, error)) {
                    std::cerr << "Error: " << error << "\n";
                    return 1;
                }
            }
        }
        if (!tar.finish(std::cout, error)) {
            std::cerr << "Error: " << error << "\n";
            return 1;
        }
    }

    print_summary(summary, inputs.size());
    return summary.failed > 0 ? 1 : 0;
}

} // namespace hexprep::commands
