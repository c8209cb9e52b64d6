#include "command_support.h"
#include "core/batch.h"
#include "core/cli_parse.h"
#include "core/frame_thin.h"
#include "core/image_io.h"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace hexprep::commands {

namespace {

void print_usage() {
    std::cout << "Usage: hexthin [OPTIONS] SOURCE [OUTPUT_DIR]\n"
              << "\n"
              << "Pull the outer frame of hex tiles inward so borders look thinner.\n"
              << "SOURCE is a PNG file or a directory of PNG files. Without OUTPUT_DIR the\n"
              << "sources are overwritten after a {stem}_backup.png copy is made.\n"
              << "\n"
              << "Options:\n"
              << "  --shrink N             Frame band width in pixels (default: "
              << core::k_default_shrink_pixels << ")\n"
              << "  --no-backup            Overwrite sources without a backup copy\n"
              << "  --profile NAME         Load defaults from a profile in hexprep.cfg\n"
              << "  --profiles-config PATH Profile file to use instead of the search path\n"
              << "  --threads N            Number of worker threads\n"
              << "  --verbose, -v          Print per-file details\n"
              << "  --help, -h             Show this help message\n";
}

} // namespace

int run_hexthin(int argc, char** argv) {
    CommonArgs common;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        std::string error;
        const ArgMatch common_match = parse_common_arg(argc, argv, i, common, error);
        if (common_match == ArgMatch::Consumed) {
            continue;
        }
        if (common_match == ArgMatch::Invalid) {
            std::cerr << "Error: " << error << "\n";
            return 1;
        }

        std::string value;
        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg == "--shrink") {
            int shrink = 0;
            if (!take_value(argc, argv, i, value) || !core::parse_non_negative_int(value, shrink)) {
                std::cerr << "Error: invalid shrink: " << value << "\n";
                return 1;
            }
            common.overrides.shrink = shrink;
        } else if (arg == "--no-backup") {
            common.overrides.backup = false;
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

    std::optional<core::ProfileDefinition> profile;
    if (!load_requested_profile(common, argc > 0 ? argv[0] : nullptr, profile, error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }
    const ResolvedSettings settings = resolve_settings(common.overrides, profile);

    std::vector<fs::path> inputs;
    if (!core::collect_input_images(source, inputs, error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }
    if (!core::ensure_directory(output_dir, error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }

    core::SyncLog log(std::cout, std::cerr, common.verbose);
    log.info("hexthin: " + std::to_string(inputs.size()) + " file(s), shrink " + std::to_string(settings.shrink)
             + (settings.backup ? "" : ", no backup"));

    auto job = [&](const fs::path& input, std::string& job_error) -> core::FileOutcome {
        core::RasterBuffer raster;
        const core::LoadStatus status = core::load_image(input, raster, job_error);
        if (status != core::LoadStatus::Ok) {
            job_error = std::string(core::load_status_name(status)) + ": " + job_error;
            return core::FileOutcome::Failed;
        }

        const core::RasterBuffer thinned = core::thin_frame(raster, settings.shrink);
        core::ResultWriter writer(input, core::resolve_output_path(input, output_dir), settings.backup);
        if (!writer.prepare(job_error) || !writer.commit(thinned, job_error)) {
            return core::FileOutcome::Failed;
        }
        if (writer.backup_created()) {
            log.info("  backup " + writer.backup_path().string());
        }
        log.info(input.string() + ": " + std::to_string(raster.width()) + "x" + std::to_string(raster.height())
                 + " -> " + writer.destination().string());
        return core::FileOutcome::Done;
    };

    const core::BatchSummary summary = core::run_batch(inputs, settings.threads, job, log);
    print_summary(summary, inputs.size());
    return summary.failed > 0 ? 1 : 0;
}

} // namespace hexprep::commands
