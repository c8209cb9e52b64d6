#include "command_support.h"
#include "core/batch.h"
#include "core/image_io.h"
#include "core/matte_clean.h"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace hexprep::commands {

namespace {

using core::BatchSummary;
using core::FileOutcome;
using core::LoadStatus;
using core::RasterBuffer;
using core::ResultWriter;
using core::SyncLog;

void print_usage() {
    std::cout << "Usage: hexclean [OPTIONS] SOURCE [OUTPUT_DIR]\n"
              << "\n"
              << "Make the white matte of hex tiles transparent, crop to content and pad by "
              << core::k_matte_padding << " pixels.\n"
              << "SOURCE is a PNG file or a directory of PNG files. Without OUTPUT_DIR the\n"
              << "sources are overwritten after a {stem}_backup.png copy is made.\n"
              << "\n"
              << "Options:\n"
              << "  --white-threshold N    Brightness treated as white (0-255, default: "
              << core::k_default_white_threshold << ")\n"
              << "  --tolerance N          Per-channel slack below the threshold (default: "
              << core::k_default_white_tolerance << ")\n"
              << "  --mode MODE            standard or strict (default: standard)\n"
              << "  --strict-threshold N   Channel floor for strict mode (default: "
              << core::k_default_strict_white_threshold << ")\n"
              << "  --no-backup            Overwrite sources without a backup copy\n"
              << "  --profile NAME         Load defaults from a profile in hexprep.cfg\n"
              << "  --profiles-config PATH Profile file to use instead of the search path\n"
              << "  --threads N            Number of worker threads\n"
              << "  --verbose, -v          Print per-file details\n"
              << "  --help, -h             Show this help message\n";
}

} // namespace

int run_hexclean(int argc, char** argv) {
    CommonArgs common;

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

        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
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
    const core::MatteOptions& options = settings.matte;

    std::vector<fs::path> inputs;
    if (!core::collect_input_images(source, inputs, error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }
    if (!core::ensure_directory(output_dir, error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }

    SyncLog log(std::cout, std::cerr, common.verbose);
    log.info("hexclean: " + std::to_string(inputs.size()) + " file(s), mode " + core::matte_mode_name(options.mode)
             + ", white threshold " + std::to_string(options.white_threshold)
             + ", tolerance " + std::to_string(options.tolerance)
             + ", strict threshold " + std::to_string(options.strict_white_threshold)
             + (settings.backup ? "" : ", no backup"));

    auto job = [&](const fs::path& input, std::string& job_error) -> FileOutcome {
        RasterBuffer raster;
        const LoadStatus status = core::load_image(input, raster, job_error);
        if (status != LoadStatus::Ok) {
            job_error = std::string(core::load_status_name(status)) + ": " + job_error;
            return FileOutcome::Failed;
        }

        core::MatteResult result = core::clean_matte(raster, options);
        ResultWriter writer(input, core::resolve_output_path(input, output_dir), settings.backup);
        if (result.empty) {
            log.warning(input.string() + ": nothing left after matte removal, keeping the original");
            if (writer.in_place()) {
                return FileOutcome::Empty;
            }
        }

        if (!writer.prepare(job_error) || !writer.commit(result.raster, job_error)) {
            return FileOutcome::Failed;
        }
        if (writer.backup_created()) {
            log.info("  backup " + writer.backup_path().string());
        }
        log.info(input.string() + ": " + std::to_string(raster.width()) + "x" + std::to_string(raster.height())
                 + " -> " + std::to_string(result.raster.width()) + "x" + std::to_string(result.raster.height())
                 + " " + writer.destination().string());
        return result.empty ? FileOutcome::Empty : FileOutcome::Done;
    };

    const BatchSummary summary = core::run_batch(inputs, settings.threads, job, log);
    print_summary(summary, inputs.size());
    return summary.failed > 0 ? 1 : 0;
}

} // namespace hexprep::commands
