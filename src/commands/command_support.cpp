#include "command_support.h"
#include "core/cli_parse.h"

#include <iostream>

namespace fs = std::filesystem;

namespace hexprep::commands {

namespace {

template <typename T>
void layer(T& target, const std::optional<T>& cli, const std::optional<T>& profile) {
    if (cli) {
        target = *cli;
    } else if (profile) {
        target = *profile;
    }
}

ArgMatch channel_flag(int argc, char** argv, int& i, const char* what,
                      std::optional<int>& out, std::string& error) {
    std::string value;
    int parsed = 0;
    if (!take_value(argc, argv, i, value) || !core::parse_channel_value(value, parsed)) {
        error = std::string("invalid ") + what + ": " + value;
        return ArgMatch::Invalid;
    }
    out = parsed;
    return ArgMatch::Consumed;
}

} // namespace

bool take_value(int argc, char** argv, int& i, std::string& out) {
    if (i + 1 >= argc) {
        return false;
    }
    out = argv[++i];
    return true;
}

ArgMatch parse_common_arg(int argc, char** argv, int& i, CommonArgs& args, std::string& error) {
    const std::string arg = argv[i];
    std::string value;
    if (arg == "--profile") {
        if (!take_value(argc, argv, i, value) || value.empty()) {
            error = "--profile requires a name";
            return ArgMatch::Invalid;
        }
        args.profile_name = value;
    } else if (arg == "--profiles-config") {
        if (!take_value(argc, argv, i, value) || value.empty()) {
            error = "--profiles-config requires a path";
            return ArgMatch::Invalid;
        }
        args.profiles_config = value;
    } else if (arg == "--threads") {
        unsigned int threads = 0;
        if (!take_value(argc, argv, i, value) || !core::parse_positive_uint(value, threads)) {
            error = "invalid thread count: " + value;
            return ArgMatch::Invalid;
        }
        args.overrides.threads = threads;
    } else if (arg == "--verbose" || arg == "-v") {
        args.verbose = true;
    } else if (!arg.empty() && arg.front() != '-') {
        args.positionals.push_back(arg);
    } else {
        return ArgMatch::NotMatched;
    }
    return ArgMatch::Consumed;
}

ArgMatch parse_matte_arg(int argc, char** argv, int& i, core::ProfileDefinition& overrides, std::string& error) {
    const std::string arg = argv[i];
    if (arg == "--white-threshold") {
        return channel_flag(argc, argv, i, "white threshold", overrides.white_threshold, error);
    }
    if (arg == "--tolerance") {
        return channel_flag(argc, argv, i, "tolerance", overrides.tolerance, error);
    }
    if (arg == "--strict-threshold") {
        return channel_flag(argc, argv, i, "strict threshold", overrides.strict_threshold, error);
    }
    if (arg == "--mode") {
        std::string value;
        core::MatteMode mode = core::MatteMode::Standard;
        if (!take_value(argc, argv, i, value)) {
            error = "--mode requires a value";
            return ArgMatch::Invalid;
        }
        if (!core::parse_matte_mode(value, mode, error)) {
            return ArgMatch::Invalid;
        }
        overrides.mode = mode;
        return ArgMatch::Consumed;
    }
    return ArgMatch::NotMatched;
}

bool load_requested_profile(const CommonArgs& args,
                            const char* argv0,
                            std::optional<core::ProfileDefinition>& out,
                            std::string& error) {
    out.reset();
    if (args.profile_name.empty()) {
        if (!args.profiles_config.empty()) {
            std::cerr << "Warning: --profiles-config has no effect without --profile\n";
        }
        return true;
    }
    const std::vector<fs::path> candidates =
        core::profile_config_candidates(args.profiles_config, core::executable_dir(argv0));
    core::ProfileDefinition profile;
    if (!core::resolve_profile(args.profile_name, candidates, profile, error)) {
        return false;
    }
    out = profile;
    return true;
}

ResolvedSettings resolve_settings(const core::ProfileDefinition& cli,
                                  const std::optional<core::ProfileDefinition>& profile) {
    const core::ProfileDefinition base = profile ? *profile : core::ProfileDefinition{};
    ResolvedSettings settings;
    layer(settings.grid.cols, cli.cols, base.cols);
    layer(settings.grid.rows, cli.rows, base.rows);
    layer(settings.grid.content_alpha_threshold, cli.alpha_threshold, base.alpha_threshold);
    layer(settings.matte.mode, cli.mode, base.mode);
    layer(settings.matte.white_threshold, cli.white_threshold, base.white_threshold);
    layer(settings.matte.tolerance, cli.tolerance, base.tolerance);
    layer(settings.matte.strict_white_threshold, cli.strict_threshold, base.strict_threshold);
    layer(settings.shrink, cli.shrink, base.shrink);
    layer(settings.threads, cli.threads, base.threads);
    layer(settings.backup, cli.backup, base.backup);
    layer(settings.clean, cli.clean, base.clean);
    return settings;
}

bool resolve_paths(const CommonArgs& args, fs::path& source, fs::path& output_dir, std::string& error) {
    if (args.positionals.empty()) {
        error = "missing source path";
        return false;
    }
    if (args.positionals.size() > 2) {
        error = "unexpected argument '" + args.positionals[2] + "'";
        return false;
    }
    source = args.positionals[0];
    output_dir = args.positionals.size() == 2 ? fs::path(args.positionals[1]) : fs::path();
    return true;
}

void print_summary(const core::BatchSummary& summary, size_t input_count) {
    if (input_count <= 1) {
        return;
    }
    std::cerr << "processed " << summary.processed
              << ", empty " << summary.empty
              << ", failed " << summary.failed << "\n";
}

} // namespace hexprep::commands
