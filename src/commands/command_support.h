#pragma once

#include "core/batch.h"
#include "core/frame_thin.h"
#include "core/grid_extract.h"
#include "core/matte_clean.h"
#include "core/profile_config.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace hexprep::commands {

// Options shared by every tool. Values given on the command line are kept in
// `overrides` so they can be layered over a profile.
struct CommonArgs {
    std::string profile_name;
    std::string profiles_config;
    bool verbose = false;
    std::vector<std::string> positionals;
    core::ProfileDefinition overrides;
};

// Effective settings once command line, profile and defaults are merged.
struct ResolvedSettings {
    core::GridOptions grid;
    core::MatteOptions matte;
    int shrink = core::k_default_shrink_pixels;
    unsigned int threads = 0;
    bool backup = true;
    bool clean = false;
};

enum class ArgMatch { Consumed, NotMatched, Invalid };

// Handles the shared flags and positional arguments at argv[i]; advances `i`
// past any consumed value.
ArgMatch parse_common_arg(int argc, char** argv, int& i, CommonArgs& args, std::string& error);

// --white-threshold, --tolerance, --mode, --strict-threshold.
ArgMatch parse_matte_arg(int argc, char** argv, int& i, core::ProfileDefinition& overrides, std::string& error);

// Reads the value following a flag. Fails when the flag is the last token.
bool take_value(int argc, char** argv, int& i, std::string& out);

// Resolves --profile, if any. Leaves `out` empty when no profile was requested.
bool load_requested_profile(const CommonArgs& args,
                            const char* argv0,
                            std::optional<core::ProfileDefinition>& out,
                            std::string& error);

// Command line wins over the profile, the profile over built-in defaults.
ResolvedSettings resolve_settings(const core::ProfileDefinition& cli,
                                  const std::optional<core::ProfileDefinition>& profile);

// Splits positionals into SOURCE and optional OUTPUT_DIR.
bool resolve_paths(const CommonArgs& args,
                   std::filesystem::path& source,
                   std::filesystem::path& output_dir,
                   std::string& error);

void print_summary(const core::BatchSummary& summary, size_t input_count);

int run_hexsplit(int argc, char** argv);
int run_hexclean(int argc, char** argv);
int run_hexthin(int argc, char** argv);

} // namespace hexprep::commands
