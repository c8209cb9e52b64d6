#pragma once

#include "matte_clean.h"

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#ifndef HEXPREP_GLOBAL_PROFILE_CONFIG
#define HEXPREP_GLOBAL_PROFILE_CONFIG "/usr/local/share/hexprep/hexprep.cfg"
#endif

namespace hexprep::core {

constexpr const char* k_profiles_config_filename = "hexprep.cfg";
constexpr const char* k_user_profiles_config_relpath = ".config/hexprep/hexprep.cfg";
constexpr const char* k_global_profiles_config_path = HEXPREP_GLOBAL_PROFILE_CONFIG;

struct ProfileDefinition {
    std::string name;
    std::optional<int> cols;
    std::optional<int> rows;
    std::optional<int> alpha_threshold;
    std::optional<int> white_threshold;
    std::optional<int> tolerance;
    std::optional<MatteMode> mode;
    std::optional<int> strict_threshold;
    std::optional<int> shrink;
    std::optional<unsigned int> threads;
    std::optional<bool> backup;
    std::optional<bool> clean;
};

bool parse_profiles_config(std::istream& input, std::vector<ProfileDefinition>& out, std::string& error);
bool load_profiles_config_from_file(const std::filesystem::path& path,
                                    std::vector<ProfileDefinition>& out,
                                    std::string& error);

std::optional<std::filesystem::path> resolve_user_profiles_config_path();

// Files tried, in order, when a profile is requested. An explicit path is the only candidate.
std::vector<std::filesystem::path> profile_config_candidates(const std::string& explicit_path,
                                                             const std::filesystem::path& exec_dir);

// Loads the first existing candidate and returns the named profile.
bool resolve_profile(const std::string& name,
                     const std::vector<std::filesystem::path>& candidates,
                     ProfileDefinition& out,
                     std::string& error);

} // namespace hexprep::core
