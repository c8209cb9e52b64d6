#include "profile_config.h"
#include "cli_parse.h"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>
#include <unordered_set>
#include <utility>

namespace fs = std::filesystem;

namespace hexprep::core {

namespace {

std::string at_line(size_t line_number) {
    return " at line " + std::to_string(line_number);
}

bool reject_value(const std::string& key, const std::string& value, size_t line_number, std::string& error) {
    error = "invalid " + key + " '" + value + "'" + at_line(line_number);
    return false;
}

bool apply_profile_entry(ProfileDefinition& profile,
                         const std::string& key,
                         const std::string& value,
                         size_t line_number,
                         std::string& error) {
    const std::string lower_key = to_lower_copy(key);
    int parsed = 0;
    if (lower_key == "cols" || lower_key == "rows") {
        if (!parse_positive_int(value, parsed)) {
            return reject_value(lower_key, value, line_number, error);
        }
        (lower_key == "cols" ? profile.cols : profile.rows) = parsed;
    } else if (lower_key == "alpha_threshold" || lower_key == "white_threshold"
               || lower_key == "tolerance" || lower_key == "strict_threshold") {
        if (!parse_channel_value(value, parsed)) {
            return reject_value(lower_key, value, line_number, error);
        }
        std::optional<int>& slot = lower_key == "alpha_threshold" ? profile.alpha_threshold
                                   : lower_key == "white_threshold" ? profile.white_threshold
                                   : lower_key == "tolerance"       ? profile.tolerance
                                                                    : profile.strict_threshold;
        slot = parsed;
    } else if (lower_key == "mode") {
        MatteMode mode = MatteMode::Standard;
        if (!parse_matte_mode(value, mode, error)) {
            error += at_line(line_number);
            return false;
        }
        profile.mode = mode;
    } else if (lower_key == "shrink") {
        if (!parse_non_negative_int(value, parsed)) {
            return reject_value(lower_key, value, line_number, error);
        }
        profile.shrink = parsed;
    } else if (lower_key == "threads") {
        unsigned int threads = 0;
        if (!parse_positive_uint(value, threads)) {
            return reject_value(lower_key, value, line_number, error);
        }
        profile.threads = threads;
    } else if (lower_key == "backup" || lower_key == "clean") {
        bool flag = false;
        if (!parse_bool_value(value, flag)) {
            return reject_value(lower_key, value, line_number, error);
        }
        (lower_key == "backup" ? profile.backup : profile.clean) = flag;
    } else {
        error = "unknown key '" + key + "'" + at_line(line_number);
        return false;
    }
    return true;
}

} // namespace

bool parse_profiles_config(std::istream& input, std::vector<ProfileDefinition>& out, std::string& error) {
    out.clear();
    std::unordered_set<std::string> seen_names;
    std::optional<ProfileDefinition> current;
    std::string line;
    size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        std::string trimmed = trim_copy(line);
        if (trimmed.empty() || trimmed.front() == '#' || trimmed.front() == ';') {
            continue;
        }

        if (trimmed.front() == '[' && trimmed.back() == ']') {
            if (current) {
                out.push_back(*current);
                current.reset();
            }
            std::istringstream iss(trimmed.substr(1, trimmed.size() - 2));
            std::string section_type;
            if (!(iss >> section_type)) {
                error = "empty section header" + at_line(line_number);
                return false;
            }
            section_type = to_lower_copy(section_type);
            if (section_type != "profile") {
                error = "unsupported section '" + section_type + "'" + at_line(line_number);
                return false;
            }
            std::string name;
            if (!(iss >> name)) {
                error = "missing profile name" + at_line(line_number);
                return false;
            }
            std::string extra;
            if (iss >> extra) {
                error = "unexpected token '" + extra + "' in profile header" + at_line(line_number);
                return false;
            }
            if (!seen_names.insert(name).second) {
                error = "duplicate profile '" + name + "'" + at_line(line_number);
                return false;
            }
            ProfileDefinition def;
            def.name = name;
            current = def;
            continue;
        }

        if (!current) {
            error = "entry outside of profile section" + at_line(line_number);
            return false;
        }

        size_t equals = trimmed.find('=');
        if (equals == std::string::npos) {
            error = "invalid line '" + trimmed + "'" + at_line(line_number);
            return false;
        }
        std::string key = trim_copy(trimmed.substr(0, equals));
        std::string value = trim_copy(trimmed.substr(equals + 1));
        if (key.empty()) {
            error = "empty key" + at_line(line_number);
            return false;
        }
        if (value.empty()) {
            error = "empty value for key '" + key + "'" + at_line(line_number);
            return false;
        }
        if (!apply_profile_entry(*current, key, value, line_number, error)) {
            return false;
        }
    }

    if (current) {
        out.push_back(*current);
    }

    if (out.empty()) {
        error = "no profiles defined";
        return false;
    }
    return true;
}

bool load_profiles_config_from_file(const fs::path& path,
                                    std::vector<ProfileDefinition>& out,
                                    std::string& error) {
    std::ifstream input(path);
    if (!input) {
        error = "failed to open '" + path.string() + "'";
        return false;
    }
    return parse_profiles_config(input, out, error);
}

std::optional<fs::path> resolve_user_profiles_config_path() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0') {
        return std::nullopt;
    }
    return fs::path(home) / k_user_profiles_config_relpath;
}

std::vector<fs::path> profile_config_candidates(const std::string& explicit_path, const fs::path& exec_dir) {
    std::vector<fs::path> candidates;
    std::error_code ec;
    const fs::path cwd = fs::current_path(ec);
    if (!explicit_path.empty()) {
        fs::path candidate(explicit_path);
        if (candidate.is_relative() && !cwd.empty()) {
            candidate = cwd / candidate;
        }
        candidates.push_back(std::move(candidate));
        return candidates;
    }

    if (std::optional<fs::path> user_config = resolve_user_profiles_config_path()) {
        candidates.push_back(*user_config);
    }
    candidates.push_back(exec_dir / k_profiles_config_filename);
    candidates.push_back(fs::path(k_global_profiles_config_path));
    return candidates;
}

bool resolve_profile(const std::string& name,
                     const std::vector<fs::path>& candidates,
                     ProfileDefinition& out,
                     std::string& error) {
    std::vector<ProfileDefinition> definitions;
    bool loaded = false;
    std::string tried;
    for (const fs::path& candidate : candidates) {
        std::error_code ec;
        const bool exists = fs::exists(candidate, ec);
        if (ec || !exists) {
            tried += " " + candidate.string();
            continue;
        }
        std::string config_error;
        if (!load_profiles_config_from_file(candidate, definitions, config_error)) {
            error = "failed to load profile config (" + candidate.string() + "): " + config_error;
            return false;
        }
        loaded = true;
        break;
    }

    if (!loaded) {
        error = "failed to load profile config. Tried:" + tried;
        return false;
    }

    for (const auto& def : definitions) {
        if (def.name == name) {
            out = def;
            return true;
        }
    }

    std::string available;
    for (size_t idx = 0; idx < definitions.size(); ++idx) {
        if (idx > 0) {
            available += ", ";
        }
        available += definitions[idx].name;
    }
    error = "invalid profile '" + name + "'. Available profiles: " + available;
    return false;
}

} // namespace hexprep::core
