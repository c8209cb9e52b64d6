#pragma once

#include "raster.h"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace hexprep::core {

constexpr const char* k_backup_suffix = "_backup";
constexpr const char* k_default_tile_prefix = "hex";
constexpr const char* k_tile_extension = "png";

// Serializes console lines written from batch workers.
class SyncLog {
public:
    SyncLog(std::ostream& info, std::ostream& diag, bool verbose)
        : info_(info), diag_(diag), verbose_(verbose) {}

    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

    [[nodiscard]] bool verbose() const { return verbose_; }

private:
    std::mutex mutex_;
    std::ostream& info_;
    std::ostream& diag_;
    bool verbose_ = false;
};

// A single file, or every *.png in a directory sorted by name (backups excluded).
bool collect_input_images(const std::filesystem::path& source,
                          std::vector<std::filesystem::path>& out,
                          std::string& error);

bool is_backup_file(const std::filesystem::path& path);
std::filesystem::path backup_path_for(const std::filesystem::path& source);

// `{prefix}_{index}.{ext}`
std::string tile_filename(const std::string& prefix, int index, const std::string& extension = k_tile_extension);

// Explicit prefix for a single input is used as is; otherwise the source stem is appended.
std::string tile_prefix(const std::string& requested_prefix, const std::filesystem::path& source, bool single_input);

// Destination for a transformed file: the source itself, or the same name inside `output_dir`.
std::filesystem::path resolve_output_path(const std::filesystem::path& source, const std::filesystem::path& output_dir);

bool ensure_directory(const std::filesystem::path& dir, std::string& error);

// Two-step write: prepare() secures the backup of an in-place target, commit()
// writes the result and refuses to run unless prepare() succeeded.
class ResultWriter {
public:
    ResultWriter(std::filesystem::path source, std::filesystem::path destination, bool make_backup);

    bool prepare(std::string& error);
    bool commit(const RasterBuffer& raster, std::string& error);

    [[nodiscard]] bool in_place() const;
    [[nodiscard]] bool backup_created() const { return backup_created_; }
    [[nodiscard]] const std::filesystem::path& destination() const { return destination_; }
    [[nodiscard]] std::filesystem::path backup_path() const { return backup_path_for(source_); }

private:
    std::filesystem::path source_;
    std::filesystem::path destination_;
    bool make_backup_ = true;
    bool prepared_ = false;
    bool backup_created_ = false;
};

enum class FileOutcome { Done, Empty, Failed };

struct BatchSummary {
    size_t processed = 0;
    size_t empty = 0;
    size_t failed = 0;
};

using FileJob = std::function<FileOutcome(const std::filesystem::path&, std::string&)>;

unsigned int resolve_worker_count(unsigned int requested, size_t jobs);

// Runs `job` on every input. A failure is logged and counted; the remaining
// files are still processed.
BatchSummary run_batch(const std::vector<std::filesystem::path>& inputs,
                       unsigned int threads,
                       const FileJob& job,
                       SyncLog& log);

std::filesystem::path executable_dir(const char* argv0);

} // namespace hexprep::core
