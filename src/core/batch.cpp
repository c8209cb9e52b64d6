#include "batch.h"
#include "cli_parse.h"
#include "image_io.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <system_error>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

namespace hexprep::core {

void SyncLog::info(const std::string& message) {
    if (!verbose_) {
        return;
    }
    std::scoped_lock lock(mutex_);
    info_ << message << "\n";
}

void SyncLog::warning(const std::string& message) {
    std::scoped_lock lock(mutex_);
    diag_ << "Warning: " << message << "\n";
}

void SyncLog::error(const std::string& message) {
    std::scoped_lock lock(mutex_);
    diag_ << "Error: " << message << "\n";
}

bool is_backup_file(const fs::path& path) {
    const std::string stem = path.stem().string();
    const std::string suffix = k_backup_suffix;
    return stem.size() > suffix.size() && stem.ends_with(suffix);
}

fs::path backup_path_for(const fs::path& source) {
    return source.parent_path() / (source.stem().string() + k_backup_suffix + source.extension().string());
}

bool collect_input_images(const fs::path& source, std::vector<fs::path>& out, std::string& error) {
    out.clear();
    std::error_code ec;
    if (fs::is_regular_file(source, ec)) {
        out.push_back(source);
        return true;
    }
    if (!fs::is_directory(source, ec)) {
        error = "input path does not exist or is not a file or directory: " + source.string();
        return false;
    }

    fs::directory_iterator it(source, ec);
    if (ec) {
        error = "failed to read directory '" + source.string() + "': " + ec.message();
        return false;
    }
    for (const fs::directory_entry& entry : it) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec) || entry_ec) {
            continue;
        }
        const fs::path& path = entry.path();
        if (to_lower_copy(path.extension().string()) != ".png" || is_backup_file(path)) {
            continue;
        }
        out.push_back(path);
    }
    std::ranges::sort(out);

    if (out.empty()) {
        error = "no PNG files found in " + source.string();
        return false;
    }
    return true;
}

std::string tile_filename(const std::string& prefix, int index, const std::string& extension) {
    return prefix + "_" + std::to_string(index) + "." + extension;
}

std::string tile_prefix(const std::string& requested_prefix, const fs::path& source, bool single_input) {
    if (!requested_prefix.empty() && single_input) {
        return requested_prefix;
    }
    const std::string base = requested_prefix.empty() ? std::string(k_default_tile_prefix) : requested_prefix;
    return base + "_" + source.stem().string();
}

fs::path resolve_output_path(const fs::path& source, const fs::path& output_dir) {
    if (output_dir.empty()) {
        return source;
    }
    return output_dir / source.filename();
}

bool ensure_directory(const fs::path& dir, std::string& error) {
    if (dir.empty()) {
        return true;
    }
    std::error_code ec;
    if (fs::is_directory(dir, ec)) {
        return true;
    }
    fs::create_directories(dir, ec);
    if (ec) {
        error = "failed to create output directory '" + dir.string() + "': " + ec.message();
        return false;
    }
    return true;
}

ResultWriter::ResultWriter(fs::path source, fs::path destination, bool make_backup)
    : source_(std::move(source)), destination_(std::move(destination)), make_backup_(make_backup) {}

bool ResultWriter::in_place() const {
    std::error_code ec;
    if (fs::exists(destination_, ec)) {
        const bool same = fs::equivalent(source_, destination_, ec);
        if (!ec) {
            return same;
        }
    }
    return source_.lexically_normal() == destination_.lexically_normal();
}

bool ResultWriter::prepare(std::string& error) {
    prepared_ = false;
    if (!ensure_directory(destination_.parent_path(), error)) {
        return false;
    }

    if (make_backup_ && in_place()) {
        const fs::path backup = backup_path_for(source_);
        std::error_code ec;
        if (!fs::exists(backup, ec)) {
            fs::copy_file(source_, backup, fs::copy_options::none, ec);
            if (ec) {
                error = "failed to create backup '" + backup.string() + "': " + ec.message();
                return false;
            }
            backup_created_ = true;
        }
    }

    prepared_ = true;
    return true;
}

bool ResultWriter::commit(const RasterBuffer& raster, std::string& error) {
    if (!prepared_) {
        error = "refusing to write '" + destination_.string() + "' before its backup step";
        return false;
    }
    return write_png(destination_, raster, error);
}

unsigned int resolve_worker_count(unsigned int requested, size_t jobs) {
    unsigned int worker_count = requested > 0 ? requested : std::thread::hardware_concurrency();
    if (worker_count == 0) {
        worker_count = 1;
    }
    return std::min<unsigned int>(worker_count, static_cast<unsigned int>(std::max<size_t>(1, jobs)));
}

BatchSummary run_batch(const std::vector<fs::path>& inputs,
                       unsigned int threads,
                       const FileJob& job,
                       SyncLog& log) {
    std::atomic<size_t> processed{0};
    std::atomic<size_t> empty{0};
    std::atomic<size_t> failed{0};

    auto run_one = [&](const fs::path& input) {
        std::string error;
        FileOutcome outcome = FileOutcome::Failed;
        try {
            outcome = job(input, error);
        } catch (const std::exception& e) {
            error = e.what();
            outcome = FileOutcome::Failed;
        }

        switch (outcome) {
            case FileOutcome::Done:
                processed.fetch_add(1, std::memory_order_relaxed);
                break;
            case FileOutcome::Empty:
                empty.fetch_add(1, std::memory_order_relaxed);
                break;
            case FileOutcome::Failed:
                failed.fetch_add(1, std::memory_order_relaxed);
                log.error(input.string() + ": " + (error.empty() ? std::string("processing failed") : error));
                break;
        }
    };

    const unsigned int worker_count = resolve_worker_count(threads, inputs.size());
    if (worker_count <= 1) {
        for (const auto& input : inputs) {
            run_one(input);
        }
    } else {
        std::atomic<size_t> next_index{0};
        std::vector<std::thread> workers;
        workers.reserve(worker_count);
        for (unsigned int i = 0; i < worker_count; ++i) {
            workers.emplace_back([&]() {
                while (true) {
                    const size_t idx = next_index.fetch_add(1, std::memory_order_relaxed);
                    if (idx >= inputs.size()) {
                        break;
                    }
                    run_one(inputs[idx]);
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }
    }

    return BatchSummary{
        .processed = processed.load(),
        .empty = empty.load(),
        .failed = failed.load(),
    };
}

fs::path executable_dir(const char* argv0) {
    std::error_code ec;
    const fs::path cwd = fs::current_path(ec);
    fs::path exec_path(argv0 != nullptr ? argv0 : "");
    if (exec_path.is_relative() && !cwd.empty()) {
        exec_path = cwd / exec_path;
    }
    fs::path exec_dir = exec_path.parent_path();
    if (exec_dir.empty()) {
        exec_dir = cwd;
    }
    return exec_dir;
}

} // namespace hexprep::core
