#include "tar_stream.h"

#include <ctime>
#include <string>

#include <archive.h>
#include <archive_entry.h>

namespace hexprep::core {

namespace {

constexpr size_t k_initial_archive_capacity = 1024 * 1024;
constexpr int k_entry_permissions = 0644;

la_ssize_t append_to_buffer(struct archive*, void* client_data, const void* buffer, size_t length) {
    auto* out = static_cast<std::vector<char>*>(client_data);
    const auto* data = static_cast<const char*>(buffer);
    out->insert(out->end(), data, data + length);
    return static_cast<la_ssize_t>(length);
}

std::string archive_message(struct archive* a) {
    const char* message = archive_error_string(a);
    return message != nullptr ? std::string(message) : std::string("unknown archive error");
}

} // namespace

TarStream::~TarStream() {
    if (archive_ != nullptr) {
        archive_write_free(archive_);
    }
}

bool TarStream::open(std::string& error) {
    if (archive_ != nullptr) {
        error = "archive already open";
        return false;
    }

    archive_ = archive_write_new();
    if (archive_ == nullptr) {
        error = "failed to create archive";
        return false;
    }

    if (archive_write_set_format_pax_restricted(archive_) != ARCHIVE_OK) {
        error = std::string("failed to set archive format: ") + archive_message(archive_);
        return false;
    }

    if (archive_write_add_filter_none(archive_) != ARCHIVE_OK) {
        error = std::string("failed to set compression: ") + archive_message(archive_);
        return false;
    }

    buffer_.clear();
    buffer_.reserve(k_initial_archive_capacity);
    if (archive_write_open(archive_, &buffer_, nullptr, append_to_buffer, nullptr) != ARCHIVE_OK) {
        error = std::string("failed to open memory for archive: ") + archive_message(archive_);
        return false;
    }
    return true;
}

bool TarStream::add_file(const std::string& name, const std::vector<std::uint8_t>& bytes, std::string& error) {
    if (archive_ == nullptr) {
        error = "archive is not open";
        return false;
    }

    struct archive_entry* entry = archive_entry_new();
    if (entry == nullptr) {
        error = "failed to create archive entry";
        return false;
    }

    archive_entry_set_pathname(entry, name.c_str());
    archive_entry_set_size(entry, static_cast<la_int64_t>(bytes.size()));
    archive_entry_set_filetype(entry, AE_IFREG);
    archive_entry_set_perm(entry, k_entry_permissions);
    archive_entry_set_mtime(entry, std::time(nullptr), 0);

    if (archive_write_header(archive_, entry) != ARCHIVE_OK) {
        error = std::string("failed to write archive header: ") + archive_message(archive_);
        archive_entry_free(entry);
        return false;
    }

    if (archive_write_data(archive_, bytes.data(), bytes.size()) != static_cast<la_ssize_t>(bytes.size())) {
        error = std::string("failed to write archive data: ") + archive_message(archive_);
        archive_entry_free(entry);
        return false;
    }

    archive_entry_free(entry);
    ++entry_count_;
    return true;
}

bool TarStream::finish(std::ostream& out, std::string& error) {
    if (archive_ == nullptr) {
        error = "archive is not open";
        return false;
    }

    if (archive_write_close(archive_) != ARCHIVE_OK) {
        error = std::string("failed to close archive: ") + archive_message(archive_);
        return false;
    }
    archive_write_free(archive_);
    archive_ = nullptr;

    out.write(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
    out.flush();
    if (!out) {
        error = "failed to write archive to output stream";
        return false;
    }
    return true;
}

} // namespace hexprep::core
