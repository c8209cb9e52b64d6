#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

struct archive;

namespace hexprep::core {

// Collects files into an uncompressed pax-restricted tar held in memory;
// finish() flushes the whole archive to the target stream.
class TarStream {
public:
    TarStream() = default;
    ~TarStream();

    TarStream(const TarStream&) = delete;
    TarStream& operator=(const TarStream&) = delete;

    bool open(std::string& error);
    bool add_file(const std::string& name, const std::vector<std::uint8_t>& bytes, std::string& error);
    bool finish(std::ostream& out, std::string& error);

    [[nodiscard]] size_t entry_count() const { return entry_count_; }

private:
    struct archive* archive_ = nullptr;
    std::vector<char> buffer_;
    size_t entry_count_ = 0;
};

} // namespace hexprep::core
