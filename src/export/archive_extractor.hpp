#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace reportd::exporting {

struct ExtractedPayload {
    std::string bytes;
    std::string file_name;
    // Extension of the returned file ("csv" or "json").
    std::string format;
    bool used_fallback = false;
};

// Unpacks an export archive with unzip(1) into a private directory under
// temp_root and returns the data file. The directory is always removed.
class ArchiveExtractor {
public:
    explicit ArchiveExtractor(std::filesystem::path temp_root,
                              std::string unzip_program = "/usr/bin/unzip",
                              std::chrono::seconds timeout = std::chrono::seconds(120));

    // Throws ExtractionError when the archive is unreadable or holds no csv/json file.
    ExtractedPayload Extract(const std::string& archive_bytes, const std::string& expected_format) const;

private:
    void RunUnzip(const std::filesystem::path& archive, const std::filesystem::path& target) const;

    std::filesystem::path temp_root_;
    std::string unzip_program_;
    std::chrono::seconds timeout_;
};

// csv: non-blank lines minus the header. json: top-level array length, or
// the length of a top-level object's "value" array. 0 otherwise.
long long CountRecords(const std::string& data, const std::string& format);

}  // namespace reportd::exporting
