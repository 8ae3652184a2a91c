#include "export/archive_extractor.hpp"

#include <boost/process/v1.hpp>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace reportd::exporting {
namespace bp = boost::process::v1;
namespace {

constexpr const char* kTag = "extract";

class ScopedTempDir {
public:
    explicit ScopedTempDir(const std::filesystem::path& root) {
        std::error_code ec;
        std::filesystem::create_directories(root, ec);
        path_ = root / ("reportd-extract-" + utils::RandomHex(8));
        if (!std::filesystem::create_directory(path_, ec) || ec) {
            throw utils::ExtractionError("cannot create temporary directory " + path_.string() +
                                         (ec ? ": " + ec.message() : std::string()));
        }
        std::filesystem::permissions(path_, std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::replace, ec);
    }

    ~ScopedTempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        if (ec) {
            utils::LogWarn(kTag, "failed to remove temporary directory", {
                {"dir", path_.string()}, {"error", ec.message()}});
        }
    }

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

std::string ExtensionOf(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    if (!ext.empty() && ext.front() == '.') {
        ext.erase(0, 1);
    }
    return utils::ToLower(ext);
}

void WriteBytes(const std::filesystem::path& path, const std::string& bytes) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw utils::ExtractionError("cannot write archive copy " + path.string());
    }
    output.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!output) {
        throw utils::ExtractionError("short write on archive copy " + path.string());
    }
}

std::string ReadBytes(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw utils::ExtractionError("cannot read extracted file " + path.filename().string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

}  // namespace

ArchiveExtractor::ArchiveExtractor(std::filesystem::path temp_root,
                                   std::string unzip_program,
                                   std::chrono::seconds timeout)
    : temp_root_(std::move(temp_root)), unzip_program_(std::move(unzip_program)), timeout_(timeout) {}

void ArchiveExtractor::RunUnzip(const std::filesystem::path& archive, const std::filesystem::path& target) const {
    bp::filesystem::path program(unzip_program_);
    if (!bp::filesystem::exists(program)) {
        program = bp::search_path("unzip");
        if (program.empty()) {
            throw utils::ExtractionError("unzip is not available");
        }
    }

    int status = 0;
    bool finished = false;
    try {
        // -j junks stored paths so nested entries land directly in target.
        bp::child child_process(
            program,
            "-j", "-o", "-qq",
            archive.string(),
            "-d", target.string(),
            bp::std_out > bp::null,
            bp::std_err > bp::null,
            bp::std_in < bp::null);

        const auto deadline = std::chrono::steady_clock::now() + timeout_;
        const pid_t pid = child_process.id();
        while (std::chrono::steady_clock::now() < deadline) {
            const auto waited = ::waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                finished = true;
                break;
            }
            if (waited < 0) {
                if (errno == EINTR) {
                    continue;
                }
                const int wait_error = errno;
                child_process.detach();
                throw utils::ExtractionError(std::string("cannot wait for unzip: ") + std::strerror(wait_error));
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        if (!finished) {
            ::kill(pid, SIGKILL);
            ::waitpid(pid, &status, 0);
            child_process.detach();
            throw utils::ExtractionError("unzip timed out after " + std::to_string(timeout_.count()) + "s");
        }
        child_process.detach();
    } catch (const bp::process_error& ex) {
        throw utils::ExtractionError(std::string("cannot run unzip: ") + ex.what());
    }

    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        const int code = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
        throw utils::ExtractionError("failed to extract archive (unzip exit " + std::to_string(code) + ")");
    }
}

ExtractedPayload ArchiveExtractor::Extract(const std::string& archive_bytes,
                                           const std::string& expected_format) const {
    const auto expected = utils::ToLower(expected_format);
    ScopedTempDir workspace(temp_root_);
    const auto archive_path = workspace.path() / "export.zip";
    const auto extract_dir = workspace.path() / "contents";
    std::error_code ec;
    std::filesystem::create_directory(extract_dir, ec);
    if (ec) {
        throw utils::ExtractionError("cannot create extraction directory: " + ec.message());
    }

    WriteBytes(archive_path, archive_bytes);
    RunUnzip(archive_path, extract_dir);

    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(extract_dir, ec)) {
        if (entry.is_regular_file()) {
            files.push_back(entry.path());
        }
    }
    if (ec) {
        throw utils::ExtractionError("cannot list extracted files: " + ec.message());
    }
    std::sort(files.begin(), files.end());

    const auto exact = std::find_if(files.begin(), files.end(), [&](const std::filesystem::path& path) {
        return ExtensionOf(path) == expected;
    });
    if (exact != files.end()) {
        ExtractedPayload payload;
        payload.bytes = ReadBytes(*exact);
        payload.file_name = exact->filename().string();
        payload.format = expected;
        utils::LogInfo(kTag, "extracted report file", {
            {"file", payload.file_name}, {"bytes", std::to_string(payload.bytes.size())}});
        return payload;
    }

    const auto fallback = std::find_if(files.begin(), files.end(), [](const std::filesystem::path& path) {
        const auto ext = ExtensionOf(path);
        return ext == "csv" || ext == "json";
    });
    if (fallback == files.end()) {
        throw utils::ExtractionError("no " + utils::ToUpper(expected) + " file found in export archive");
    }

    ExtractedPayload payload;
    payload.bytes = ReadBytes(*fallback);
    payload.file_name = fallback->filename().string();
    payload.format = ExtensionOf(*fallback);
    payload.used_fallback = true;
    utils::LogWarn(kTag, "expected file type not found, using fallback", {
        {"expected", expected}, {"file", payload.file_name}});
    return payload;
}

long long CountRecords(const std::string& data, const std::string& format) {
    const auto lowered = utils::ToLower(format);
    if (lowered == "csv") {
        std::istringstream input(data);
        std::string line;
        long long lines = 0;
        while (std::getline(input, line)) {
            const bool blank = std::all_of(line.begin(), line.end(), [](unsigned char ch) {
                return std::isspace(ch) != 0;
            });
            if (!blank) {
                ++lines;
            }
        }
        return std::max(0LL, lines - 1);
    }
    if (lowered == "json") {
        const auto json = nlohmann::json::parse(data, nullptr, false);
        if (json.is_discarded()) {
            utils::LogWarn(kTag, "cannot parse json payload for record count");
            return 0;
        }
        if (json.is_array()) {
            return static_cast<long long>(json.size());
        }
        if (json.is_object() && json.contains("value") && json["value"].is_array()) {
            return static_cast<long long>(json["value"].size());
        }
        return 0;
    }
    utils::LogWarn(kTag, "unknown format for record count", {{"format", format}});
    return 0;
}

}  // namespace reportd::exporting
