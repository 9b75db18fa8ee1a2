#include "hypoforge/dataset/dataset_loader.hpp"
#include "hypoforge/dataset/csv_reader.hpp"
#include "hypoforge/dataset/description.hpp"
#include "hypoforge/dataset/sqlite_reader.hpp"
#include "hypoforge/errors.hpp"
#include "hypoforge/uuid.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <unistd.h>
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>

namespace hypoforge {

namespace {

const std::vector<std::string> kDelimitedExtensions = {".csv", ".tsv"};
const std::vector<std::string> kDatabaseExtensions = {".sqlite", ".sqlite3", ".db", ".s3db", ".sl3"};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

// Owns a staged payload on disk; the file goes away with the guard.
class StagedFile {
public:
    StagedFile(fs::path path, const std::string& bytes) : path_(std::move(path)) {
        std::ofstream out(path_, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw PermissionDeniedError("Cannot stage payload at " + path_.string());
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.close();
        if (!out) {
            discard();
            throw PermissionDeniedError("Failed writing staged payload " + path_.string());
        }
    }

    ~StagedFile() { discard(); }

    StagedFile(const StagedFile&) = delete;
    StagedFile& operator=(const StagedFile&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;

    void discard() {
        std::error_code ec;
        fs::remove(path_, ec);
        if (ec) spdlog::warn("⚠️ Could not remove staged file {}: {}", path_.string(), ec.message());
    }
};

} // namespace

DatasetLoader::DatasetLoader(fs::path staging_dir, std::chrono::seconds fetch_timeout)
    : staging_dir_(std::move(staging_dir)), fetch_timeout_(fetch_timeout) {}

bool DatasetLoader::is_url(const std::string& source) {
    const std::string lower = to_lower(source.substr(0, 8));
    return lower.rfind("http://", 0) == 0 || lower.rfind("https://", 0) == 0;
}

std::string DatasetLoader::supported_formats() {
    std::string out;
    for (const auto* list : {&kDelimitedExtensions, &kDatabaseExtensions}) {
        for (const auto& ext : *list) {
            if (!out.empty()) out += ", ";
            out += ext;
        }
    }
    return out;
}

std::string DatasetLoader::url_suffix(const std::string& url) {
    std::string path = url.substr(0, url.find_first_of("?#"));
    const size_t scheme = path.find("://");
    if (scheme != std::string::npos) {
        const size_t slash = path.find('/', scheme + 3);
        path = slash == std::string::npos ? "" : path.substr(slash);
    }
    const std::string name = path.substr(path.find_last_of('/') + 1);
    const size_t dot = name.find_last_of('.');
    if (dot == std::string::npos || dot + 1 == name.size()) return "";
    return to_lower(name.substr(dot));
}

Dataset DatasetLoader::decode(const fs::path& path) {
    const std::string ext = to_lower(path.extension().string());
    if (ext == ".csv") return csv::read_delimited(path, ',');
    if (ext == ".tsv") return csv::read_delimited(path, '\t');
    if (contains(kDatabaseExtensions, ext)) return sqlite::read_first_table(path);
    throw BadInputError("Unsupported file format. Supported: " + supported_formats());
}

LoadedDataset DatasetLoader::load(const std::string& source) const {
    std::string trimmed = source;
    trimmed.erase(0, trimmed.find_first_not_of(" \t\r\n"));
    trimmed.erase(trimmed.find_last_not_of(" \t\r\n") + 1);
    if (trimmed.empty()) {
        throw BadInputError("source must not be empty");
    }
    return is_url(trimmed) ? load_url(trimmed) : load_path(trimmed);
}

LoadedDataset DatasetLoader::load_path(const fs::path& path) const {
    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (status.type() == fs::file_type::not_found || (ec && status.type() == fs::file_type::none)) {
        throw NotFoundError("File not found: " + path.string());
    }
    if (status.type() != fs::file_type::regular) {
        throw BadInputError("Path is not a file: " + path.string());
    }
    if (::access(path.c_str(), R_OK) != 0) {
        throw PermissionDeniedError("Permission denied accessing file: " + path.string());
    }

    auto dataset = decode(path);
    spdlog::info("📂 Loaded {} ({} rows, {} columns)", path.string(), dataset.row_count(), dataset.column_count());
    auto description = describe(dataset);
    return LoadedDataset{std::move(dataset), std::move(description), path.string()};
}

LoadedDataset DatasetLoader::load_url(const std::string& url) const {
    const std::string ext = url_suffix(url);
    if (!contains(kDelimitedExtensions, ext) && !contains(kDatabaseExtensions, ext)) {
        throw BadInputError("Unsupported file format. Supported: " + supported_formats());
    }

    spdlog::info("🌐 Fetching dataset from {}", url);
    auto r = cpr::Get(cpr::Url{url},
                      cpr::Timeout{std::chrono::duration_cast<std::chrono::milliseconds>(fetch_timeout_)});

    if (r.error.code != cpr::ErrorCode::OK) {
        throw UpstreamError("Failed to download " + url + ": " + r.error.message, 0, r.error.message);
    }
    if (r.status_code != 200) {
        spdlog::error("❌ Download failed [{}]: {}", r.status_code, url);
        throw UpstreamError("Failed to download " + url, static_cast<int>(r.status_code), r.text);
    }
    return decode_staged(ext, r.text, url);
}

LoadedDataset DatasetLoader::load_upload(const std::string& filename, const std::string& bytes) const {
    const std::string ext = to_lower(fs::path(filename).extension().string());
    if (!contains(kDelimitedExtensions, ext) && !contains(kDatabaseExtensions, ext)) {
        throw BadInputError("Unsupported file format. Supported: " + supported_formats());
    }
    return decode_staged(ext, bytes, filename);
}

LoadedDataset DatasetLoader::decode_staged(const std::string& extension, const std::string& bytes,
                                           const std::string& origin) const {
    std::error_code ec;
    fs::create_directories(staging_dir_, ec);
    if (ec) {
        throw PermissionDeniedError("Cannot create staging directory " + staging_dir_.string() + ": " + ec.message());
    }

    StagedFile staged(staging_dir_ / ("staged-" + generate_uuid() + extension), bytes);
    auto dataset = decode(staged.path());
    spdlog::info("📂 Loaded {} ({} rows, {} columns)", origin, dataset.row_count(), dataset.column_count());
    auto description = describe(dataset);
    return LoadedDataset{std::move(dataset), std::move(description), origin};
}

} // namespace hypoforge
