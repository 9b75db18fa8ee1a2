#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include "hypoforge/dataset/dataset.hpp"

namespace hypoforge {

namespace fs = std::filesystem;

struct LoadedDataset {
    Dataset dataset;
    std::string description;
    std::string origin;   // path, URL or uploaded filename
};

// Turns a local path, a remote URL or an uploaded payload into a typed
// dataset plus its description. Remote and uploaded payloads are staged
// in staging_dir and removed once decoded, whatever the outcome.
class DatasetLoader {
public:
    explicit DatasetLoader(fs::path staging_dir,
                           std::chrono::seconds fetch_timeout = std::chrono::seconds(60));

    // http:// and https:// sources are fetched, anything else is a local path.
    LoadedDataset load(const std::string& source) const;

    LoadedDataset load_path(const fs::path& path) const;
    LoadedDataset load_url(const std::string& url) const;
    LoadedDataset load_upload(const std::string& filename, const std::string& bytes) const;

    // Decodes by lowercase extension. Throws BadInputError for unknown formats.
    static Dataset decode(const fs::path& path);

    // ".csv, .tsv, .sqlite, ..." in the order they are listed in errors.
    static std::string supported_formats();

    // Trailing ".ext" of the URL path with query and fragment stripped,
    // lowercased; empty when the path has no extension.
    static std::string url_suffix(const std::string& url);

    static bool is_url(const std::string& source);

private:
    fs::path staging_dir_;
    std::chrono::seconds fetch_timeout_;

    LoadedDataset decode_staged(const std::string& extension, const std::string& bytes,
                                const std::string& origin) const;
};

} // namespace hypoforge
