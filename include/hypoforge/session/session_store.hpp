#pragma once

#include <chrono>
#include <filesystem>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "hypoforge/dataset/dataset.hpp"
#include "hypoforge/dataset/dataset_loader.hpp"

namespace hypoforge {

namespace fs = std::filesystem;

struct Session {
    std::string id;
    fs::path snapshot_path;
    std::string description;
    size_t row_count = 0;
    size_t column_count = 0;
    std::string origin;
    std::chrono::system_clock::time_point created_at;

    nlohmann::json to_json() const;
};

// Registry of immutable dataset snapshots keyed by session id.
//
// A snapshot file exists exactly when its record exists. Snapshots are
// written to "<id>.tmp" and renamed to "<id>.json" before the record is
// published, so readers never observe a half-written session. Deletion and
// sweeping hold the exclusive lock; loads hold the shared lock for the whole
// read, so a load either completes or reports NotFound.
class SessionStore {
public:
    // An empty directory selects a fresh process-scoped directory under the
    // system temp dir.
    explicit SessionStore(fs::path directory = {});
    ~SessionStore();

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    Session create(const Dataset& dataset, std::string description, std::string origin);
    Session create(const LoadedDataset& loaded);

    // NotFound when the id is unknown or its snapshot is gone.
    Dataset load(const std::string& id) const;
    Session get(const std::string& id) const;

    // Removes snapshot and record together. NotFound when the id is unknown.
    void remove(const std::string& id);

    // Removes every session older than max_age; max_age <= 0 removes all and
    // seconds::max() removes none.
    // Entries that cannot be removed are skipped and not counted.
    size_t sweep(std::chrono::seconds max_age);
    size_t sweep(std::chrono::seconds max_age, std::chrono::system_clock::time_point now);

    // Private link (or copy) of the snapshot inside dir, taken under the
    // registry lock. Survives a concurrent remove(). Caller owns the file.
    fs::path pin_snapshot(const std::string& id, const fs::path& dir) const;

    size_t size() const;
    const fs::path& directory() const { return directory_; }

private:
    fs::path directory_;
    bool owns_directory_ = false;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Session> sessions_;

    fs::path snapshot_path_for(const std::string& id) const;
};

} // namespace hypoforge
