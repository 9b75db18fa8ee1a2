#include "hypoforge/session/session_store.hpp"
#include "hypoforge/errors.hpp"
#include "hypoforge/uuid.hpp"
#include <mutex>
#include <spdlog/spdlog.h>

namespace hypoforge {

namespace {

long long to_epoch_seconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

} // namespace

nlohmann::json Session::to_json() const {
    return {
        {"session_id", id},
        {"description", description},
        {"row_count", row_count},
        {"column_count", column_count},
        {"origin", origin},
        {"created_at", to_epoch_seconds(created_at)}
    };
}

SessionStore::SessionStore(fs::path directory) : directory_(std::move(directory)) {
    if (directory_.empty()) {
        directory_ = fs::temp_directory_path() / ("hypoforge-" + generate_uuid());
    }
    std::error_code ec;
    owns_directory_ = fs::create_directories(directory_, ec);
    if (ec) {
        throw PermissionDeniedError("Cannot create session directory " + directory_.string() + ": " + ec.message());
    }
    spdlog::info("🗄️  Session snapshots stored in {}", directory_.string());
}

SessionStore::~SessionStore() {
    if (!owns_directory_) return;
    std::error_code ec;
    fs::remove_all(directory_, ec);
    if (ec) spdlog::warn("⚠️ Could not remove session directory {}: {}", directory_.string(), ec.message());
}

fs::path SessionStore::snapshot_path_for(const std::string& id) const {
    return directory_ / (id + ".json");
}

Session SessionStore::create(const LoadedDataset& loaded) {
    return create(loaded.dataset, loaded.description, loaded.origin);
}

Session SessionStore::create(const Dataset& dataset, std::string description, std::string origin) {
    Session session;
    session.id = generate_uuid();
    session.snapshot_path = snapshot_path_for(session.id);
    session.description = std::move(description);
    session.row_count = dataset.row_count();
    session.column_count = dataset.column_count();
    session.origin = std::move(origin);

    const fs::path tmp = directory_ / (session.id + ".tmp");
    try {
        dataset.write_snapshot(tmp);
    } catch (...) {
        std::error_code ec;
        fs::remove(tmp, ec);
        throw;
    }

    {
        std::unique_lock lock(mutex_);
        std::error_code ec;
        fs::rename(tmp, session.snapshot_path, ec);
        if (ec) {
            std::error_code ignored;
            fs::remove(tmp, ignored);
            throw PermissionDeniedError("Cannot publish snapshot " + session.snapshot_path.string() + ": " + ec.message());
        }
        session.created_at = std::chrono::system_clock::now();
        sessions_.emplace(session.id, session);
    }

    spdlog::info("✨ Session {} created from {} ({} rows, {} columns)",
                 session.id, session.origin, session.row_count, session.column_count);
    return session;
}

Dataset SessionStore::load(const std::string& id) const {
    std::shared_lock lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        throw NotFoundError("Session not found: " + id);
    }
    std::error_code ec;
    if (!fs::exists(it->second.snapshot_path, ec)) {
        throw NotFoundError("Snapshot missing for session: " + id);
    }
    return Dataset::read_snapshot(it->second.snapshot_path);
}

Session SessionStore::get(const std::string& id) const {
    std::shared_lock lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        throw NotFoundError("Session not found: " + id);
    }
    return it->second;
}

void SessionStore::remove(const std::string& id) {
    std::unique_lock lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        throw NotFoundError("Session not found: " + id);
    }
    std::error_code ec;
    fs::remove(it->second.snapshot_path, ec);
    if (ec) {
        throw PermissionDeniedError("Cannot remove snapshot for session " + id + ": " + ec.message());
    }
    sessions_.erase(it);
    spdlog::info("🗑️  Session {} deleted", id);
}

size_t SessionStore::sweep(std::chrono::seconds max_age) {
    return sweep(max_age, std::chrono::system_clock::now());
}

size_t SessionStore::sweep(std::chrono::seconds max_age, std::chrono::system_clock::time_point now) {
    std::unique_lock lock(mutex_);
    size_t removed = 0;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        const auto age = std::chrono::duration_cast<std::chrono::seconds>(now - it->second.created_at);
        if (max_age.count() > 0 && age <= max_age) {
            ++it;
            continue;
        }
        std::error_code ec;
        fs::remove(it->second.snapshot_path, ec);
        if (ec) {
            spdlog::warn("⚠️ Sweep skipped session {}: {}", it->first, ec.message());
            ++it;
            continue;
        }
        it = sessions_.erase(it);
        ++removed;
    }
    if (removed > 0) spdlog::info("🧹 Sweep removed {} session(s)", removed);
    return removed;
}

fs::path SessionStore::pin_snapshot(const std::string& id, const fs::path& dir) const {
    std::shared_lock lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        throw NotFoundError("Session not found: " + id);
    }

    const fs::path pinned = dir / (id + ".json");
    std::error_code ec;
    fs::create_hard_link(it->second.snapshot_path, pinned, ec);
    if (ec) {
        std::error_code exists_ec;
        if (!fs::exists(it->second.snapshot_path, exists_ec)) {
            throw NotFoundError("Snapshot missing for session: " + id);
        }
        std::error_code copy_ec;
        fs::copy_file(it->second.snapshot_path, pinned, fs::copy_options::overwrite_existing, copy_ec);
        if (copy_ec) {
            throw PermissionDeniedError("Cannot pin snapshot for session " + id + ": " + copy_ec.message());
        }
    }
    return pinned;
}

size_t SessionStore::size() const {
    std::shared_lock lock(mutex_);
    return sessions_.size();
}

} // namespace hypoforge
