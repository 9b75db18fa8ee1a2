#pragma once
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace hypoforge {

struct RunRecord {
    long long timestamp = 0;
    std::string session_id;
    std::string hypothesis;
    std::string stage_reached;
    std::string failed_stage;    // empty on success
    bool success = false;        // test outcome, meaningful when the run completed
    std::optional<double> p_value;
    double duration_ms = 0.0;
};

// Recent hypothesis-test runs, newest last. Never persisted.
class RunJournal {
public:
    static constexpr size_t kCapacity = 50;

    static RunJournal& instance() {
        static RunJournal journal;
        return journal;
    }

    void add(const RunRecord& record) {
        std::lock_guard<std::mutex> lock(mtx_);
        runs_.push_back(record);
        if (runs_.size() > kCapacity) {
            runs_.pop_front();
        }
    }

    // Newest first.
    nlohmann::json to_json() const {
        std::lock_guard<std::mutex> lock(mtx_);
        nlohmann::json list = nlohmann::json::array();
        for (auto it = runs_.rbegin(); it != runs_.rend(); ++it) {
            list.push_back({
                {"timestamp", it->timestamp},
                {"session_id", it->session_id},
                {"hypothesis", it->hypothesis},
                {"stage", it->stage_reached},
                {"failed_stage", it->failed_stage.empty() ? nlohmann::json(nullptr) : nlohmann::json(it->failed_stage)},
                {"success", it->success},
                {"p_value", it->p_value ? nlohmann::json(*it->p_value) : nlohmann::json(nullptr)},
                {"duration_ms", it->duration_ms}
            });
        }
        return list;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return runs_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        runs_.clear();
    }

private:
    RunJournal() = default;
    std::deque<RunRecord> runs_;
    mutable std::mutex mtx_;
};

} // namespace hypoforge
