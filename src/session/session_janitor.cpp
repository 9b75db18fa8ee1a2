#include "hypoforge/session/session_janitor.hpp"
#include <spdlog/spdlog.h>

namespace hypoforge {

SessionJanitor::SessionJanitor(std::shared_ptr<SessionStore> store,
                               std::chrono::seconds max_age,
                               std::chrono::milliseconds interval)
    : store_(std::move(store)), max_age_(max_age), interval_(interval) {
    if (interval_.count() <= 0) {
        spdlog::info("🧹 Session janitor disabled");
        return;
    }
    worker_ = std::thread(&SessionJanitor::poll_routine, this);
    spdlog::info("🧹 Session janitor sweeping every {} ms (max age {} s)", interval_.count(), max_age_.count());
}

SessionJanitor::~SessionJanitor() {
    stop();
}

void SessionJanitor::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    wake_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void SessionJanitor::poll_routine() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        if (wake_.wait_for(lock, interval_, [this] { return stop_requested_; })) break;

        lock.unlock();
        try {
            total_removed_ += store_->sweep(max_age_);
        } catch (const std::exception& e) {
            spdlog::error("❌ Scheduled sweep failed: {}", e.what());
        }
        ++passes_;
        lock.lock();
    }
}

} // namespace hypoforge
