#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include "hypoforge/session/session_store.hpp"

namespace hypoforge {

// Background sweeper. Runs SessionStore::sweep(max_age) every interval until
// destroyed; a zero interval starts no thread.
class SessionJanitor {
public:
    SessionJanitor(std::shared_ptr<SessionStore> store,
                   std::chrono::seconds max_age,
                   std::chrono::milliseconds interval);
    ~SessionJanitor();

    SessionJanitor(const SessionJanitor&) = delete;
    SessionJanitor& operator=(const SessionJanitor&) = delete;

    bool running() const { return worker_.joinable(); }
    size_t passes() const { return passes_.load(); }
    size_t total_removed() const { return total_removed_.load(); }

    void stop();

private:
    std::shared_ptr<SessionStore> store_;
    std::chrono::seconds max_age_;
    std::chrono::milliseconds interval_;

    std::mutex mutex_;
    std::condition_variable wake_;
    bool stop_requested_ = false;
    std::atomic<size_t> passes_{0};
    std::atomic<size_t> total_removed_{0};
    std::thread worker_;

    void poll_routine();
};

} // namespace hypoforge
