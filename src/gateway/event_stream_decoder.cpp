#include "hypoforge/gateway/event_stream_decoder.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace hypoforge {

using json = nlohmann::json;

EventStreamDecoder::EventStreamDecoder(Callback on_update) : on_update_(std::move(on_update)) {}

bool EventStreamDecoder::feed(const char* data, size_t size) {
    if (done_ || stopped_) return false;
    pending_.append(data, size);

    size_t start = 0;
    size_t nl;
    while (!done_ && !stopped_ && (nl = pending_.find('\n', start)) != std::string::npos) {
        handle_line(pending_.substr(start, nl - start));
        start = nl + 1;
    }
    pending_.erase(0, start);
    return !done_ && !stopped_;
}

void EventStreamDecoder::finish() {
    if (!done_ && !stopped_ && !pending_.empty()) {
        handle_line(pending_);
    }
    pending_.clear();
}

void EventStreamDecoder::handle_line(std::string line) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.rfind("data:", 0) != 0) return;

    std::string payload = line.substr(5);
    if (!payload.empty() && payload.front() == ' ') payload.erase(0, 1);
    if (payload == "[DONE]") {
        done_ = true;
        return;
    }

    std::string delta;
    try {
        auto j = json::parse(payload);
        const auto& choices = j.at("choices");
        if (choices.empty()) return;   // usage-only frame
        const auto& d = choices.at(0).at("delta");
        if (!d.contains("content") || d["content"].is_null()) return;
        delta = d["content"].get<std::string>();
    } catch (const json::exception& e) {
        ++skipped_;
        spdlog::debug("Skipping malformed stream frame: {}", e.what());
        return;
    }

    ++frames_;
    content_ += delta;
    if (on_update_ && !on_update_(content_)) stopped_ = true;
}

} // namespace hypoforge
