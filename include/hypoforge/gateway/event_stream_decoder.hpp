#pragma once

#include <functional>
#include <string>

namespace hypoforge {

// Incremental decoder for chat-completion event streams.
//
// Bytes arrive in arbitrary network chunks; complete lines are framed here.
// Each "data: {json}" line contributes choices[0].delta.content to a running
// total, and the total is handed to the callback after every contributing
// frame. "data: [DONE]" finishes the stream. Comment lines, other fields and
// malformed JSON frames are skipped.
class EventStreamDecoder {
public:
    // Return false from the callback to stop decoding.
    using Callback = std::function<bool(const std::string& running_total)>;

    explicit EventStreamDecoder(Callback on_update);

    // Returns false once the stream is done or the callback asked to stop.
    bool feed(const char* data, size_t size);
    bool feed(const std::string& chunk) { return feed(chunk.data(), chunk.size()); }

    // Processes a trailing line that arrived without a newline.
    void finish();

    bool done() const { return done_; }
    bool stopped() const { return stopped_; }
    const std::string& content() const { return content_; }
    size_t frames() const { return frames_; }
    size_t skipped() const { return skipped_; }

private:
    Callback on_update_;
    std::string pending_;
    std::string content_;
    bool done_ = false;
    bool stopped_ = false;
    size_t frames_ = 0;
    size_t skipped_ = 0;

    void handle_line(std::string line);
};

} // namespace hypoforge
