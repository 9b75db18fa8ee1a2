#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace hypoforge {

// Where and as whom a completion request is sent.
struct CompletionEndpoint {
    std::string base_url;
    std::string api_key;
    std::string model;
    double temperature = 0.0;
};

struct CompletionRequest {
    std::string system_prompt;
    std::string user_content;
    nlohmann::json json_schema;   // null for free text
};

// Receives the complete-so-far content. Returning false cancels the stream.
using StreamSink = std::function<bool(const std::string& running_total)>;

class CompletionGateway {
public:
    virtual ~CompletionGateway() = default;

    // Full response content. Throws BadInputError without an API key and
    // UpstreamError on transport failure or a non-200 response.
    virtual std::string complete(const CompletionEndpoint& endpoint, const CompletionRequest& request) = 0;

    // Streams the response; the last value handed to sink equals the return
    // value. std::nullopt when the sink cancelled.
    virtual std::optional<std::string> stream(const CompletionEndpoint& endpoint,
                                              const CompletionRequest& request,
                                              const StreamSink& sink) = 0;

    // complete() parsed as JSON. UpstreamError when the content is not JSON.
    nlohmann::json complete_json(const CompletionEndpoint& endpoint, const CompletionRequest& request);
};

// OpenAI-compatible /chat/completions client on cpr.
class ChatCompletionsGateway : public CompletionGateway {
public:
    explicit ChatCompletionsGateway(std::chrono::seconds timeout = std::chrono::seconds(300));

    std::string complete(const CompletionEndpoint& endpoint, const CompletionRequest& request) override;
    std::optional<std::string> stream(const CompletionEndpoint& endpoint,
                                      const CompletionRequest& request,
                                      const StreamSink& sink) override;

    static nlohmann::json build_body(const CompletionEndpoint& endpoint, const CompletionRequest& request, bool streaming);
    static std::string chat_url(const std::string& base_url);
    static std::string authorization(const std::string& api_key);

private:
    std::chrono::seconds timeout_;
};

} // namespace hypoforge
