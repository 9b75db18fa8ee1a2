#include "hypoforge/gateway/completion_gateway.hpp"
#include "hypoforge/errors.hpp"
#include "hypoforge/gateway/event_stream_decoder.hpp"
#include <cstdlib>
#include <string_view>
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>

namespace hypoforge {

using json = nlohmann::json;

namespace {

constexpr size_t kMaxErrorBody = 64 * 1024;

void require_key(const CompletionEndpoint& endpoint) {
    if (endpoint.api_key.empty()) {
        throw BadInputError("API key is required");
    }
}

// "HTTP/1.1 401 Unauthorized" -> 401, anything else -> 0.
long parse_status_line(std::string_view header) {
    if (header.substr(0, 5) != "HTTP/") return 0;
    const size_t space = header.find(' ');
    if (space == std::string_view::npos) return 0;
    return std::strtol(std::string(header.substr(space + 1, 3)).c_str(), nullptr, 10);
}

} // namespace

json CompletionGateway::complete_json(const CompletionEndpoint& endpoint, const CompletionRequest& request) {
    const std::string content = complete(endpoint, request);
    try {
        return json::parse(content);
    } catch (const json::parse_error&) {
        throw UpstreamError("Completion returned invalid JSON", 502, content);
    }
}

ChatCompletionsGateway::ChatCompletionsGateway(std::chrono::seconds timeout) : timeout_(timeout) {}

std::string ChatCompletionsGateway::chat_url(const std::string& base_url) {
    std::string base = base_url;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base + "/chat/completions";
}

std::string ChatCompletionsGateway::authorization(const std::string& api_key) {
    return "Bearer " + api_key + ":hypoforge";
}

json ChatCompletionsGateway::build_body(const CompletionEndpoint& endpoint, const CompletionRequest& request, bool streaming) {
    json body = {
        {"model", endpoint.model},
        {"messages", json::array({
            {{"role", "system"}, {"content", request.system_prompt}},
            {{"role", "user"}, {"content", request.user_content}}
        })},
        {"temperature", endpoint.temperature}
    };
    if (!request.json_schema.is_null()) {
        body["response_format"] = {{"type", "json_schema"}, {"json_schema", request.json_schema}};
    }
    if (streaming) {
        body["stream"] = true;
        body["stream_options"] = {{"include_usage", true}};
    }
    return body;
}

std::string ChatCompletionsGateway::complete(const CompletionEndpoint& endpoint, const CompletionRequest& request) {
    require_key(endpoint);
    const std::string url = chat_url(endpoint.base_url);
    const auto started = std::chrono::steady_clock::now();

    auto r = cpr::Post(cpr::Url{url},
                       cpr::Body{build_body(endpoint, request, false).dump(-1, ' ', false, json::error_handler_t::replace)},
                       cpr::Header{{"Content-Type", "application/json"},
                                   {"Authorization", authorization(endpoint.api_key)}},
                       cpr::Timeout{std::chrono::duration_cast<std::chrono::milliseconds>(timeout_)});

    if (r.error.code != cpr::ErrorCode::OK) {
        spdlog::error("❌ Completion transport failure: {}", r.error.message);
        throw UpstreamError("Completion service unreachable: " + r.error.message, 0, r.error.message);
    }
    if (r.status_code != 200) {
        spdlog::error("❌ Completion API Error [{}]: {}", r.status_code, r.text);
        throw UpstreamError("LLM API error: " + r.text, static_cast<int>(r.status_code), r.text);
    }

    std::string content;
    try {
        auto j = json::parse(r.text);
        content = j.at("choices").at(0).at("message").at("content").get<std::string>();
    } catch (const json::exception& e) {
        throw UpstreamError(std::string("Unexpected completion response: ") + e.what(),
                            static_cast<int>(r.status_code), r.text);
    }

    spdlog::debug("Completion finished in {} ms", std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count());
    return content;
}

std::optional<std::string> ChatCompletionsGateway::stream(const CompletionEndpoint& endpoint,
                                                          const CompletionRequest& request,
                                                          const StreamSink& sink) {
    require_key(endpoint);
    const std::string url = chat_url(endpoint.base_url);

    long status = 0;
    std::string error_body;
    bool cancelled = false;
    EventStreamDecoder decoder([&](const std::string& total) {
        if (!sink(total)) {
            cancelled = true;
            return false;
        }
        return true;
    });

    // Parameter types chosen so the lambdas bind to both the std::string and
    // std::string_view callback signatures used across cpr releases.
    auto r = cpr::Post(cpr::Url{url},
                       cpr::Body{build_body(endpoint, request, true).dump(-1, ' ', false, json::error_handler_t::replace)},
                       cpr::Header{{"Content-Type", "application/json"},
                                   {"Accept", "text/event-stream"},
                                   {"Authorization", authorization(endpoint.api_key)}},
                       cpr::Timeout{std::chrono::duration_cast<std::chrono::milliseconds>(timeout_)},
                       cpr::HeaderCallback{[&](std::string_view header, intptr_t) -> bool {
                           if (long s = parse_status_line(header)) status = s;
                           return true;
                       }},
                       cpr::WriteCallback{[&](std::string_view data, intptr_t) -> bool {
                           if (status != 200) {
                               if (error_body.size() < kMaxErrorBody) error_body.append(data.data(), data.size());
                               return true;
                           }
                           decoder.feed(data.data(), data.size());
                           return !decoder.stopped();
                       }});

    if (cancelled) {
        spdlog::info("🛑 Completion stream cancelled by the consumer");
        return std::nullopt;
    }
    if (r.error.code != cpr::ErrorCode::OK) {
        spdlog::error("❌ Completion stream transport failure: {}", r.error.message);
        throw UpstreamError("Completion service unreachable: " + r.error.message, 0, r.error.message);
    }
    if (r.status_code != 200) {
        spdlog::error("❌ Completion API Error [{}]: {}", r.status_code, error_body);
        throw UpstreamError("LLM API error: " + error_body, static_cast<int>(r.status_code), error_body);
    }

    decoder.finish();
    if (cancelled) return std::nullopt;
    if (decoder.skipped() > 0) {
        spdlog::warn("⚠️ Skipped {} malformed stream frame(s)", decoder.skipped());
    }
    return decoder.content();
}

} // namespace hypoforge
