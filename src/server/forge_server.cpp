#include "hypoforge/server/forge_server.hpp"
#include "hypoforge/errors.hpp"
#include "hypoforge/run_journal.hpp"
#include <cmath>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace hypoforge {

using json = nlohmann::json;

namespace {

constexpr size_t kMaxPayloadBytes = 256ull * 1024 * 1024;

void send_json(httplib::Response& res, const json& body, int status = 200) {
    res.status = status;
    res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
}

void send_error(httplib::Response& res, const ForgeError& e) {
    send_json(res, error_payload(e), e.http_status());
}

// Maps every failure escaping a handler onto the error payload.
template<typename Handler>
void guarded(const char* route, httplib::Response& res, Handler&& handler) {
    try {
        handler();
    } catch (const ForgeError& e) {
        spdlog::error("❌ {} [{}]: {}", route, e.http_status(), e.what());
        send_error(res, e);
    } catch (const json::exception& e) {
        spdlog::error("❌ {} [400]: {}", route, e.what());
        send_error(res, BadInputError(std::string("Invalid request: ") + e.what()));
    } catch (const std::exception& e) {
        spdlog::error("❌ {} [500]: {}", route, e.what());
        send_json(res, {{"detail", e.what()}, {"kind", "Internal"}, {"status", 500}}, 500);
    }
}

// Runs a workflow inside a chunked text/event-stream response.
template<typename Workflow>
void stream_frames(httplib::Response& res, Workflow workflow) {
    res.set_header("Cache-Control", "no-cache");
    res.set_header("X-Accel-Buffering", "no");
    res.set_chunked_content_provider("text/event-stream",
        [workflow](size_t, httplib::DataSink& sink) {
            workflow([&sink](const json& frame) {
                const std::string chunk = "data: " + frame.dump(-1, ' ', false, json::error_handler_t::replace) + "\n\n";
                return sink.write(chunk.data(), chunk.size());
            });
            sink.done();
            return true;
        });
}

std::string required_string(const json& body, const char* key) {
    if (!body.contains(key) || !body[key].is_string() || body[key].get<std::string>().empty()) {
        throw BadInputError(std::string(key) + " is required");
    }
    return body[key].get<std::string>();
}

std::string text_of(const json& value) {
    if (value.is_null()) return "";
    return value.is_string() ? value.get<std::string>() : value.dump();
}

} // namespace

ForgeServer::ForgeServer(AppConfig config,
                         std::shared_ptr<SessionStore> store,
                         std::shared_ptr<DatasetLoader> loader,
                         std::shared_ptr<AnalysisOrchestrator> orchestrator)
    : config_(std::move(config)),
      store_(std::move(store)),
      loader_(std::move(loader)),
      orchestrator_(std::move(orchestrator)) {
    server_.new_task_queue = [] { return new httplib::ThreadPool(8); };
    server_.set_payload_max_length(kMaxPayloadBytes);
    setup_routes();
}

bool ForgeServer::run() {
    spdlog::info("🚀 Starting {} {} on {}:{}", config_.title, config_.version, config_.host, config_.port);
    return server_.listen(config_.host.c_str(), config_.port);
}

int ForgeServer::bind_to_any_port(const std::string& host) {
    return server_.bind_to_any_port(host.c_str());
}

bool ForgeServer::listen_after_bind() {
    return server_.listen_after_bind();
}

void ForgeServer::stop() {
    server_.stop();
}

json ForgeServer::parse_body(const httplib::Request& req) {
    if (req.body.empty()) return json::object();
    try {
        json body = json::parse(req.body);
        if (!body.is_object()) throw BadInputError("Request body must be a JSON object");
        return body;
    } catch (const json::parse_error& e) {
        throw BadInputError(std::string("Malformed JSON body: ") + e.what());
    }
}

CompletionEndpoint ForgeServer::endpoint_from(const json& body) const {
    CompletionEndpoint endpoint;
    endpoint.base_url = body.value("api_base_url", std::string());
    endpoint.api_key = body.value("api_key", std::string());
    endpoint.model = body.value("model_name", std::string());
    endpoint.temperature = body.value("temperature", config_.temperature);
    if (endpoint.base_url.empty()) endpoint.base_url = config_.api_base_url;
    if (endpoint.api_key.empty()) endpoint.api_key = config_.api_key;
    if (endpoint.model.empty()) endpoint.model = config_.model_name;
    return endpoint;
}

json ForgeServer::session_created(const Session& session) const {
    return {
        {"session_id", session.id},
        {"description", session.description},
        {"row_count", session.row_count},
        {"column_count", session.column_count}
    };
}

void ForgeServer::setup_routes() {
    server_.Options("/(.*)", [](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, PUT, DELETE, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type, Authorization");
        res.status = 204;
    });

    server_.set_pre_routing_handler([](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        return httplib::Server::HandlerResponse::Unhandled;
    });

    server_.Post("/load-data", [this](const httplib::Request& req, httplib::Response& res) {
        handle_load_data(req, res);
    });
    server_.Post("/upload-data", [this](const httplib::Request& req, httplib::Response& res) {
        handle_upload_data(req, res);
    });
    server_.Get("/session/:session_id", [this](const httplib::Request& req, httplib::Response& res) {
        handle_get_session(req, res);
    });
    server_.Delete("/session/:session_id", [this](const httplib::Request& req, httplib::Response& res) {
        handle_delete_session(req, res);
    });
    server_.Post("/cleanup-old-sessions", [this](const httplib::Request& req, httplib::Response& res) {
        handle_cleanup(req, res);
    });
    server_.Post("/execute-hypothesis-test", [this](const httplib::Request& req, httplib::Response& res) {
        handle_execute(req, res);
    });
    server_.Post("/generate-hypotheses", [this](const httplib::Request& req, httplib::Response& res) {
        handle_generate(req, res);
    });
    server_.Post("/test-hypothesis", [this](const httplib::Request& req, httplib::Response& res) {
        handle_test(req, res);
    });
    server_.Post("/synthesize", [this](const httplib::Request& req, httplib::Response& res) {
        handle_synthesize(req, res);
    });
    server_.Get("/config", [this](const httplib::Request& req, httplib::Response& res) {
        handle_config(req, res);
    });

    server_.Get("/api/admin/runs", [](const httplib::Request&, httplib::Response& res) {
        send_json(res, {{"runs", RunJournal::instance().to_json()}});
    });
}

void ForgeServer::handle_load_data(const httplib::Request& req, httplib::Response& res) {
    guarded("POST /load-data", res, [&] {
        const json body = parse_body(req);
        // file_path and demo_url are accepted as aliases of source.
        std::string source = body.value("source", std::string());
        if (source.empty()) source = body.value("file_path", std::string());
        if (source.empty()) source = body.value("demo_url", std::string());
        if (source.empty()) throw BadInputError("source is required");

        auto loaded = loader_->load(source);
        send_json(res, session_created(store_->create(loaded)));
    });
}

void ForgeServer::handle_upload_data(const httplib::Request& req, httplib::Response& res) {
    guarded("POST /upload-data", res, [&] {
        if (!req.has_file("file")) {
            throw BadInputError("Multipart field 'file' is required");
        }
        const auto file = req.get_file_value("file");
        if (file.filename.empty()) throw BadInputError("Uploaded file has no name");

        auto loaded = loader_->load_upload(file.filename, file.content);
        send_json(res, session_created(store_->create(loaded)));
    });
}

void ForgeServer::handle_get_session(const httplib::Request& req, httplib::Response& res) {
    guarded("GET /session", res, [&] {
        send_json(res, store_->get(req.path_params.at("session_id")).to_json());
    });
}

void ForgeServer::handle_delete_session(const httplib::Request& req, httplib::Response& res) {
    guarded("DELETE /session", res, [&] {
        const std::string id = req.path_params.at("session_id");
        store_->remove(id);
        send_json(res, {{"message", "Session " + id + " deleted"}});
    });
}

void ForgeServer::handle_cleanup(const httplib::Request& req, httplib::Response& res) {
    guarded("POST /cleanup-old-sessions", res, [&] {
        double hours = config_.max_age_hours;
        if (req.has_param("max_age_hours")) {
            const std::string raw = req.get_param_value("max_age_hours");
            try {
                size_t used = 0;
                hours = std::stod(raw, &used);
                if (used != raw.size()) throw std::invalid_argument(raw);
            } catch (const std::logic_error&) {
                throw BadInputError("max_age_hours must be a number: " + raw);
            }
        }
        if (std::isnan(hours) || hours < 0) throw BadInputError("max_age_hours must not be negative");

        const size_t removed = store_->sweep(max_age_from_hours(hours));
        send_json(res, {{"message", "Cleaned up " + std::to_string(removed) + " old sessions"}});
    });
}

void ForgeServer::handle_execute(const httplib::Request& req, httplib::Response& res) {
    guarded("POST /execute-hypothesis-test", res, [&] {
        const json body = parse_body(req);
        const std::string session_id = required_string(body, "session_id");
        const std::string code = body.value("analysis_code", std::string());

        auto outcome = orchestrator_->execute(session_id, code);
        send_json(res, {{"success", outcome.success}, {"p_value", outcome.p_value}});
    });
}

void ForgeServer::handle_generate(const httplib::Request& req, httplib::Response& res) {
    guarded("POST /generate-hypotheses", res, [&] {
        const json body = parse_body(req);
        GenerationRequest request;
        request.endpoint = endpoint_from(body);
        request.system_prompt = body.value("system_prompt", std::string());
        request.session_id = body.value("session_id", std::string());
        request.description = body.value("description", std::string());
        orchestrator_->validate(request);

        auto orchestrator = orchestrator_;
        stream_frames(res, [orchestrator, request](const FrameSink& sink) {
            orchestrator->generate_hypotheses(request, sink);
        });
    });
}

void ForgeServer::handle_test(const httplib::Request& req, httplib::Response& res) {
    guarded("POST /test-hypothesis", res, [&] {
        const json body = parse_body(req);
        TestRequest request;
        request.endpoint = endpoint_from(body);
        request.session_id = required_string(body, "session_id");
        request.hypothesis = required_string(body, "hypothesis");
        request.analysis_prompt = body.value("analysis_prompt", std::string());
        request.summary_prompt = body.value("summary_prompt", std::string());
        orchestrator_->validate(request);

        auto orchestrator = orchestrator_;
        stream_frames(res, [orchestrator, request](const FrameSink& sink) {
            orchestrator->test_hypothesis(request, sink);
        });
    });
}

void ForgeServer::handle_synthesize(const httplib::Request& req, httplib::Response& res) {
    guarded("POST /synthesize", res, [&] {
        const json body = parse_body(req);
        SynthesisRequest request;
        request.endpoint = endpoint_from(body);
        request.system_prompt = body.value("system_prompt", std::string());
        if (body.contains("hypotheses")) {
            for (const auto& h : body.at("hypotheses")) {
                request.hypotheses.push_back({
                    text_of(h.value("title", json())),
                    text_of(h.value("benefit", json())),
                    text_of(h.value("outcome", json()))
                });
            }
        }
        orchestrator_->validate(request);

        auto orchestrator = orchestrator_;
        stream_frames(res, [orchestrator, request](const FrameSink& sink) {
            orchestrator->synthesize(request, sink);
        });
    });
}

void ForgeServer::handle_config(const httplib::Request&, httplib::Response& res) {
    send_json(res, {
        {"app", {{"title", config_.title}, {"version", config_.version}}},
        {"defaults", {
            {"api_base_url", config_.api_base_url},
            {"model_name", config_.model_name},
            {"temperature", config_.temperature},
            {"max_age_hours", config_.max_age_hours}
        }},
        {"prompts", {
            {"hypothesis", config_.prompts.hypothesis},
            {"analysis", config_.prompts.analysis},
            {"summary", config_.prompts.summary},
            {"synthesis", config_.prompts.synthesis}
        }},
        {"json_schema", config_.json_schema},
        {"demos", config_.demos},
        {"api_key_configured", !config_.api_key.empty()}
    });
}

} // namespace hypoforge
