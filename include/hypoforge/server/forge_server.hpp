#pragma once

#include <memory>
#include <string>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "hypoforge/app_config.hpp"
#include "hypoforge/dataset/dataset_loader.hpp"
#include "hypoforge/orchestrator/analysis_orchestrator.hpp"
#include "hypoforge/session/session_store.hpp"

namespace hypoforge {

// HTTP surface. JSON in, JSON out; the three analysis workflows answer with
// text/event-stream, one "data: <json>" frame per event.
class ForgeServer {
public:
    ForgeServer(AppConfig config,
                std::shared_ptr<SessionStore> store,
                std::shared_ptr<DatasetLoader> loader,
                std::shared_ptr<AnalysisOrchestrator> orchestrator);

    // Blocks until stop(). False when the address cannot be bound.
    bool run();

    // For tests: bind an ephemeral port, then serve from another thread.
    int bind_to_any_port(const std::string& host = "127.0.0.1");
    bool listen_after_bind();

    void stop();
    bool is_running() const { return server_.is_running(); }
    void wait_until_ready() const { server_.wait_until_ready(); }

    // Completion endpoint for a request, falling back to configured defaults.
    CompletionEndpoint endpoint_from(const nlohmann::json& body) const;

    static nlohmann::json parse_body(const httplib::Request& req);

private:
    AppConfig config_;
    httplib::Server server_;
    std::shared_ptr<SessionStore> store_;
    std::shared_ptr<DatasetLoader> loader_;
    std::shared_ptr<AnalysisOrchestrator> orchestrator_;

    void setup_routes();

    void handle_load_data(const httplib::Request& req, httplib::Response& res);
    void handle_upload_data(const httplib::Request& req, httplib::Response& res);
    void handle_get_session(const httplib::Request& req, httplib::Response& res);
    void handle_delete_session(const httplib::Request& req, httplib::Response& res);
    void handle_cleanup(const httplib::Request& req, httplib::Response& res);
    void handle_execute(const httplib::Request& req, httplib::Response& res);
    void handle_generate(const httplib::Request& req, httplib::Response& res);
    void handle_test(const httplib::Request& req, httplib::Response& res);
    void handle_synthesize(const httplib::Request& req, httplib::Response& res);
    void handle_config(const httplib::Request& req, httplib::Response& res);

    nlohmann::json session_created(const Session& session) const;
};

} // namespace hypoforge
