#include <csignal>
#include <memory>
#include <spdlog/spdlog.h>

#include "hypoforge/app_config.hpp"
#include "hypoforge/errors.hpp"
#include "hypoforge/logging.hpp"
#include "hypoforge/gateway/completion_gateway.hpp"
#include "hypoforge/orchestrator/analysis_orchestrator.hpp"
#include "hypoforge/sandbox/sandbox.hpp"
#include "hypoforge/server/forge_server.hpp"
#include "hypoforge/session/session_janitor.hpp"
#include "hypoforge/session/session_store.hpp"

namespace {
hypoforge::ForgeServer* g_server = nullptr;

void handle_signal(int) {
    if (g_server) g_server->stop();
}
}

int main(int argc, char* argv[]) {
    hypoforge::configure_logging();

    hypoforge::AppConfig config;
    try {
        config = argc > 1 ? hypoforge::AppConfig::load(argv[1]) : hypoforge::AppConfig::locate_and_load();
    } catch (const hypoforge::ConfigError& e) {
        spdlog::critical("❌ {}", e.what());
        return 1;
    }

    try {
        auto store = std::make_shared<hypoforge::SessionStore>(config.storage_directory);
        auto loader = std::make_shared<hypoforge::DatasetLoader>(store->directory() / "staging");
        auto sandbox = std::make_shared<hypoforge::CodeSandbox>(config.sandbox);
        auto gateway = std::make_shared<hypoforge::ChatCompletionsGateway>();

        std::string probe_detail;
        if (!sandbox->probe(&probe_detail)) {
            spdlog::warn("⚠️ Analysis interpreter not usable, hypothesis tests will fail: {}", probe_detail);
        }
        if (config.api_key.empty()) {
            spdlog::info("🔑 No default API key configured, requests must carry api_key");
        }

        auto orchestrator = std::make_shared<hypoforge::AnalysisOrchestrator>(
            store, gateway, sandbox, config.prompts, config.json_schema);

        hypoforge::SessionJanitor janitor(store, config.default_max_age(),
                                          std::chrono::minutes(config.sweep_interval_minutes));

        hypoforge::ForgeServer server(config, store, loader, orchestrator);
        g_server = &server;
        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        const bool ok = server.run();
        g_server = nullptr;
        if (!ok) {
            spdlog::critical("❌ Could not listen on {}:{}", config.host, config.port);
            return 1;
        }
        spdlog::info("👋 Shutting down");
    } catch (const hypoforge::ForgeError& e) {
        spdlog::critical("❌ Startup failed: {}", e.what());
        return 1;
    }
    return 0;
}
