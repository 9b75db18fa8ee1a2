#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>
#include <memory>

#include "hypoforge/app_config.hpp"
#include "hypoforge/dataset/dataset_loader.hpp"
#include "hypoforge/errors.hpp"
#include "hypoforge/logging.hpp"
#include "hypoforge/gateway/completion_gateway.hpp"
#include "hypoforge/orchestrator/analysis_orchestrator.hpp"
#include "hypoforge/rpc/analysis_service.hpp"
#include "hypoforge/sandbox/sandbox.hpp"
#include "hypoforge/session/session_janitor.hpp"
#include "hypoforge/session/session_store.hpp"

using grpc::Server;
using grpc::ServerBuilder;

int main(int argc, char* argv[]) {
    hypoforge::configure_logging();

    hypoforge::AppConfig config;
    try {
        config = argc > 1 ? hypoforge::AppConfig::load(argv[1]) : hypoforge::AppConfig::locate_and_load();
    } catch (const hypoforge::ConfigError& e) {
        spdlog::critical("❌ {}", e.what());
        return 1;
    }
    const std::string server_address = config.host + ":" + std::to_string(config.grpc_port);

    // 1. Core services
    std::shared_ptr<hypoforge::SessionStore> store;
    try {
        store = std::make_shared<hypoforge::SessionStore>(config.storage_directory);
    } catch (const hypoforge::ForgeError& e) {
        spdlog::critical("❌ Startup failed: {}", e.what());
        return 1;
    }
    auto loader = std::make_shared<hypoforge::DatasetLoader>(store->directory() / "staging");
    auto sandbox = std::make_shared<hypoforge::CodeSandbox>(config.sandbox);
    auto gateway = std::make_shared<hypoforge::ChatCompletionsGateway>();
    auto orchestrator = std::make_shared<hypoforge::AnalysisOrchestrator>(
        store, gateway, sandbox, config.prompts, config.json_schema);

    hypoforge::SessionJanitor janitor(store, config.default_max_age(),
                                      std::chrono::minutes(config.sweep_interval_minutes));

    hypoforge::AnalysisServiceImpl service(store, loader, orchestrator, config);

    // 2. Start gRPC server
    ServerBuilder builder;
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
    builder.RegisterService(&service);
    std::unique_ptr<Server> server(builder.BuildAndStart());
    if (!server) {
        spdlog::critical("❌ Could not listen on {}", server_address);
        return 1;
    }

    spdlog::info("🚀 Analysis gRPC service listening on {}", server_address);
    server->Wait();
    return 0;
}
