#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "hypoforge/rpc/analysis_service.hpp"
#include "hypoforge/sandbox/sandbox.hpp"
#include "hypoforge/uuid.hpp"

using namespace hypoforge;
namespace fs = std::filesystem;

class AnalysisServiceTest : public ::testing::Test {
protected:
    fs::path data_dir;
    std::shared_ptr<SessionStore> store;
    std::unique_ptr<AnalysisServiceImpl> service;

    void SetUp() override {
        data_dir = fs::temp_directory_path() / ("hypoforge-rpc-" + generate_uuid());
        fs::create_directories(data_dir);
        std::ofstream(data_dir / "cars.csv") << "make,price\nvw,100\nbmw,300\nvw,200\n";

        AppConfig config = AppConfig::defaults();
        store = std::make_shared<SessionStore>();
        auto loader = std::make_shared<DatasetLoader>(store->directory() / "staging");
        auto orchestrator = std::make_shared<AnalysisOrchestrator>(
            store, std::make_shared<ChatCompletionsGateway>(), std::make_shared<CodeSandbox>(config.sandbox),
            config.prompts, config.json_schema);
        service = std::make_unique<AnalysisServiceImpl>(store, loader, orchestrator, config);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(data_dir, ec);
    }

    std::string load_cars() {
        grpc::ServerContext ctx;
        rpc::LoadRequest req;
        req.set_source((data_dir / "cars.csv").string());
        rpc::SessionInfo info;
        auto status = service->LoadData(&ctx, &req, &info);
        EXPECT_TRUE(status.ok()) << status.error_message();
        EXPECT_EQ(info.row_count(), 3u);
        EXPECT_EQ(info.column_count(), 2u);
        return info.session_id();
    }

    grpc::Status cleanup(rpc::CleanupRequest req, rpc::CleanupReply* reply) {
        grpc::ServerContext ctx;
        return service->CleanupOldSessions(&ctx, &req, reply);
    }
};

TEST_F(AnalysisServiceTest, CleanupOldSessions) {
    load_cars();
    load_cars();

    rpc::CleanupReply reply;
    ASSERT_TRUE(cleanup({}, &reply).ok());
    EXPECT_EQ(reply.message(), "Cleaned up 0 old sessions");

    rpc::CleanupRequest huge;
    huge.set_max_age_hours(1e7);
    ASSERT_TRUE(cleanup(huge, &reply).ok());
    EXPECT_EQ(reply.removed(), 0u);
    EXPECT_EQ(store->size(), 2u);

    rpc::CleanupRequest negative;
    negative.set_max_age_hours(-1);
    EXPECT_EQ(cleanup(negative, &reply).error_code(), grpc::StatusCode::INVALID_ARGUMENT);

    rpc::CleanupRequest zero;
    zero.set_max_age_hours(0);
    ASSERT_TRUE(cleanup(zero, &reply).ok());
    EXPECT_EQ(reply.message(), "Cleaned up 2 old sessions");
    EXPECT_EQ(store->size(), 0u);
}

TEST_F(AnalysisServiceTest, DeleteSession) {
    const std::string id = load_cars();
    grpc::ServerContext ctx;
    rpc::SessionRef ref;
    ref.set_session_id(id);
    rpc::DeleteReply reply;
    ASSERT_TRUE(service->DeleteSession(&ctx, &ref, &reply).ok());
    EXPECT_EQ(reply.message(), "Session " + id + " deleted");
    EXPECT_EQ(service->DeleteSession(&ctx, &ref, &reply).error_code(), grpc::StatusCode::NOT_FOUND);
}

TEST_F(AnalysisServiceTest, LoadErrorsMapToStatus) {
    grpc::ServerContext ctx;
    rpc::LoadRequest req;
    req.set_source((data_dir / "missing.csv").string());
    rpc::SessionInfo info;
    EXPECT_EQ(service->LoadData(&ctx, &req, &info).error_code(), grpc::StatusCode::NOT_FOUND);

    EXPECT_EQ(to_grpc_status(BadInputError("x")).error_code(), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(to_grpc_status(UpstreamError("x", 429, "q")).error_code(), grpc::StatusCode::UNAVAILABLE);
}
