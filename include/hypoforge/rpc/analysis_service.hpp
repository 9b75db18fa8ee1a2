#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "analysis.grpc.pb.h"
#include "hypoforge/app_config.hpp"
#include "hypoforge/dataset/dataset_loader.hpp"
#include "hypoforge/errors.hpp"
#include "hypoforge/gateway/completion_gateway.hpp"
#include "hypoforge/orchestrator/analysis_orchestrator.hpp"
#include "hypoforge/session/session_store.hpp"

namespace hypoforge {

// ForgeError kinds mapped onto gRPC status codes.
grpc::Status to_grpc_status(const ForgeError& e);

// gRPC face of the session store and the analysis workflows. Streaming
// calls carry the same JSON frames as the HTTP event stream.
class AnalysisServiceImpl final : public rpc::AnalysisService::Service {
public:
    AnalysisServiceImpl(std::shared_ptr<SessionStore> store,
                        std::shared_ptr<DatasetLoader> loader,
                        std::shared_ptr<AnalysisOrchestrator> orchestrator,
                        AppConfig config);

    grpc::Status LoadData(grpc::ServerContext* context,
                          const rpc::LoadRequest* request,
                          rpc::SessionInfo* reply) override;

    grpc::Status DeleteSession(grpc::ServerContext* context,
                               const rpc::SessionRef* request,
                               rpc::DeleteReply* reply) override;

    grpc::Status CleanupOldSessions(grpc::ServerContext* context,
                                    const rpc::CleanupRequest* request,
                                    rpc::CleanupReply* reply) override;

    grpc::Status GenerateHypotheses(grpc::ServerContext* context,
                                    const rpc::GenerateRequest* request,
                                    grpc::ServerWriter<rpc::AnalysisFrame>* writer) override;

    grpc::Status TestHypothesis(grpc::ServerContext* context,
                                const rpc::TestRequest* request,
                                grpc::ServerWriter<rpc::AnalysisFrame>* writer) override;

    grpc::Status Synthesize(grpc::ServerContext* context,
                            const rpc::SynthesizeRequest* request,
                            grpc::ServerWriter<rpc::AnalysisFrame>* writer) override;

private:
    std::shared_ptr<SessionStore> store_;
    std::shared_ptr<DatasetLoader> loader_;
    std::shared_ptr<AnalysisOrchestrator> orchestrator_;
    AppConfig config_;

    CompletionEndpoint endpoint_from(const rpc::Endpoint& e) const;
};

} // namespace hypoforge
