#include "hypoforge/rpc/analysis_service.hpp"
#include <cmath>
#include <spdlog/spdlog.h>

namespace hypoforge {

using nlohmann::json;

namespace {

// A cancelled call or a failed Write stops the workflow and its upstream stream.
FrameSink frame_writer(grpc::ServerContext* context, grpc::ServerWriter<rpc::AnalysisFrame>* writer) {
    return [context, writer](const json& frame) {
        if (context->IsCancelled()) return false;
        rpc::AnalysisFrame out;
        out.set_stage(frame.value("stage", ""));
        out.set_payload(frame.dump(-1, ' ', false, json::error_handler_t::replace));
        return writer->Write(out);
    };
}

grpc::Status finish(grpc::ServerContext* context) {
    return context->IsCancelled() ? grpc::Status::CANCELLED : grpc::Status::OK;
}

} // namespace

grpc::Status to_grpc_status(const ForgeError& e) {
    switch (e.kind()) {
        case ErrorKind::NotFound: return {grpc::StatusCode::NOT_FOUND, e.what()};
        case ErrorKind::BadInput: return {grpc::StatusCode::INVALID_ARGUMENT, e.what()};
        case ErrorKind::PermissionDenied: return {grpc::StatusCode::PERMISSION_DENIED, e.what()};
        case ErrorKind::UpstreamError: return {grpc::StatusCode::UNAVAILABLE, e.what()};
        default: return {grpc::StatusCode::INTERNAL, e.what()};
    }
}

AnalysisServiceImpl::AnalysisServiceImpl(std::shared_ptr<SessionStore> store,
                                         std::shared_ptr<DatasetLoader> loader,
                                         std::shared_ptr<AnalysisOrchestrator> orchestrator,
                                         AppConfig config)
    : store_(std::move(store)),
      loader_(std::move(loader)),
      orchestrator_(std::move(orchestrator)),
      config_(std::move(config)) {}

CompletionEndpoint AnalysisServiceImpl::endpoint_from(const rpc::Endpoint& e) const {
    CompletionEndpoint endpoint;
    endpoint.base_url = e.api_base_url().empty() ? config_.api_base_url : e.api_base_url();
    endpoint.api_key = e.api_key().empty() ? config_.api_key : e.api_key();
    endpoint.model = e.model_name().empty() ? config_.model_name : e.model_name();
    endpoint.temperature = config_.temperature;
    return endpoint;
}

grpc::Status AnalysisServiceImpl::LoadData(grpc::ServerContext*,
                                           const rpc::LoadRequest* request,
                                           rpc::SessionInfo* reply) {
    try {
        auto session = store_->create(loader_->load(request->source()));
        reply->set_session_id(session.id);
        reply->set_description(session.description);
        reply->set_row_count(session.row_count);
        reply->set_column_count(session.column_count);
        return grpc::Status::OK;
    } catch (const ForgeError& e) {
        spdlog::error("❌ LoadData: {}", e.what());
        return to_grpc_status(e);
    }
}

grpc::Status AnalysisServiceImpl::DeleteSession(grpc::ServerContext*,
                                                const rpc::SessionRef* request,
                                                rpc::DeleteReply* reply) {
    try {
        store_->remove(request->session_id());
        reply->set_message("Session " + request->session_id() + " deleted");
        return grpc::Status::OK;
    } catch (const ForgeError& e) {
        return to_grpc_status(e);
    }
}

grpc::Status AnalysisServiceImpl::CleanupOldSessions(grpc::ServerContext*,
                                                     const rpc::CleanupRequest* request,
                                                     rpc::CleanupReply* reply) {
    const double hours = request->has_max_age_hours() ? request->max_age_hours() : config_.max_age_hours;
    if (std::isnan(hours) || hours < 0) {
        return {grpc::StatusCode::INVALID_ARGUMENT, "max_age_hours must not be negative"};
    }
    const size_t removed = store_->sweep(max_age_from_hours(hours));
    reply->set_removed(removed);
    reply->set_message("Cleaned up " + std::to_string(removed) + " old sessions");
    return grpc::Status::OK;
}

grpc::Status AnalysisServiceImpl::GenerateHypotheses(grpc::ServerContext* context,
                                                     const rpc::GenerateRequest* request,
                                                     grpc::ServerWriter<rpc::AnalysisFrame>* writer) {
    GenerationRequest req;
    req.endpoint = endpoint_from(request->endpoint());
    req.system_prompt = request->system_prompt();
    req.session_id = request->session_id();
    req.description = request->description();
    try {
        orchestrator_->validate(req);
    } catch (const ForgeError& e) {
        return to_grpc_status(e);
    }
    orchestrator_->generate_hypotheses(req, frame_writer(context, writer));
    return finish(context);
}

grpc::Status AnalysisServiceImpl::TestHypothesis(grpc::ServerContext* context,
                                                 const rpc::TestRequest* request,
                                                 grpc::ServerWriter<rpc::AnalysisFrame>* writer) {
    TestRequest req;
    req.endpoint = endpoint_from(request->endpoint());
    req.session_id = request->session_id();
    req.hypothesis = request->hypothesis();
    req.analysis_prompt = request->analysis_prompt();
    req.summary_prompt = request->summary_prompt();
    try {
        orchestrator_->validate(req);
    } catch (const ForgeError& e) {
        return to_grpc_status(e);
    }
    orchestrator_->test_hypothesis(req, frame_writer(context, writer));
    return finish(context);
}

grpc::Status AnalysisServiceImpl::Synthesize(grpc::ServerContext* context,
                                             const rpc::SynthesizeRequest* request,
                                             grpc::ServerWriter<rpc::AnalysisFrame>* writer) {
    SynthesisRequest req;
    req.endpoint = endpoint_from(request->endpoint());
    req.system_prompt = request->system_prompt();
    for (const auto& h : request->hypotheses()) {
        req.hypotheses.push_back({h.title(), h.benefit(), h.outcome()});
    }
    try {
        orchestrator_->validate(req);
    } catch (const ForgeError& e) {
        return to_grpc_status(e);
    }
    orchestrator_->synthesize(req, frame_writer(context, writer));
    return finish(context);
}

} // namespace hypoforge
