#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "hypoforge/app_config.hpp"
#include "hypoforge/gateway/completion_gateway.hpp"
#include "hypoforge/sandbox/sandbox.hpp"
#include "hypoforge/session/session_store.hpp"

namespace hypoforge {

enum class TestStage {
    AnalysisPending,
    AnalysisComplete,
    Executing,
    Executed,
    SummaryPending,
    Done,
    Failed
};

const char* test_stage_name(TestStage stage);

// One JSON object per event. Returning false means the consumer is gone.
using FrameSink = std::function<bool(const nlohmann::json& frame)>;

struct GenerationRequest {
    CompletionEndpoint endpoint;
    std::string system_prompt;     // empty selects the configured prompt
    std::string session_id;        // used when description is empty
    std::string description;
};

struct TestRequest {
    CompletionEndpoint endpoint;
    std::string session_id;
    std::string hypothesis;
    std::string analysis_prompt;   // empty selects the configured prompt
    std::string summary_prompt;    // empty selects the configured prompt
};

struct HypothesisRecord {
    std::string title;
    std::string benefit;
    std::string outcome;
};

struct SynthesisRequest {
    CompletionEndpoint endpoint;
    std::string system_prompt;     // empty selects the configured prompt
    std::vector<HypothesisRecord> hypotheses;
};

// Sequences completion calls and sandbox runs into the three streamed
// workflows. Every stream ends with exactly one "done" or "failed" frame
// unless the sink reported the consumer gone, in which case the upstream
// stream is abandoned and nothing further is emitted.
class AnalysisOrchestrator {
public:
    AnalysisOrchestrator(std::shared_ptr<SessionStore> store,
                         std::shared_ptr<CompletionGateway> gateway,
                         std::shared_ptr<CodeSandbox> sandbox,
                         PromptSet prompts,
                         nlohmann::json hypotheses_schema);

    // Precondition checks, run before a stream is opened so the caller can
    // still answer with a plain error status. Throw ForgeError.
    void validate(const GenerationRequest& request) const;
    void validate(const TestRequest& request) const;
    void validate(const SynthesisRequest& request) const;

    void generate_hypotheses(const GenerationRequest& request, const FrameSink& sink);
    void test_hypothesis(const TestRequest& request, const FrameSink& sink);
    void synthesize(const SynthesisRequest& request, const FrameSink& sink);

    // Runs source_text (code block extracted) against the session snapshot.
    // The snapshot is pinned first, so a concurrent delete cannot pull the
    // file away mid-run.
    ExecutionOutcome execute(const std::string& session_id, const std::string& source_text);

    static std::string analysis_user_content(const std::string& hypothesis, const std::string& description);
    static std::string summary_user_content(const std::string& hypothesis, const std::string& description,
                                            const ExecutionOutcome& outcome);
    static std::string synthesis_user_content(const std::vector<HypothesisRecord>& hypotheses);

    // [{title, benefit}] from the structured generation result.
    static nlohmann::json parse_hypotheses(const std::string& content);

private:
    std::shared_ptr<SessionStore> store_;
    std::shared_ptr<CompletionGateway> gateway_;
    std::shared_ptr<CodeSandbox> sandbox_;
    PromptSet prompts_;
    nlohmann::json hypotheses_schema_;
};

} // namespace hypoforge
