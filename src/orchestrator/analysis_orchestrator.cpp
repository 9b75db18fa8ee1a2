#include "hypoforge/orchestrator/analysis_orchestrator.hpp"
#include "hypoforge/errors.hpp"
#include "hypoforge/run_journal.hpp"
#include "hypoforge/sandbox/code_extractor.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <spdlog/spdlog.h>

namespace hypoforge {

using json = nlohmann::json;

namespace {

json failure_frame(const char* failed_stage, const std::exception& e) {
    json frame;
    if (const auto* forge = dynamic_cast<const ForgeError*>(&e)) {
        frame = error_payload(*forge);
    } else {
        frame = {{"detail", e.what()}, {"kind", "Internal"}, {"status", 500}};
    }
    frame["stage"] = test_stage_name(TestStage::Failed);
    frame["failed_stage"] = failed_stage;
    return frame;
}

const std::string& or_default(const std::string& value, const std::string& fallback) {
    return value.empty() ? fallback : value;
}

} // namespace

const char* test_stage_name(TestStage stage) {
    switch (stage) {
        case TestStage::AnalysisPending: return "analysis_pending";
        case TestStage::AnalysisComplete: return "analysis_complete";
        case TestStage::Executing: return "executing";
        case TestStage::Executed: return "executed";
        case TestStage::SummaryPending: return "summary_pending";
        case TestStage::Done: return "done";
        case TestStage::Failed: return "failed";
    }
    return "failed";
}

AnalysisOrchestrator::AnalysisOrchestrator(std::shared_ptr<SessionStore> store,
                                           std::shared_ptr<CompletionGateway> gateway,
                                           std::shared_ptr<CodeSandbox> sandbox,
                                           PromptSet prompts,
                                           json hypotheses_schema)
    : store_(std::move(store)),
      gateway_(std::move(gateway)),
      sandbox_(std::move(sandbox)),
      prompts_(std::move(prompts)),
      hypotheses_schema_(std::move(hypotheses_schema)) {}

std::string AnalysisOrchestrator::analysis_user_content(const std::string& hypothesis, const std::string& description) {
    return "Hypothesis: " + hypothesis + "\n\n" + description;
}

std::string AnalysisOrchestrator::summary_user_content(const std::string& hypothesis, const std::string& description,
                                                       const ExecutionOutcome& outcome) {
    char p[64];
    std::snprintf(p, sizeof(p), "%.6f", outcome.p_value);
    return "Hypothesis: " + hypothesis + "\n\n" + description + "\n\nResult: " +
           (outcome.success ? "true" : "false") + ". p-value: " + p;
}

std::string AnalysisOrchestrator::synthesis_user_content(const std::vector<HypothesisRecord>& hypotheses) {
    std::string content;
    for (const auto& h : hypotheses) {
        if (h.outcome.empty()) continue;
        if (!content.empty()) content += "\n\n";
        content += "Hypothesis: " + h.title + "\nBenefit: " + h.benefit + "\nResult: " + h.outcome;
    }
    return content;
}

json AnalysisOrchestrator::parse_hypotheses(const std::string& content) {
    json parsed;
    try {
        parsed = json::parse(content);
    } catch (const json::parse_error&) {
        throw UpstreamError("Hypothesis generation returned invalid JSON", 502, content);
    }
    if (!parsed.is_object() || !parsed.contains("hypotheses") || !parsed["hypotheses"].is_array()) {
        throw UpstreamError("Hypothesis generation returned no hypotheses list", 502, content);
    }

    json out = json::array();
    for (const auto& item : parsed["hypotheses"]) {
        if (!item.is_object()) continue;
        std::string title = item.value("hypothesis", item.value("title", std::string()));
        if (title.empty()) continue;
        out.push_back({{"title", std::move(title)}, {"benefit", item.value("benefit", std::string())}});
    }
    return out;
}

void AnalysisOrchestrator::validate(const GenerationRequest& request) const {
    if (request.description.empty()) {
        if (request.session_id.empty()) {
            throw BadInputError("Either description or session_id is required");
        }
        store_->get(request.session_id);
    }
}

void AnalysisOrchestrator::validate(const TestRequest& request) const {
    if (request.hypothesis.empty()) throw BadInputError("hypothesis is required");
    if (request.session_id.empty()) throw BadInputError("session_id is required");
    store_->get(request.session_id);
}

void AnalysisOrchestrator::validate(const SynthesisRequest& request) const {
    if (synthesis_user_content(request.hypotheses).empty()) {
        throw BadInputError("No tested hypotheses to synthesize");
    }
}

ExecutionOutcome AnalysisOrchestrator::execute(const std::string& session_id, const std::string& source_text) {
    ScratchDirectory scratch;
    const fs::path pinned = store_->pin_snapshot(session_id, scratch.path());
    return sandbox_->execute(source_text, pinned);
}

void AnalysisOrchestrator::generate_hypotheses(const GenerationRequest& request, const FrameSink& sink) {
    try {
        validate(request);
        const std::string description = request.description.empty()
            ? store_->get(request.session_id).description
            : request.description;

        CompletionRequest completion{or_default(request.system_prompt, prompts_.hypothesis), description, hypotheses_schema_};
        auto content = gateway_->stream(request.endpoint, completion, [&](const std::string& total) {
            return sink({{"stage", "generating"}, {"content", total}});
        });
        if (!content) return;

        json hypotheses = parse_hypotheses(*content);
        spdlog::info("💡 Generated {} hypotheses", hypotheses.size());
        sink({{"stage", "done"}, {"content", *content}, {"hypotheses", std::move(hypotheses)}});
    } catch (const std::exception& e) {
        spdlog::error("❌ Hypothesis generation failed: {}", e.what());
        sink(failure_frame("generating", e));
    }
}

void AnalysisOrchestrator::test_hypothesis(const TestRequest& request, const FrameSink& sink) {
    const auto started = std::chrono::steady_clock::now();
    TestStage stage = TestStage::AnalysisPending;

    RunRecord record;
    record.timestamp = static_cast<long long>(std::time(nullptr));
    record.session_id = request.session_id;
    record.hypothesis = request.hypothesis;

    auto finish = [&](TestStage reached, const char* failed_stage) {
        record.stage_reached = test_stage_name(reached);
        record.failed_stage = failed_stage ? failed_stage : "";
        record.duration_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - started).count();
        RunJournal::instance().add(record);
    };
    auto emit = [&](json frame) {
        frame["stage"] = test_stage_name(stage);
        return sink(frame);
    };

    try {
        validate(request);
        const std::string description = store_->get(request.session_id).description;
        spdlog::info("🔬 Testing hypothesis on session {}: {}", request.session_id, request.hypothesis);

        // 1. Analysis code, streamed live
        CompletionRequest analysis{or_default(request.analysis_prompt, prompts_.analysis),
                                   analysis_user_content(request.hypothesis, description), nullptr};
        auto analysis_text = gateway_->stream(request.endpoint, analysis, [&](const std::string& total) {
            return emit({{"analysis", total}});
        });
        if (!analysis_text) return finish(stage, "cancelled");

        stage = TestStage::AnalysisComplete;
        const std::string code = extract_code_block(*analysis_text);
        if (!emit({{"analysis", *analysis_text}, {"code", code}})) return finish(stage, "cancelled");

        // 2. Execution
        stage = TestStage::Executing;
        if (!emit(json::object())) return finish(stage, "cancelled");
        ScratchDirectory scratch;
        const fs::path pinned = store_->pin_snapshot(request.session_id, scratch.path());
        const ExecutionOutcome outcome = sandbox_->execute_code(code, pinned);
        record.success = outcome.success;
        record.p_value = outcome.p_value;

        stage = TestStage::Executed;
        if (!emit({{"success", outcome.success}, {"p_value", outcome.p_value}})) return finish(stage, "cancelled");

        // 3. Summary, streamed live
        stage = TestStage::SummaryPending;
        CompletionRequest summary{or_default(request.summary_prompt, prompts_.summary),
                                  summary_user_content(request.hypothesis, description, outcome), nullptr};
        auto summary_text = gateway_->stream(request.endpoint, summary, [&](const std::string& total) {
            return emit({{"summary", total}});
        });
        if (!summary_text) return finish(stage, "cancelled");

        stage = TestStage::Done;
        emit({{"success", outcome.success},
              {"p_value", outcome.p_value},
              {"analysis", *analysis_text},
              {"summary", *summary_text}});
        spdlog::info("✅ Hypothesis tested (success={}, p={:.6f})", outcome.success, outcome.p_value);
        finish(stage, nullptr);
    } catch (const std::exception& e) {
        // AnalysisComplete and Executed are instantaneous; a fault there belongs to the next stage.
        TestStage failed = stage;
        if (failed == TestStage::AnalysisComplete) failed = TestStage::Executing;
        if (failed == TestStage::Executed) failed = TestStage::SummaryPending;
        spdlog::error("❌ Hypothesis test failed during {}: {}", test_stage_name(failed), e.what());
        sink(failure_frame(test_stage_name(failed), e));
        finish(TestStage::Failed, test_stage_name(failed));
    }
}

void AnalysisOrchestrator::synthesize(const SynthesisRequest& request, const FrameSink& sink) {
    try {
        validate(request);
        CompletionRequest completion{or_default(request.system_prompt, prompts_.synthesis),
                                     synthesis_user_content(request.hypotheses), nullptr};
        auto content = gateway_->stream(request.endpoint, completion, [&](const std::string& total) {
            return sink({{"stage", "synthesizing"}, {"content", total}});
        });
        if (!content) return;
        sink({{"stage", "done"}, {"synthesis", *content}});
    } catch (const std::exception& e) {
        spdlog::error("❌ Synthesis failed: {}", e.what());
        sink(failure_frame("synthesizing", e));
    }
}

} // namespace hypoforge
