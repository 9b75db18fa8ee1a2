#include "hypoforge/app_config.hpp"
#include "hypoforge/errors.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>

namespace hypoforge {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

const char* kAnalysisPrompt = R"(You are an expert data scientist. Given a hypothesis and dataset description, write Python code to test this hypothesis using appropriate statistical methods.

CRITICAL: Your code must follow this exact pattern:

```python
import pandas as pd
import scipy.stats as stats
import numpy as np

def test_hypothesis(df):
    # Your analysis code here
    # Use appropriate statistical tests (t-test, chi-square, correlation, etc.)
    # Calculate p-value
    # Return (is_significant, p_value) where is_significant is boolean

    # Example:
    # statistic, p_value = stats.ttest_ind(group1, group2)
    # return p_value < 0.05, p_value

    pass
```

Use the most appropriate statistical test based on the hypothesis and data types. Always return exactly (boolean, float).)";

const char* kSummaryPrompt = R"(You are an expert data analyst.
Given a hypothesis and its outcome, provide a plain English summary of the findings as a crisp H5 heading (#####), followed by 1-2 concise supporting sentences.
Highlight in **bold** the keywords in the supporting statements.
Do not mention the p-value but _interpret_ it to support the conclusion quantitatively.)";

const char* kSynthesisPrompt = R"(Given the below hypotheses and results, summarize the key takeaways and actions in Markdown.
Begin with the hypotheses with lowest p-values AND highest business impact. Ignore results with errors.
Use action titles has H5 (#####). Just reading titles should tell the audience EXACTLY what to do.
Below each, add supporting bullet points that
  - PROVE the action title, mentioning which hypotheses led to this conclusion.
  - Do not mention the p-value but _interpret_ it to support the action
  - Highlight key phrases in **bold**.
Finally, after a break (---) add a 1-paragraph executive summary section (H5) summarizing these actions.)";

// Copies a field when present; a wrong type surfaces as json::type_error.
template<typename T>
void read_field(const json& section, const char* key, T& out) {
    if (section.contains(key) && !section[key].is_null()) {
        out = section.at(key).get<T>();
    }
}

} // namespace

json default_hypotheses_schema() {
    return json{
        {"name", "HypothesesResponse"},
        {"schema", {
            {"type", "object"},
            {"required", {"hypotheses"}},
            {"properties", {
                {"hypotheses", {
                    {"type", "array"},
                    {"items", {
                        {"type", "object"},
                        {"required", {"hypothesis", "benefit"}},
                        {"properties", {
                            {"hypothesis", {{"type", "string"}}},
                            {"benefit", {{"type", "string"}}}
                        }}
                    }}
                }}
            }}
        }}
    };
}

AppConfig AppConfig::defaults() {
    AppConfig cfg;
    cfg.prompts.hypothesis =
        "You are an expert data analyst. Generate hypotheses that would be valuable to test on this "
        "dataset. Each hypothesis should be clear, specific, and testable.";
    cfg.prompts.analysis = kAnalysisPrompt;
    cfg.prompts.summary = kSummaryPrompt;
    cfg.prompts.synthesis = kSynthesisPrompt;
    cfg.json_schema = default_hypotheses_schema();
    return cfg;
}

AppConfig AppConfig::from_json(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("Configuration root must be a JSON object");
    }

    AppConfig cfg = defaults();
    try {
        if (j.contains("app")) {
            const auto& app = j.at("app");
            read_field(app, "title", cfg.title);
            read_field(app, "version", cfg.version);
            read_field(app, "host", cfg.host);
            read_field(app, "port", cfg.port);
            read_field(app, "grpc_port", cfg.grpc_port);
        }
        if (j.contains("defaults")) {
            const auto& d = j.at("defaults");
            read_field(d, "api_base_url", cfg.api_base_url);
            read_field(d, "model_name", cfg.model_name);
            read_field(d, "temperature", cfg.temperature);
            read_field(d, "max_age_hours", cfg.max_age_hours);
            read_field(d, "sweep_interval_minutes", cfg.sweep_interval_minutes);
        }
        if (j.contains("storage")) {
            read_field(j.at("storage"), "directory", cfg.storage_directory);
        }
        if (j.contains("sandbox")) {
            const auto& s = j.at("sandbox");
            read_field(s, "interpreter", cfg.sandbox.interpreter);
            read_field(s, "timeout_seconds", cfg.sandbox.timeout_seconds);
            read_field(s, "cpu_seconds", cfg.sandbox.cpu_seconds);
            read_field(s, "memory_limit_mb", cfg.sandbox.memory_limit_mb);
            read_field(s, "max_output_kb", cfg.sandbox.max_output_kb);
        }
        if (j.contains("prompts")) {
            const auto& p = j.at("prompts");
            read_field(p, "hypothesis", cfg.prompts.hypothesis);
            read_field(p, "analysis", cfg.prompts.analysis);
            read_field(p, "summary", cfg.prompts.summary);
            read_field(p, "synthesis", cfg.prompts.synthesis);
        }
        if (j.contains("json_schema")) {
            const auto& schema = j.at("json_schema");
            if (!schema.is_object() || !schema.contains("schema")) {
                throw ConfigError("json_schema must be an object with a 'schema' member");
            }
            cfg.json_schema = schema;
        }
        if (j.contains("demos")) {
            if (!j.at("demos").is_array()) throw ConfigError("demos must be an array");
            cfg.demos = j.at("demos");
        }
        read_field(j, "api_key", cfg.api_key);
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid configuration: ") + e.what());
    }

    if (cfg.port <= 0 || cfg.port > 65535) throw ConfigError("app.port out of range");
    if (cfg.max_age_hours < 0) throw ConfigError("defaults.max_age_hours must not be negative");
    if (cfg.sandbox.timeout_seconds <= 0) throw ConfigError("sandbox.timeout_seconds must be positive");

    if (const char* env_key = std::getenv("HYPOFORGE_API_KEY")) {
        if (*env_key) cfg.api_key = env_key;
    }
    return cfg;
}

AppConfig AppConfig::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw ConfigError("Configuration file not readable: " + path);
    }
    json j;
    try {
        j = json::parse(f);
    } catch (const json::parse_error& e) {
        throw ConfigError("Malformed configuration " + path + ": " + e.what());
    }
    spdlog::info("⚙️  Configuration loaded from {}", path);
    return from_json(j);
}

AppConfig AppConfig::locate_and_load() {
    std::vector<std::string> search_paths = {
        "config.json",
        "../config.json",
        "build/config.json",
        "../../config.json"
    };

    for (const auto& path : search_paths) {
        std::error_code ec;
        if (fs::is_regular_file(path, ec)) {
            return load(path);
        }
    }

    spdlog::warn("⚠️ No config.json found, running with built-in defaults");
    return from_json(json::object());
}

} // namespace hypoforge
