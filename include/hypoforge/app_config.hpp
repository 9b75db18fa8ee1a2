#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <nlohmann/json.hpp>

namespace hypoforge {

// Hours to a sweep age. Values too large for seconds (infinity included)
// saturate at seconds::max(), which keeps every session.
inline std::chrono::seconds max_age_from_hours(double hours) {
    constexpr auto kMaxHours = std::chrono::seconds::max().count() / 3600;
    if (!(hours < static_cast<double>(kMaxHours))) return std::chrono::seconds::max();
    return std::chrono::seconds(static_cast<long long>(hours * 3600.0));
}

struct SandboxSettings {
    std::string interpreter = "python3";
    int timeout_seconds = 30;
    int cpu_seconds = 30;
    int memory_limit_mb = 2048;
    int max_output_kb = 256;
};

struct PromptSet {
    std::string hypothesis;
    std::string analysis;
    std::string summary;
    std::string synthesis;
};

struct AppConfig {
    // [app]
    std::string title = "Hypothesis Forge";
    std::string version = "1.0.0";
    std::string host = "0.0.0.0";
    int port = 8000;
    int grpc_port = 50051;

    // [defaults]
    std::string api_base_url = "https://api.openai.com/v1";
    std::string model_name = "gpt-4.1-nano";
    double temperature = 0.0;
    double max_age_hours = 24.0;
    int sweep_interval_minutes = 0;

    std::string api_key;
    std::string storage_directory;

    SandboxSettings sandbox;
    PromptSet prompts;
    nlohmann::json json_schema;
    nlohmann::json demos = nlohmann::json::array();

    std::chrono::seconds default_max_age() const { return max_age_from_hours(max_age_hours); }

    // Built-in defaults, including prompts and the hypotheses schema.
    static AppConfig defaults();

    // Parses a configuration document over the defaults. Throws ConfigError.
    static AppConfig from_json(const nlohmann::json& j);

    // Reads and parses a file. Throws ConfigError if unreadable or malformed.
    static AppConfig load(const std::string& path);

    // Searches the usual locations for config.json; defaults when none exists.
    static AppConfig locate_and_load();
};

nlohmann::json default_hypotheses_schema();

} // namespace hypoforge
