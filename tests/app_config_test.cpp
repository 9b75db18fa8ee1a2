#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include "hypoforge/app_config.hpp"
#include "hypoforge/errors.hpp"
#include "hypoforge/uuid.hpp"

using namespace hypoforge;
using json = nlohmann::json;
namespace fs = std::filesystem;

class AppConfigTest : public ::testing::Test {
protected:
    void SetUp() override { ::unsetenv("HYPOFORGE_API_KEY"); }
    void TearDown() override { ::unsetenv("HYPOFORGE_API_KEY"); }
};

TEST_F(AppConfigTest, DefaultsCarryPromptsAndSchema) {
    AppConfig cfg = AppConfig::defaults();
    EXPECT_FALSE(cfg.prompts.hypothesis.empty());
    EXPECT_NE(cfg.prompts.analysis.find("test_hypothesis"), std::string::npos);
    EXPECT_FALSE(cfg.prompts.summary.empty());
    EXPECT_FALSE(cfg.prompts.synthesis.empty());
    EXPECT_EQ(cfg.json_schema["name"], "HypothesesResponse");
    EXPECT_EQ(cfg.default_max_age(), std::chrono::hours(24));
}

TEST_F(AppConfigTest, SectionsOverrideDefaults) {
    json j = {
        {"app", {{"title", "Forge"}, {"port", 9000}}},
        {"defaults", {{"model_name", "m"}, {"temperature", 0.5}, {"max_age_hours", 2}}},
        {"sandbox", {{"timeout_seconds", 5}, {"interpreter", "/usr/bin/python3"}}},
        {"prompts", {{"summary", "Be brief."}}},
        {"demos", {{{"title", "Cars"}, {"url", "https://x/cars.csv"}}}}
    };
    AppConfig cfg = AppConfig::from_json(j);
    EXPECT_EQ(cfg.title, "Forge");
    EXPECT_EQ(cfg.port, 9000);
    EXPECT_EQ(cfg.model_name, "m");
    EXPECT_DOUBLE_EQ(cfg.temperature, 0.5);
    EXPECT_EQ(cfg.default_max_age(), std::chrono::hours(2));
    EXPECT_EQ(cfg.sandbox.timeout_seconds, 5);
    EXPECT_EQ(cfg.sandbox.interpreter, "/usr/bin/python3");
    EXPECT_EQ(cfg.prompts.summary, "Be brief.");
    EXPECT_EQ(cfg.prompts.analysis, AppConfig::defaults().prompts.analysis);
    EXPECT_EQ(cfg.demos.size(), 1u);
}

TEST_F(AppConfigTest, HugeMaxAgeSaturates) {
    AppConfig cfg = AppConfig::from_json({{"defaults", {{"max_age_hours", 1e300}}}});
    EXPECT_EQ(cfg.default_max_age(), std::chrono::seconds::max());
    EXPECT_EQ(max_age_from_hours(std::numeric_limits<double>::infinity()), std::chrono::seconds::max());
    EXPECT_EQ(max_age_from_hours(1.5), std::chrono::seconds(5400));
}

TEST_F(AppConfigTest, InvalidValuesAreConfigErrors) {
    EXPECT_THROW(AppConfig::from_json(json::array()), ConfigError);
    EXPECT_THROW(AppConfig::from_json({{"app", {{"port", "eighty"}}}}), ConfigError);
    EXPECT_THROW(AppConfig::from_json({{"app", {{"port", 70000}}}}), ConfigError);
    EXPECT_THROW(AppConfig::from_json({{"defaults", {{"max_age_hours", -1}}}}), ConfigError);
    EXPECT_THROW(AppConfig::from_json({{"sandbox", {{"timeout_seconds", 0}}}}), ConfigError);
    EXPECT_THROW(AppConfig::from_json({{"json_schema", {{"name", "x"}}}}), ConfigError);
    EXPECT_THROW(AppConfig::from_json({{"demos", "none"}}), ConfigError);
}

TEST_F(AppConfigTest, EnvironmentKeyWins) {
    ::setenv("HYPOFORGE_API_KEY", "env-key", 1);
    AppConfig cfg = AppConfig::from_json({{"api_key", "file-key"}});
    EXPECT_EQ(cfg.api_key, "env-key");
}

TEST_F(AppConfigTest, LoadFromFile) {
    const fs::path path = fs::temp_directory_path() / ("hypoforge-config-" + generate_uuid() + ".json");
    std::ofstream(path) << R"({"app": {"title": "From File"}, "api_key": "k"})";
    AppConfig cfg = AppConfig::load(path.string());
    EXPECT_EQ(cfg.title, "From File");
    EXPECT_EQ(cfg.api_key, "k");

    std::ofstream(path) << "{ broken";
    EXPECT_THROW(AppConfig::load(path.string()), ConfigError);
    fs::remove(path);

    EXPECT_THROW(AppConfig::load(path.string()), ConfigError);
}
