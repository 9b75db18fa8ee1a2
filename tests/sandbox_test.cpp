#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "hypoforge/dataset/dataset_loader.hpp"
#include "hypoforge/errors.hpp"
#include "hypoforge/gateway/completion_gateway.hpp"
#include "hypoforge/orchestrator/analysis_orchestrator.hpp"
#include "hypoforge/sandbox/sandbox.hpp"
#include "hypoforge/session/session_store.hpp"

using namespace hypoforge;
namespace fs = std::filesystem;

class SandboxTest : public ::testing::Test {
protected:
    SandboxSettings settings;
    std::unique_ptr<CodeSandbox> sandbox;
    std::unique_ptr<ScratchDirectory> scratch;
    fs::path snapshot;

    void SetUp() override {
        settings.timeout_seconds = 20;
        settings.cpu_seconds = 20;
        sandbox = std::make_unique<CodeSandbox>(settings);

        std::string detail;
        if (!sandbox->probe(&detail)) {
            GTEST_SKIP() << "python3 with pandas/numpy/scipy not available: " << detail;
        }

        scratch = std::make_unique<ScratchDirectory>();
        snapshot = scratch->path() / "snapshot.json";
        std::vector<Column> cols;
        cols.push_back(Column::numeric("score", {1, 2, 3, 4, 5}, {0, 0, 0, 0, 0}, true));
        cols.push_back(Column::numeric("weight", {1.5, 0, 2.5, 3.5, 4.5}, {0, 1, 0, 0, 0}));
        cols.push_back(Column::textual("group", {"a", "b", "a", "b", "a"}, MissingMask(5, 0)));
        cols.push_back(Column::temporal("day", {0, 86400, 172800, 259200, 345600}, MissingMask(5, 0)));
        Dataset(std::move(cols)).write_snapshot(snapshot);
    }

    ExecutionOutcome run(const std::string& code) {
        return sandbox->execute_code(code, snapshot);
    }

    std::string error_of(const std::string& code) {
        try {
            run(code);
        } catch (const ExecutionError& e) {
            return e.what();
        }
        return "";
    }
};

TEST_F(SandboxTest, ReturnsOutcome) {
    auto outcome = run(
        "def test_hypothesis(df):\n"
        "    return True, 0.05\n");
    EXPECT_TRUE(outcome.success);
    EXPECT_DOUBLE_EQ(outcome.p_value, 0.05);
}

TEST_F(SandboxTest, ExtractsFencedCode) {
    auto outcome = sandbox->execute(
        "Some prose.\n```python\ndef test_hypothesis(df):\n    return (False, 1)\n```\n", snapshot);
    EXPECT_FALSE(outcome.success);
    EXPECT_DOUBLE_EQ(outcome.p_value, 1.0);
}

TEST_F(SandboxTest, DataFrameMatchesSnapshot) {
    auto outcome = run(
        "def test_hypothesis(df):\n"
        "    ok = (len(df) == 5\n"
        "          and str(df['score'].dtype) == 'int64'\n"
        "          and df['weight'].isna().sum() == 1\n"
        "          and str(df['day'].dtype).startswith('datetime64')\n"
        "          and list(df.columns) == ['score', 'weight', 'group', 'day'])\n"
        "    r = stats.pearsonr(df['score'], df['score'] * 2)\n"
        "    return ok, float(np.clip(r[1], 0, 1))\n");
    EXPECT_TRUE(outcome.success);
}

TEST_F(SandboxTest, MissingEntryPoint) {
    EXPECT_NE(error_of("x = 1\n").find("test_hypothesis function not found"), std::string::npos);
}

TEST_F(SandboxTest, WrongReturnShape) {
    EXPECT_NE(error_of("def test_hypothesis(df):\n    return 0.5\n").find("invalid return format"),
              std::string::npos);
}

TEST_F(SandboxTest, PValueOutOfRange) {
    EXPECT_NE(error_of("def test_hypothesis(df):\n    return True, 1.5\n").find("p-value out of range"),
              std::string::npos);
    EXPECT_NE(error_of("def test_hypothesis(df):\n    return True, float('nan')\n").find("p-value out of range"),
              std::string::npos);
}

TEST_F(SandboxTest, RaisedExceptionIsReported) {
    const std::string err = error_of("def test_hypothesis(df):\n    return df['nope'], 0.1\n");
    EXPECT_NE(err.find("Code execution error: KeyError"), std::string::npos);
}

TEST_F(SandboxTest, SyntaxErrorIsReported) {
    EXPECT_NE(error_of("def test_hypothesis(df)\n    return True, 0.1\n").find("SyntaxError"), std::string::npos);
}

TEST_F(SandboxTest, PrintingCannotSpoofResult) {
    auto outcome = run(
        "print('{\"ok\": true, \"success\": true, \"p_value\": 0.0}')\n"
        "def test_hypothesis(df):\n"
        "    print('noise ' * 100000)\n"
        "    return False, 0.9\n");
    EXPECT_FALSE(outcome.success);
    EXPECT_DOUBLE_EQ(outcome.p_value, 0.9);
}

TEST_F(SandboxTest, SystemExitIsCaught) {
    EXPECT_NE(error_of("import sys\ndef test_hypothesis(df):\n    sys.exit(3)\n").find("SystemExit"),
              std::string::npos);
}

TEST_F(SandboxTest, WallClockTimeout) {
    SandboxSettings quick = settings;
    quick.timeout_seconds = 2;
    CodeSandbox short_box(quick);
    const auto started = std::chrono::steady_clock::now();
    try {
        short_box.execute_code("import time\ndef test_hypothesis(df):\n    time.sleep(60)\n", snapshot);
        FAIL() << "expected ExecutionError";
    } catch (const ExecutionError& e) {
        EXPECT_NE(std::string(e.what()).find("timed out"), std::string::npos);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(15));
}

TEST_F(SandboxTest, LingeringGrandchildDoesNotDelayResult) {
    SandboxSettings quick = settings;
    quick.timeout_seconds = 10;
    CodeSandbox short_box(quick);
    const auto started = std::chrono::steady_clock::now();
    auto outcome = short_box.execute_code(
        "import subprocess\n"
        "def test_hypothesis(df):\n"
        "    subprocess.Popen(['sleep', '60'])\n"
        "    return True, 0.2\n", snapshot);
    EXPECT_TRUE(outcome.success);
    EXPECT_DOUBLE_EQ(outcome.p_value, 0.2);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(8));
}

TEST_F(SandboxTest, LoadTestDeleteEndToEnd) {
    const fs::path csv = scratch->path() / "trial.csv";
    std::ofstream(csv) << "arm,score,dose,visit\n"
                          "a,1.0,10,2024-01-01\n"
                          "b,2.5,20,2024-01-02\n"
                          "a,1.5,10,2024-01-03\n"
                          "b,3.0,20,2024-01-04\n"
                          "a,1.2,10,2024-01-05\n";

    auto store = std::make_shared<SessionStore>();
    DatasetLoader loader(scratch->path() / "staging");
    auto loaded = loader.load(csv.string());
    ASSERT_EQ(loaded.dataset.row_count(), 5u);
    ASSERT_EQ(loaded.dataset.column_count(), 4u);
    const std::string id = store->create(loaded).id;

    AnalysisOrchestrator orchestrator(store, std::make_shared<ChatCompletionsGateway>(),
                                      std::make_shared<CodeSandbox>(settings),
                                      AppConfig::defaults().prompts, default_hypotheses_schema());
    const std::string code =
        "```python\n"
        "def test_hypothesis(df):\n"
        "    a = df[df['arm'] == 'a']['score']\n"
        "    b = df[df['arm'] == 'b']['score']\n"
        "    t, p = stats.ttest_ind(a, b)\n"
        "    return p < 0.05, float(p)\n"
        "```";
    auto outcome = orchestrator.execute(id, code);
    EXPECT_GT(outcome.p_value, 0.0);
    EXPECT_LE(outcome.p_value, 1.0);
    EXPECT_EQ(outcome.success, outcome.p_value < 0.05);

    store->remove(id);
    EXPECT_THROW(store->load(id), NotFoundError);
    EXPECT_THROW(orchestrator.execute(id, code), NotFoundError);
}

TEST(SandboxSetupTest, UnknownInterpreter) {
    SandboxSettings settings;
    settings.interpreter = "definitely-not-a-python-interpreter";
    CodeSandbox sandbox(settings);
    std::string detail;
    EXPECT_FALSE(sandbox.probe(&detail));
    EXPECT_NE(detail.find("not found"), std::string::npos);
    EXPECT_THROW(sandbox.execute_code("x = 1", "/nonexistent.json"), ExecutionError);
}

TEST(SandboxSetupTest, FindExecutable) {
    EXPECT_FALSE(find_executable_in_path("sh").empty());
    EXPECT_TRUE(find_executable_in_path("no-such-binary-anywhere").empty());
    EXPECT_EQ(find_executable_in_path(""), "");
}

TEST(SandboxSetupTest, ScratchDirectoryIsRemoved) {
    fs::path path;
    {
        ScratchDirectory scratch;
        path = scratch.path();
        EXPECT_TRUE(fs::is_directory(path));
    }
    EXPECT_FALSE(fs::exists(path));
}
