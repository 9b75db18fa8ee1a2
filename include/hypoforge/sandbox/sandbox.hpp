#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include "hypoforge/app_config.hpp"

namespace hypoforge {

namespace fs = std::filesystem;

struct ExecutionOutcome {
    bool success = false;
    double p_value = 1.0;
};

// Private directory removed with its contents when the object goes away.
class ScratchDirectory {
public:
    explicit ScratchDirectory(const fs::path& parent = fs::temp_directory_path());
    ~ScratchDirectory();

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

struct ProcessResult {
    int exit_code = -1;
    int term_signal = 0;
    bool timed_out = false;
    std::string out;      // stdout, capped
    std::string err;      // stderr, capped
    std::string result;   // everything written to fd 3
};

// Runs generated analysis code in a separate interpreter process.
//
// The child gets its own process group, a scrubbed environment, stdin from
// /dev/null, cwd in a scratch directory and RLIMIT_CPU / RLIMIT_AS /
// RLIMIT_FSIZE / RLIMIT_CORE limits. The parent enforces the wall clock
// timeout by killing the whole group. This bounds resources; it is not a
// security boundary.
class CodeSandbox {
public:
    explicit CodeSandbox(SandboxSettings settings);
    virtual ~CodeSandbox() = default;

    // Extracts the last fenced block from source_text and runs it.
    ExecutionOutcome execute(const std::string& source_text, const fs::path& snapshot_path) const;

    // Runs already extracted code against the snapshot. Throws ExecutionError
    // when test_hypothesis is missing, returns the wrong shape or a
    // probability outside [0, 1], raises, or the process breaches a limit.
    virtual ExecutionOutcome execute_code(const std::string& code, const fs::path& snapshot_path) const;

    // True when the interpreter starts and can import pandas, numpy and
    // scipy.stats. detail receives the failure reason.
    bool probe(std::string* detail = nullptr) const;

private:
    SandboxSettings settings_;

    std::string resolve_interpreter() const;
    ProcessResult run(const std::vector<std::string>& args, const fs::path& workdir,
                      std::chrono::milliseconds timeout) const;
};

// Absolute path of command found on PATH, or empty.
std::string find_executable_in_path(const std::string& command);

} // namespace hypoforge
