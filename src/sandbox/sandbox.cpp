#include "hypoforge/sandbox/sandbox.hpp"
#include "hypoforge/errors.hpp"
#include "hypoforge/sandbox/code_extractor.hpp"
#include "hypoforge/uuid.hpp"
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace hypoforge {

using json = nlohmann::json;

namespace {

constexpr int kResultFd = 3;
constexpr int kExecFailedExit = 127;

const char* kRunnerSource = R"PY(
import json, math, os, sys

def emit(payload):
    with os.fdopen(3, "w") as out:
        out.write(json.dumps(payload))

def fail(message):
    emit({"ok": False, "error": message})

def build_frame(pd, np, snapshot):
    data = {}
    for col in snapshot["columns"]:
        values = col["values"]
        kind = col["kind"]
        if kind == "numeric":
            if col.get("integral") and all(v is not None for v in values):
                series = pd.Series(values, dtype="int64")
            else:
                series = pd.Series([np.nan if v is None else v for v in values], dtype="float64")
        elif kind == "temporal":
            seconds = pd.Series([np.nan if v is None else v for v in values], dtype="float64")
            series = pd.to_datetime(seconds, unit="s")
        else:
            series = pd.Series(values, dtype="object")
        data[col["name"]] = series
    return pd.DataFrame(data, columns=[c["name"] for c in snapshot["columns"]])

def main():
    snapshot_path, code_path = sys.argv[1], sys.argv[2]
    try:
        import numpy as np
        import pandas as pd
        import scipy.stats as stats
    except Exception as e:
        fail("Analysis libraries unavailable: %s" % e)
        return
    with open(snapshot_path) as f:
        df = build_frame(pd, np, json.load(f))
    with open(code_path) as f:
        code = f.read()

    namespace = {"pd": pd, "np": np, "stats": stats, "df": df, "__name__": "__analysis__"}
    try:
        exec(compile(code, "<analysis>", "exec"), namespace)
        entry = namespace.get("test_hypothesis")
        if not callable(entry):
            fail("test_hypothesis function not found or invalid return format")
            return
        result = entry(df)
    except BaseException as e:
        fail("Code execution error: %s: %s" % (type(e).__name__, e))
        return

    if not isinstance(result, (tuple, list)) or len(result) != 2:
        fail("test_hypothesis function not found or invalid return format")
        return
    try:
        success = bool(result[0])
        p_value = float(result[1])
    except BaseException as e:
        fail("test_hypothesis function not found or invalid return format: %s" % e)
        return
    if not math.isfinite(p_value) or p_value < 0.0 or p_value > 1.0:
        fail("p-value out of range: %r" % p_value)
        return
    emit({"ok": True, "success": success, "p_value": p_value})

main()
)PY";

const char* kProbeSource = "import pandas, numpy, scipy.stats";

class FdGuard {
public:
    explicit FdGuard(int fd = -1) : fd_(fd) {}
    ~FdGuard() { reset(); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }
    void reset(int fd = -1) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

private:
    int fd_;
};

struct Pipe {
    FdGuard read_end;
    FdGuard write_end;

    Pipe() {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            throw ExecutionError(std::string("Cannot create pipe: ") + std::strerror(errno));
        }
        read_end.reset(fds[0]);
        write_end.reset(fds[1]);
    }
};

void set_limit(int resource, rlim_t value) {
    struct rlimit lim;
    lim.rlim_cur = value;
    lim.rlim_max = value;
    ::setrlimit(resource, &lim);
}

std::string tail(const std::string& s, size_t n) {
    return s.size() <= n ? s : s.substr(s.size() - n);
}

} // namespace

std::string find_executable_in_path(const std::string& command) {
    if (command.empty()) return "";
    if (command.find('/') != std::string::npos) {
        return ::access(command.c_str(), X_OK) == 0 ? command : "";
    }
    const char* path_env = std::getenv("PATH");
    if (!path_env) return "";

    std::stringstream ss{std::string(path_env)};
    std::string token;
    while (std::getline(ss, token, ':')) {
        if (token.empty()) token = ".";
        fs::path candidate = fs::path(token) / command;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate.string();
        }
    }
    return "";
}

ScratchDirectory::ScratchDirectory(const fs::path& parent)
    : path_(parent / ("hypoforge-run-" + generate_uuid())) {
    std::error_code ec;
    fs::create_directories(path_, ec);
    if (ec) {
        throw ExecutionError("Cannot create scratch directory " + path_.string() + ": " + ec.message());
    }
    fs::permissions(path_, fs::perms::owner_all, ec);
}

ScratchDirectory::~ScratchDirectory() {
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) spdlog::warn("⚠️ Could not remove scratch directory {}: {}", path_.string(), ec.message());
}

CodeSandbox::CodeSandbox(SandboxSettings settings) : settings_(std::move(settings)) {}

std::string CodeSandbox::resolve_interpreter() const {
    return find_executable_in_path(settings_.interpreter);
}

ExecutionOutcome CodeSandbox::execute(const std::string& source_text, const fs::path& snapshot_path) const {
    return execute_code(extract_code_block(source_text), snapshot_path);
}

ExecutionOutcome CodeSandbox::execute_code(const std::string& code, const fs::path& snapshot_path) const {
    const std::string interpreter = resolve_interpreter();
    if (interpreter.empty()) {
        throw ExecutionError("Interpreter not found: " + settings_.interpreter);
    }

    ScratchDirectory scratch;
    const fs::path code_path = scratch.path() / "analysis.py";
    {
        std::ofstream out(code_path, std::ios::trunc);
        out << code;
        if (!out) throw ExecutionError("Cannot write analysis code to " + code_path.string());
    }

    const auto started = std::chrono::steady_clock::now();
    ProcessResult proc = run({interpreter, "-I", "-B", "-c", kRunnerSource,
                              fs::absolute(snapshot_path).string(), code_path.string()},
                             scratch.path(), std::chrono::seconds(settings_.timeout_seconds));
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    spdlog::debug("🧪 Analysis process finished in {} ms (exit {}, signal {})", elapsed, proc.exit_code, proc.term_signal);

    if (proc.timed_out) {
        throw ExecutionError("Code execution timed out after " + std::to_string(settings_.timeout_seconds) + " seconds");
    }
    if (proc.term_signal == SIGXCPU) {
        throw ExecutionError("Code execution exceeded the CPU time limit");
    }
    if (proc.term_signal != 0) {
        throw ExecutionError("Analysis process terminated by signal " + std::to_string(proc.term_signal));
    }
    if (proc.exit_code == kExecFailedExit && proc.result.empty()) {
        throw ExecutionError("Interpreter could not be started: " + interpreter);
    }
    if (proc.result.empty()) {
        throw ExecutionError("Analysis runner produced no result (exit " + std::to_string(proc.exit_code) +
                             "): " + tail(proc.err, 2000));
    }

    json result;
    try {
        result = json::parse(proc.result);
    } catch (const json::parse_error& e) {
        throw ExecutionError(std::string("Malformed runner result: ") + e.what());
    }

    if (!result.value("ok", false)) {
        throw ExecutionError(result.value("error", std::string("Code execution failed")));
    }

    ExecutionOutcome outcome;
    outcome.success = result.at("success").get<bool>();
    outcome.p_value = result.at("p_value").get<double>();
    if (!std::isfinite(outcome.p_value) || outcome.p_value < 0.0 || outcome.p_value > 1.0) {
        throw ExecutionError("p-value out of range");
    }
    return outcome;
}

bool CodeSandbox::probe(std::string* detail) const {
    const std::string interpreter = resolve_interpreter();
    if (interpreter.empty()) {
        if (detail) *detail = "interpreter not found: " + settings_.interpreter;
        return false;
    }
    try {
        ScratchDirectory scratch;
        auto proc = run({interpreter, "-I", "-c", kProbeSource}, scratch.path(), std::chrono::seconds(30));
        if (proc.exit_code == 0) return true;
        if (detail) *detail = proc.timed_out ? "probe timed out" : tail(proc.err, 500);
    } catch (const ForgeError& e) {
        if (detail) *detail = e.what();
    }
    return false;
}

ProcessResult CodeSandbox::run(const std::vector<std::string>& args, const fs::path& workdir,
                               std::chrono::milliseconds timeout) const {
    // Everything the child touches is prepared before fork.
    std::vector<char*> argv;
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    const std::vector<std::string> env = {
        "PATH=/usr/local/bin:/usr/bin:/bin",
        "HOME=" + workdir.string(),
        "TMPDIR=" + workdir.string(),
        "LANG=C.UTF-8",
        "OPENBLAS_NUM_THREADS=1",
        "OMP_NUM_THREADS=1",
        "MKL_NUM_THREADS=1",
        "MPLBACKEND=Agg"
    };
    std::vector<char*> envp;
    for (const auto& e : env) envp.push_back(const_cast<char*>(e.c_str()));
    envp.push_back(nullptr);

    const std::string cwd = workdir.string();
    const rlim_t cpu = static_cast<rlim_t>(settings_.cpu_seconds > 0 ? settings_.cpu_seconds : settings_.timeout_seconds);
    const rlim_t memory = static_cast<rlim_t>(settings_.memory_limit_mb) * 1024 * 1024;
    const rlim_t file_size = 64ull * 1024 * 1024;

    Pipe out_pipe, err_pipe, result_pipe;

    const pid_t pid = ::fork();
    if (pid < 0) {
        throw ExecutionError(std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        set_limit(RLIMIT_CPU, cpu);
        if (memory > 0) set_limit(RLIMIT_AS, memory);
        set_limit(RLIMIT_FSIZE, file_size);
        set_limit(RLIMIT_CORE, 0);

        const int dev_null = ::open("/dev/null", O_RDONLY);
        if (dev_null < 0 || ::dup2(dev_null, STDIN_FILENO) < 0) _exit(kExecFailedExit);
        if (::dup2(out_pipe.write_end.get(), STDOUT_FILENO) < 0) _exit(kExecFailedExit);
        if (::dup2(err_pipe.write_end.get(), STDERR_FILENO) < 0) _exit(kExecFailedExit);
        if (result_pipe.write_end.get() == kResultFd) {
            ::fcntl(kResultFd, F_SETFD, 0);
        } else if (::dup2(result_pipe.write_end.get(), kResultFd) < 0) {
            _exit(kExecFailedExit);
        }
        if (::chdir(cwd.c_str()) != 0) _exit(kExecFailedExit);

        ::execve(argv[0], argv.data(), envp.data());
        _exit(kExecFailedExit);
    }

    ::setpgid(pid, pid);
    out_pipe.write_end.reset();
    err_pipe.write_end.reset();
    result_pipe.write_end.reset();

    ProcessResult res;
    const size_t cap = static_cast<size_t>(settings_.max_output_kb > 0 ? settings_.max_output_kb : 256) * 1024;
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    struct Stream { int fd; std::string* sink; bool open; };
    Stream streams[3] = {
        {out_pipe.read_end.get(), &res.out, true},
        {err_pipe.read_end.get(), &res.err, true},
        {result_pipe.read_end.get(), &res.result, true}
    };

    char buf[8192];
    auto any_open = [&] { return streams[0].open || streams[1].open || streams[2].open; };
    // One poll over the open streams; returns the number that were ready.
    auto pump = [&](int wait_ms) {
        pollfd fds[3];
        for (int i = 0; i < 3; ++i) {
            fds[i].fd = streams[i].open ? streams[i].fd : -1;
            fds[i].events = POLLIN;
            fds[i].revents = 0;
        }
        const int ready = ::poll(fds, 3, wait_ms);
        if (ready <= 0) return ready;
        for (int i = 0; i < 3; ++i) {
            if (!streams[i].open || fds[i].revents == 0) continue;
            const ssize_t n = ::read(streams[i].fd, buf, sizeof(buf));
            if (n <= 0) {
                if (n < 0 && errno == EINTR) continue;
                streams[i].open = false;
                continue;
            }
            std::string& sink = *streams[i].sink;
            if (sink.size() < cap) sink.append(buf, std::min(static_cast<size_t>(n), cap - sink.size()));
        }
        return ready;
    };

    int status = 0;
    bool reaped = false;
    while (any_open()) {
        // A grandchild may still hold stdout or stderr open; once the result
        // is in and the child is gone there is nothing left to wait for.
        if (!streams[2].open && ::waitpid(pid, &status, WNOHANG) == pid) {
            reaped = true;
            break;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            res.timed_out = true;
            break;
        }
        if (pump(static_cast<int>(std::min<long long>(remaining, 200))) < 0 && errno != EINTR) break;
    }

    while (!res.timed_out && !reaped) {
        const pid_t done = ::waitpid(pid, &status, WNOHANG);
        if (done == pid) break;
        if (done < 0 && errno != EINTR) break;
        if (std::chrono::steady_clock::now() >= deadline) {
            res.timed_out = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    // The group goes down either way so stray grandchildren cannot linger.
    ::kill(-pid, SIGKILL);
    if (reaped) {
        for (int pass = 0; pass < 64 && any_open() && pump(0) > 0; ++pass) {}
    }
    if (res.timed_out) {
        spdlog::warn("⏱️ Analysis process {} exceeded {} ms, killed", pid, timeout.count());
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        return res;
    }

    if (WIFEXITED(status)) res.exit_code = WEXITSTATUS(status);
    if (WIFSIGNALED(status)) res.term_signal = WTERMSIG(status);
    return res;
}

} // namespace hypoforge
