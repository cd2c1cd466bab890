#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace interjudge::sandbox {

enum class ExecStatus {
    kPassed,
    kRuntimeError,
    kTimeLimitExceeded,
    kMemoryLimitExceeded,
    kSystemError
};

// "passed", "runtime_error", "time_limit_exceeded", "memory_limit_exceeded",
// "system_error".
const char* ToString(ExecStatus status);

struct ExecResult {
    ExecStatus status = ExecStatus::kSystemError;
    int exit_code = -1;
    bool timed_out = false;
    std::string output;
    std::string error;
    std::string error_message;

    bool Passed() const { return status == ExecStatus::kPassed; }
};

// Runs one program to completion with bounded time and memory.
class CodeExecutor {
public:
    virtual ~CodeExecutor() = default;
    virtual ExecResult Execute(const std::string& source,
                               const std::string& stdin_data,
                               std::chrono::milliseconds timeout,
                               std::size_t memory_limit_mb) = 0;
};

struct SandboxOptions {
    std::string interpreter = "python3";
    std::string source_suffix = ".py";
    std::string temp_dir;
    std::chrono::milliseconds kill_wait{1000};
};

// Launches the source through an interpreter with stdin fed from a file and
// RLIMIT_AS applied in the child. Never throws; failures to spawn are
// reported as kSystemError.
class SandboxExecutor : public CodeExecutor {
public:
    explicit SandboxExecutor(SandboxOptions options = {});

    ExecResult Execute(const std::string& source,
                       const std::string& stdin_data,
                       std::chrono::milliseconds timeout,
                       std::size_t memory_limit_mb) override;

private:
    SandboxOptions options_;
};

}  // namespace interjudge::sandbox
