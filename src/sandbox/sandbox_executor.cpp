#include "sandbox/sandbox_executor.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <thread>
#include <vector>

#include <boost/process/args.hpp>
#include <boost/process/child.hpp>
#include <boost/process/exe.hpp>
#include <boost/process/extend.hpp>
#include <boost/process/io.hpp>
#include <boost/process/start_dir.hpp>
#include <sys/resource.h>

#include "utils/common.hpp"
#include "utils/logging.hpp"
#include "utils/process.hpp"
#include "utils/temp_files.hpp"

namespace interjudge::sandbox {
namespace bp = boost::process;
namespace {

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return {};
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

bool LooksLikeAllocationFailure(const std::string& stderr_text) {
    static const std::vector<std::string> kMarkers = {
        "MemoryError",
        "std::bad_alloc",
        "Cannot allocate memory",
        "out of memory"
    };
    for (const auto& marker : kMarkers) {
        if (stderr_text.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

}  // namespace

const char* ToString(ExecStatus status) {
    switch (status) {
        case ExecStatus::kPassed: return "passed";
        case ExecStatus::kRuntimeError: return "runtime_error";
        case ExecStatus::kTimeLimitExceeded: return "time_limit_exceeded";
        case ExecStatus::kMemoryLimitExceeded: return "memory_limit_exceeded";
        case ExecStatus::kSystemError: return "system_error";
    }
    return "system_error";
}

SandboxExecutor::SandboxExecutor(SandboxOptions options)
    : options_(std::move(options)) {}

ExecResult SandboxExecutor::Execute(const std::string& source,
                                    const std::string& stdin_data,
                                    std::chrono::milliseconds timeout,
                                    std::size_t memory_limit_mb) {
    ExecResult result{};
    utils::TempFileSet files(utils::ResolveTempDirectory(options_.temp_dir));

    std::filesystem::path source_path;
    std::filesystem::path stdin_path;
    std::filesystem::path stdout_path;
    std::filesystem::path stderr_path;
    try {
        source_path = files.Create("interjudge_exec_", options_.source_suffix, source);
        stdin_path = files.Create("interjudge_stdin_", ".txt", stdin_data);
        stdout_path = files.Create("interjudge_stdout_", ".log", "");
        stderr_path = files.Create("interjudge_stderr_", ".log", "");
    } catch (const std::system_error& ex) {
        result.error_message = std::string("Error: cannot create temp files: ") + ex.what();
        return result;
    }

    const auto interpreter = utils::ResolveExecutable(options_.interpreter);
    if (interpreter.empty()) {
        result.error_message = "Error: interpreter not found: " + options_.interpreter;
        return result;
    }

    const rlim_t memory_bytes = static_cast<rlim_t>(memory_limit_mb) * 1024 * 1024;
    auto env = utils::BuildChildEnvironment(files.directory());

    try {
        bp::child child_process(
            bp::exe = interpreter,
            bp::args = std::vector<std::string>{source_path.string()},
            env,
            bp::start_dir = files.directory().string(),
            bp::std_in < stdin_path.string(),
            bp::std_out > stdout_path.string(),
            bp::std_err > stderr_path.string(),
            bp::extend::on_exec_setup = [memory_bytes](auto&) {
                if (memory_bytes > 0) {
                    struct rlimit limit {};
                    limit.rlim_cur = memory_bytes;
                    limit.rlim_max = memory_bytes;
                    ::setrlimit(RLIMIT_AS, &limit);
                }
            });

        const auto deadline = std::chrono::steady_clock::now() + timeout;
        bool finished = false;
        while (std::chrono::steady_clock::now() < deadline) {
            if (!child_process.running()) {
                finished = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        if (!finished && !child_process.running()) {
            finished = true;
        }
        if (finished) {
            result.exit_code = utils::DecodeExitStatus(child_process.native_exit_code());
        } else {
            result.timed_out = true;
            utils::StopProcess(child_process, options_.kill_wait);
        }
    } catch (const bp::process_error& ex) {
        result.error_message = std::string("Error: exec failed: ") + ex.what();
        utils::LogWarn("sandbox", result.error_message);
        return result;
    }

    result.output = ReadFile(stdout_path);
    result.error = ReadFile(stderr_path);

    if (result.timed_out) {
        result.status = ExecStatus::kTimeLimitExceeded;
        std::ostringstream message;
        message << "Time limit exceeded (" << utils::ToSeconds(timeout) << "s)";
        result.error_message = message.str();
    } else if (result.exit_code == 0) {
        result.status = ExecStatus::kPassed;
    } else {
        result.status = LooksLikeAllocationFailure(result.error)
            ? ExecStatus::kMemoryLimitExceeded
            : ExecStatus::kRuntimeError;
        const auto stderr_text = utils::TrimRight(result.error);
        result.error_message = stderr_text.empty()
            ? "Exit code " + std::to_string(result.exit_code)
            : stderr_text;
    }
    utils::LogDebug("sandbox", std::string("exec finished status=") + ToString(result.status) +
                               " exit_code=" + std::to_string(result.exit_code));
    return result;
}

}  // namespace interjudge::sandbox
