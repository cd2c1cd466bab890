#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "judge/verdict.hpp"

namespace interjudge::judge {

enum class TranscriptTag {
    kJudgeToSolver,
    kSolverToJudge,
    kJudgeStderr,
    kSolverStderr,
    kInfo
};

const char* ToString(TranscriptTag tag);

struct TranscriptLine {
    TranscriptTag tag;
    std::string text;

    // "[JUDGE -> SOLVER] ? 3"
    std::string Render() const;
};

struct InteractionResult {
    Verdict verdict = Verdict::kRuntimeError;
    std::vector<TranscriptLine> transcript;
    std::chrono::milliseconds elapsed{0};
    std::optional<int> exit_code;
    std::optional<std::string> error_message;

    std::string TranscriptText() const;
};

// Raised only when a trial cannot be attempted at all: temp files could not
// be written or a process could not be spawned.
class InteractionSetupError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct RunnerOptions {
    // Program that executes a source file: argv = {interpreter, source, args...}.
    std::string interpreter = "python3";
    std::string source_suffix = ".py";
    // Empty: system temp directory.
    std::string temp_dir;
    // How long the judge may keep running after the solver has exited.
    std::chrono::milliseconds grace_period{2000};
    // Wait between SIGTERM and SIGKILL during teardown.
    std::chrono::milliseconds kill_wait{1000};
    // Called with each transcript line as it is recorded. An exception thrown
    // from here ends the trial as a runtime error carrying its message.
    std::function<void(const TranscriptLine&)> on_transcript_line;
};

class InteractionRunner {
public:
    virtual ~InteractionRunner() = default;

    // Runs one judged interaction. Every trial outcome is encoded in the
    // returned result; only InteractionSetupError escapes.
    virtual InteractionResult Run(const std::string& judge_source,
                                  const std::string& solver_source,
                                  const std::string& test_input,
                                  std::chrono::milliseconds timeout_total,
                                  std::chrono::milliseconds timeout_per_turn) = 0;
};

// Spawns the judge and solver as child processes of an interpreter and
// relays their line protocol over pipes.
class ProcessInteractionRunner : public InteractionRunner {
public:
    explicit ProcessInteractionRunner(RunnerOptions options = {});

    InteractionResult Run(const std::string& judge_source,
                          const std::string& solver_source,
                          const std::string& test_input,
                          std::chrono::milliseconds timeout_total,
                          std::chrono::milliseconds timeout_per_turn) override;

private:
    RunnerOptions options_;
};

}  // namespace interjudge::judge
