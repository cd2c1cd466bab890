#include "judge/interaction_runner.hpp"

#include <array>
#include <deque>
#include <memory>
#include <mutex>
#include <sstream>
#include <system_error>

#include <boost/asio/buffer.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/write.hpp>
#include <boost/process/args.hpp>
#include <boost/process/async_pipe.hpp>
#include <boost/process/child.hpp>
#include <boost/process/exe.hpp>
#include <boost/process/io.hpp>
#include <boost/process/start_dir.hpp>
#include <boost/system/system_error.hpp>
#include <signal.h>

#include "judge/timeout_governor.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"
#include "utils/process.hpp"
#include "utils/temp_files.hpp"

namespace interjudge::judge {
namespace {
namespace asio = boost::asio;
namespace bp = boost::process;

constexpr std::size_t kReadChunk = 4096;

void IgnoreSigpipe() {
    static std::once_flag once;
    std::call_once(once, [] {
        struct sigaction action {};
        action.sa_handler = SIG_IGN;
        sigemptyset(&action.sa_mask);
        action.sa_flags = 0;
        sigaction(SIGPIPE, &action, nullptr);
    });
}

std::string FormatSeconds(std::chrono::milliseconds duration) {
    std::ostringstream oss;
    oss << utils::ToSeconds(duration);
    return oss.str();
}

// Queue of bytes bound for one child's stdin. One async_write is in flight at
// a time; the first write error drops everything queued and everything sent
// afterwards.
class StdinForwarder {
public:
    explicit StdinForwarder(bp::async_pipe& pipe)
        : pipe_(pipe) {}

    void Send(std::string data) {
        if (broken_) {
            return;
        }
        pending_.push_back(std::move(data));
        if (!writing_) {
            WriteNext();
        }
    }

private:
    void WriteNext() {
        if (pending_.empty()) {
            writing_ = false;
            return;
        }
        writing_ = true;
        asio::async_write(pipe_, asio::buffer(pending_.front()),
            [this](const boost::system::error_code& ec, std::size_t) {
                if (ec) {
                    utils::LogDebug("runner", "dropping forward to exited peer: " + ec.message());
                    broken_ = true;
                    writing_ = false;
                    pending_.clear();
                    return;
                }
                pending_.pop_front();
                WriteNext();
            });
    }

    bp::async_pipe& pipe_;
    std::deque<std::string> pending_;
    bool writing_ = false;
    bool broken_ = false;
};

struct StreamReader {
    explicit StreamReader(asio::io_context& io)
        : pipe(io) {}

    bp::async_pipe pipe;
    std::array<char, kReadChunk> chunk{};
};

// Everything one trial owns. Destruction stops both processes, closes the
// pipes and deletes the temp files, in that order.
class InteractionSession {
public:
    InteractionSession(const RunnerOptions& options,
                       std::chrono::milliseconds timeout_total,
                       std::chrono::milliseconds timeout_per_turn);
    ~InteractionSession();

    InteractionSession(const InteractionSession&) = delete;
    InteractionSession& operator=(const InteractionSession&) = delete;

    void Start(const std::string& judge_source,
               const std::string& solver_source,
               const std::string& test_input);

    InteractionResult Drive();

private:
    enum class Stream {
        kJudgeOut,
        kJudgeErr,
        kSolverOut,
        kSolverErr
    };

    void ArmRead(Stream stream);
    StreamReader& ReaderFor(Stream stream);
    void OnData(Stream stream, const char* data, std::size_t size);
    void ForwardLines(std::string& buffer, TranscriptTag tag, StdinForwarder& target);
    void RecordDiagnostic(TranscriptTag tag, const char* data, std::size_t size);
    void Record(TranscriptTag tag, std::string text);
    InteractionResult Finish(Verdict verdict,
                             std::optional<int> exit_code,
                             std::optional<std::string> error_message);

    const RunnerOptions& options_;
    std::chrono::milliseconds timeout_total_;
    std::chrono::milliseconds timeout_per_turn_;

    utils::TempFileSet files_;
    asio::io_context io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_;

    bp::async_pipe judge_in_;
    bp::async_pipe solver_in_;
    StreamReader judge_out_;
    StreamReader judge_err_;
    StreamReader solver_out_;
    StreamReader solver_err_;
    StdinForwarder to_judge_;
    StdinForwarder to_solver_;

    std::unique_ptr<bp::child> judge_;
    std::unique_ptr<bp::child> solver_;

    TimeoutGovernor governor_;
    std::string judge_line_buffer_;
    std::string solver_line_buffer_;
    std::vector<TranscriptLine> transcript_;
    std::optional<int> solver_exit_code_;
    TimeoutGovernor::Clock::time_point solver_exit_time_;
};

InteractionSession::InteractionSession(const RunnerOptions& options,
                                       std::chrono::milliseconds timeout_total,
                                       std::chrono::milliseconds timeout_per_turn)
    : options_(options)
    , timeout_total_(timeout_total)
    , timeout_per_turn_(timeout_per_turn)
    , files_(utils::ResolveTempDirectory(options.temp_dir))
    , work_(asio::make_work_guard(io_))
    , judge_in_(io_)
    , solver_in_(io_)
    , judge_out_(io_)
    , judge_err_(io_)
    , solver_out_(io_)
    , solver_err_(io_)
    , to_judge_(judge_in_)
    , to_solver_(solver_in_)
    , governor_(timeout_total, timeout_per_turn) {
    // Neither child may inherit the other's pipe ends. dup2() onto the
    // standard descriptors clears the flag for the ends a child does use.
    for (auto* pipe : {&judge_in_, &solver_in_, &judge_out_.pipe, &judge_err_.pipe,
                       &solver_out_.pipe, &solver_err_.pipe}) {
        utils::SetCloseOnExec(pipe->native_source());
        utils::SetCloseOnExec(pipe->native_sink());
    }
}

InteractionSession::~InteractionSession() {
    if (judge_) {
        utils::StopProcess(*judge_, options_.kill_wait);
    }
    if (solver_) {
        utils::StopProcess(*solver_, options_.kill_wait);
    }
}

void InteractionSession::Start(const std::string& judge_source,
                               const std::string& solver_source,
                               const std::string& test_input) {
    std::filesystem::path judge_path;
    std::filesystem::path solver_path;
    std::filesystem::path input_path;
    try {
        judge_path = files_.Create("interjudge_judge_", options_.source_suffix, judge_source);
        solver_path = files_.Create("interjudge_solver_", options_.source_suffix, solver_source);
        input_path = files_.Create("interjudge_input_", ".txt", test_input);
    } catch (const std::system_error& ex) {
        throw InteractionSetupError(std::string("failed to materialize trial files: ") + ex.what());
    }

    const auto interpreter = utils::ResolveExecutable(options_.interpreter);
    if (interpreter.empty()) {
        throw InteractionSetupError("interpreter not found: " + options_.interpreter);
    }
    auto env = utils::BuildChildEnvironment(files_.directory());
    const auto work_dir = files_.directory().string();

    try {
        judge_ = std::make_unique<bp::child>(
            bp::exe = interpreter,
            bp::args = std::vector<std::string>{judge_path.string(), input_path.string()},
            env,
            bp::start_dir = work_dir,
            bp::std_in < judge_in_,
            bp::std_out > judge_out_.pipe,
            bp::std_err > judge_err_.pipe);
    } catch (const bp::process_error& ex) {
        throw InteractionSetupError(std::string("failed to start judge: ") + ex.what());
    }

    try {
        solver_ = std::make_unique<bp::child>(
            bp::exe = interpreter,
            bp::args = std::vector<std::string>{solver_path.string()},
            env,
            bp::start_dir = work_dir,
            bp::std_in < solver_in_,
            bp::std_out > solver_out_.pipe,
            bp::std_err > solver_err_.pipe);
    } catch (const bp::process_error& ex) {
        throw InteractionSetupError(std::string("failed to start solver: ") + ex.what());
    }

    utils::LogDebug("runner", "started judge pid=" + std::to_string(judge_->id()) +
                              " solver pid=" + std::to_string(solver_->id()));

    ArmRead(Stream::kJudgeOut);
    ArmRead(Stream::kJudgeErr);
    ArmRead(Stream::kSolverOut);
    ArmRead(Stream::kSolverErr);
}

StreamReader& InteractionSession::ReaderFor(Stream stream) {
    switch (stream) {
        case Stream::kJudgeOut: return judge_out_;
        case Stream::kJudgeErr: return judge_err_;
        case Stream::kSolverOut: return solver_out_;
        case Stream::kSolverErr: return solver_err_;
    }
    return judge_out_;
}

void InteractionSession::ArmRead(Stream stream) {
    auto& reader = ReaderFor(stream);
    reader.pipe.async_read_some(asio::buffer(reader.chunk),
        [this, stream](const boost::system::error_code& ec, std::size_t size) {
            if (size > 0) {
                OnData(stream, ReaderFor(stream).chunk.data(), size);
            }
            // EOF or a closed pipe: the stream is done, process exit is
            // observed separately through waitpid.
            if (!ec) {
                ArmRead(stream);
            }
        });
}

void InteractionSession::OnData(Stream stream, const char* data, std::size_t size) {
    governor_.MarkActivity();
    switch (stream) {
        case Stream::kJudgeOut:
            judge_line_buffer_.append(data, size);
            ForwardLines(judge_line_buffer_, TranscriptTag::kJudgeToSolver, to_solver_);
            break;
        case Stream::kSolverOut:
            solver_line_buffer_.append(data, size);
            ForwardLines(solver_line_buffer_, TranscriptTag::kSolverToJudge, to_judge_);
            break;
        case Stream::kJudgeErr:
            RecordDiagnostic(TranscriptTag::kJudgeStderr, data, size);
            break;
        case Stream::kSolverErr:
            RecordDiagnostic(TranscriptTag::kSolverStderr, data, size);
            break;
    }
}

void InteractionSession::ForwardLines(std::string& buffer,
                                      TranscriptTag tag,
                                      StdinForwarder& target) {
    std::size_t newline = buffer.find('\n');
    while (newline != std::string::npos) {
        std::string line = buffer.substr(0, newline + 1);
        buffer.erase(0, newline + 1);
        std::string text = line.substr(0, line.size() - 1);
        if (!text.empty() && text.back() == '\r') {
            text.pop_back();
        }
        Record(tag, std::move(text));
        target.Send(std::move(line));
        newline = buffer.find('\n');
    }
}

void InteractionSession::RecordDiagnostic(TranscriptTag tag, const char* data, std::size_t size) {
    const auto text = utils::TrimRight(std::string(data, size));
    if (text.empty()) {
        return;
    }
    for (auto& line : utils::SplitLines(text)) {
        Record(tag, std::move(line));
    }
}

void InteractionSession::Record(TranscriptTag tag, std::string text) {
    transcript_.push_back(TranscriptLine{tag, std::move(text)});
    if (options_.on_transcript_line) {
        options_.on_transcript_line(transcript_.back());
    }
}

InteractionResult InteractionSession::Drive() {
    try {
        while (true) {
            if (governor_.TotalExceeded()) {
                return Finish(Verdict::kTimeLimitExceeded, std::nullopt,
                              "Total timeout exceeded (" + FormatSeconds(timeout_total_) + "s)");
            }
            if (governor_.IdleExceeded()) {
                return Finish(Verdict::kTimeLimitExceeded, std::nullopt,
                              "Turn timeout exceeded (" + FormatSeconds(timeout_per_turn_) + "s)");
            }

            // The judge's exit is authoritative, whatever the solver is doing.
            if (!judge_->running()) {
                const int code = utils::DecodeExitStatus(judge_->native_exit_code());
                return Finish(ResolveVerdict(code), code, std::nullopt);
            }

            if (!solver_exit_code_ && !solver_->running()) {
                solver_exit_code_ = utils::DecodeExitStatus(solver_->native_exit_code());
                solver_exit_time_ = TimeoutGovernor::Clock::now();
                Record(TranscriptTag::kInfo,
                       "Solver exited with code " + std::to_string(*solver_exit_code_) +
                           ", waiting for judge...");
            }
            if (solver_exit_code_ &&
                TimeoutGovernor::Clock::now() - solver_exit_time_ > options_.grace_period) {
                return Finish(Verdict::kRuntimeError, solver_exit_code_,
                              "Solver exited (code " + std::to_string(*solver_exit_code_) +
                                  ") but judge didn't respond");
            }

            io_.run_one_for(governor_.NextWait());
            io_.poll();
        }
    } catch (const std::exception& ex) {
        return Finish(Verdict::kRuntimeError, std::nullopt, ex.what());
    }
}

InteractionResult InteractionSession::Finish(Verdict verdict,
                                             std::optional<int> exit_code,
                                             std::optional<std::string> error_message) {
    InteractionResult result{};
    result.verdict = verdict;
    result.transcript = std::move(transcript_);
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(governor_.ElapsedTotal());
    result.exit_code = exit_code;
    result.error_message = std::move(error_message);
    utils::LogDebug("runner", std::string("trial finished verdict=") + ToString(verdict) +
                              " time_ms=" + std::to_string(result.elapsed.count()));
    return result;
}

}  // namespace

const char* ToString(TranscriptTag tag) {
    switch (tag) {
        case TranscriptTag::kJudgeToSolver: return "JUDGE -> SOLVER";
        case TranscriptTag::kSolverToJudge: return "SOLVER -> JUDGE";
        case TranscriptTag::kJudgeStderr: return "JUDGE STDERR";
        case TranscriptTag::kSolverStderr: return "SOLVER STDERR";
        case TranscriptTag::kInfo: return "INFO";
    }
    return "INFO";
}

std::string TranscriptLine::Render() const {
    return std::string("[") + ToString(tag) + "] " + text;
}

std::string InteractionResult::TranscriptText() const {
    std::vector<std::string> lines;
    lines.reserve(transcript.size());
    for (const auto& line : transcript) {
        lines.push_back(line.Render());
    }
    return utils::Join(lines, "\n");
}

ProcessInteractionRunner::ProcessInteractionRunner(RunnerOptions options)
    : options_(std::move(options)) {
    IgnoreSigpipe();
}

InteractionResult ProcessInteractionRunner::Run(const std::string& judge_source,
                                                const std::string& solver_source,
                                                const std::string& test_input,
                                                std::chrono::milliseconds timeout_total,
                                                std::chrono::milliseconds timeout_per_turn) {
    std::unique_ptr<InteractionSession> session;
    try {
        session = std::make_unique<InteractionSession>(options_, timeout_total, timeout_per_turn);
    } catch (const std::system_error& ex) {
        throw InteractionSetupError(std::string("failed to create pipes: ") + ex.what());
    } catch (const boost::system::system_error& ex) {
        throw InteractionSetupError(std::string("failed to create pipes: ") + ex.what());
    }
    session->Start(judge_source, solver_source, test_input);
    return session->Drive();
}

}  // namespace interjudge::judge
