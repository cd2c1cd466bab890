#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config_loader.hpp"
#include "judge/interaction_runner.hpp"
#include "nlohmann/json.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "stress/report_format.hpp"
#include "stress/stress_test.hpp"
#include "tools/run_interaction_tool.hpp"
#include "tools/stress_test_tool.hpp"
#include "tools/tool_registry.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace {

constexpr int kUsageError = 2;

void PrintUsage() {
    std::cout
        << "Usage:\n"
        << "  interjudge stress --solver FILE --generator FILE --judge FILE [--tests N] [--json]\n"
        << "  interjudge interact --judge FILE --solver FILE --input FILE [--total SEC] [--turn SEC] [--follow] [--json]\n"
        << "  interjudge call < tool_call.json\n";
}

std::optional<std::string> GetOption(const std::vector<std::string>& args, const std::string& name) {
    for (std::size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == name) {
            return args[i + 1];
        }
    }
    return std::nullopt;
}

bool HasFlag(const std::vector<std::string>& args, const std::string& name) {
    for (const auto& arg : args) {
        if (arg == name) {
            return true;
        }
    }
    return false;
}

std::string ReadTextFile(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw std::runtime_error("cannot open " + path);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

// nullopt when the option is present but not a positive number of seconds.
std::optional<std::chrono::milliseconds> ParseSecondsOption(const std::vector<std::string>& args,
                                                            const std::string& name,
                                                            std::chrono::milliseconds fallback) {
    const auto value = GetOption(args, name);
    if (!value) {
        return fallback;
    }
    const auto parsed = interjudge::utils::ParseSeconds(*value);
    if (!parsed) {
        std::cerr << "interjudge: " << name << " expects a positive number of seconds, got '"
                  << *value << "'" << std::endl;
    }
    return parsed;
}

int RunStress(const interjudge::config::Config& config, const std::vector<std::string>& args) {
    const auto solver_path = GetOption(args, "--solver");
    const auto generator_path = GetOption(args, "--generator");
    const auto judge_path = GetOption(args, "--judge");
    if (!solver_path || !generator_path || !judge_path) {
        PrintUsage();
        return kUsageError;
    }
    int num_tests = config.stress.num_tests;
    if (const auto tests = GetOption(args, "--tests")) {
        const auto parsed = interjudge::utils::ParseInt(*tests);
        if (!parsed || *parsed < 1) {
            std::cerr << "interjudge: --tests expects a positive integer, got '" << *tests << "'"
                      << std::endl;
            return kUsageError;
        }
        num_tests = *parsed;
    }

    interjudge::sandbox::SandboxExecutor executor(interjudge::config::ToSandboxOptions(config));
    interjudge::judge::ProcessInteractionRunner runner(interjudge::config::ToRunnerOptions(config));
    interjudge::stress::StressTester tester(executor, runner, interjudge::config::ToStressOptions(config));

    const auto report = tester.Run(
        ReadTextFile(*solver_path),
        ReadTextFile(*generator_path),
        ReadTextFile(*judge_path),
        num_tests);

    if (HasFlag(args, "--json")) {
        std::cout << interjudge::stress::ReportToJson(report).dump(2) << std::endl;
    } else {
        std::cout << interjudge::stress::FormatReport(report) << std::endl;
    }
    return report.Passed() ? 0 : 1;
}

int RunInteract(const interjudge::config::Config& config, const std::vector<std::string>& args) {
    const auto judge_path = GetOption(args, "--judge");
    const auto solver_path = GetOption(args, "--solver");
    const auto input_path = GetOption(args, "--input");
    if (!judge_path || !solver_path || !input_path) {
        PrintUsage();
        return kUsageError;
    }
    const auto stress_options = interjudge::config::ToStressOptions(config);
    const auto total = ParseSecondsOption(args, "--total", stress_options.timeout_total);
    const auto per_turn = ParseSecondsOption(args, "--turn", stress_options.timeout_per_turn);
    if (!total || !per_turn) {
        return kUsageError;
    }

    auto runner_options = interjudge::config::ToRunnerOptions(config);
    if (HasFlag(args, "--follow")) {
        runner_options.on_transcript_line = [](const interjudge::judge::TranscriptLine& line) {
            std::cerr << line.Render() << std::endl;
        };
    }
    interjudge::judge::ProcessInteractionRunner runner(runner_options);
    const auto result = runner.Run(
        ReadTextFile(*judge_path),
        ReadTextFile(*solver_path),
        ReadTextFile(*input_path),
        *total,
        *per_turn);

    if (HasFlag(args, "--json")) {
        std::cout << interjudge::stress::InteractionResultToJson(result).dump(2) << std::endl;
    } else {
        std::cout << interjudge::stress::FormatInteraction(result) << std::endl;
    }
    return result.verdict == interjudge::judge::Verdict::kAccepted ? 0 : 1;
}

int RunToolCall(const interjudge::config::Config& config) {
    const std::string text((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
    const auto call = nlohmann::json::parse(text, nullptr, false);
    if (call.is_discarded()) {
        std::cout << "Error: tool call is not valid JSON" << std::endl;
        return 1;
    }

    const auto stress_options = interjudge::config::ToStressOptions(config);
    interjudge::sandbox::SandboxExecutor executor(interjudge::config::ToSandboxOptions(config));
    interjudge::judge::ProcessInteractionRunner runner(interjudge::config::ToRunnerOptions(config));
    interjudge::stress::StressTester tester(executor, runner, stress_options);

    interjudge::tools::ToolRegistry registry;
    registry.Register(std::make_unique<interjudge::tools::StressTestTool>(
        tester, "", "", config.stress.num_tests));
    registry.Register(std::make_unique<interjudge::tools::RunInteractionTool>(
        runner, stress_options.timeout_total, stress_options.timeout_per_turn));

    const auto output = registry.ExecuteCall(call);
    std::cout << output << std::endl;
    return output.rfind("Error:", 0) == 0 ? 1 : 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return kUsageError;
    }
    const std::string command = argv[1];
    const std::vector<std::string> args(argv + 2, argv + argc);

    auto config = interjudge::config::LoadConfig();
    interjudge::utils::LogConfig log_config{};
    log_config.min_level = interjudge::utils::ParseLogLevel(config.logging.level, log_config.min_level);
    interjudge::utils::SetLogConfig(log_config);

    try {
        if (command == "stress") {
            return RunStress(config, args);
        }
        if (command == "interact") {
            return RunInteract(config, args);
        }
        if (command == "call") {
            return RunToolCall(config);
        }
    } catch (const std::exception& ex) {
        std::cerr << "interjudge: " << ex.what() << std::endl;
        return 1;
    }

    PrintUsage();
    return kUsageError;
}
