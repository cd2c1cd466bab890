#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <unordered_map>

#include "nlohmann/json.hpp"

#include "judge/interaction_runner.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "stress/stress_test.hpp"
#include "tools/run_interaction_tool.hpp"
#include "tools/stress_test_tool.hpp"
#include "tools/tool_registry.hpp"

namespace interjudge::tools {
namespace {

using std::chrono::milliseconds;

class EchoTool : public Tool {
public:
    std::string Name() const override { return "echo"; }
    std::string Description() const override { return "Echo the text argument."; }
    std::string ParametersJson() const override {
        return R"({"type":"object","properties":{"text":{"type":"string"}}})";
    }
    std::string Execute(const std::unordered_map<std::string, std::string>& params) override {
        auto it = params.find("text");
        return it == params.end() ? "" : it->second;
    }
};

class GeneratorStub : public sandbox::CodeExecutor {
public:
    sandbox::ExecResult Execute(const std::string& source, const std::string&,
                                milliseconds, std::size_t) override {
        last_source = source;
        sandbox::ExecResult result{};
        result.status = sandbox::ExecStatus::kPassed;
        result.exit_code = 0;
        result.output = "4\n";
        return result;
    }

    std::string last_source;
};

class RecordingRunner : public judge::InteractionRunner {
public:
    judge::InteractionResult Run(const std::string& judge_source,
                                 const std::string& solver_source,
                                 const std::string& test_input,
                                 milliseconds timeout_total,
                                 milliseconds timeout_per_turn) override {
        ++calls;
        last_judge = judge_source;
        last_solver = solver_source;
        last_input = test_input;
        last_total = timeout_total;
        last_per_turn = timeout_per_turn;
        judge::InteractionResult result{};
        result.verdict = verdict;
        result.exit_code = verdict == judge::Verdict::kAccepted ? 0 : 1;
        return result;
    }

    judge::Verdict verdict = judge::Verdict::kAccepted;
    int calls = 0;
    std::string last_judge;
    std::string last_solver;
    std::string last_input;
    milliseconds last_total{0};
    milliseconds last_per_turn{0};
};

TEST(ToolRegistryTest, UnknownToolIsReportedAsError) {
    ToolRegistry registry;
    EXPECT_EQ(registry.Execute("missing", {}), "Error: Tool 'missing' not found");
    EXPECT_FALSE(registry.Has("missing"));
    EXPECT_EQ(registry.Get("missing"), nullptr);
}

TEST(ToolRegistryTest, ListsDefinitionsByName) {
    ToolRegistry registry;
    GeneratorStub executor;
    RecordingRunner runner;
    stress::StressTester tester(executor, runner);
    registry.Register(std::make_unique<StressTestTool>(tester, "gen", "judge"));
    registry.Register(std::make_unique<RunInteractionTool>(runner, milliseconds(30000), milliseconds(2000)));
    registry.Register(std::make_unique<EchoTool>());

    const auto names = registry.List();
    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[0], "echo");
    EXPECT_EQ(names[1], "interactive_stress_test");
    EXPECT_EQ(names[2], "run_interaction");

    for (const auto& def : registry.GetDefinitions()) {
        const auto schema = nlohmann::json::parse(def.parameters_json);
        EXPECT_EQ(schema["type"], "object") << def.name;
        EXPECT_FALSE(def.description.empty());
    }
}

TEST(ToolRegistryTest, ExecuteCallPassesArgumentsAsText) {
    ToolRegistry registry;
    registry.Register(std::make_unique<EchoTool>());

    EXPECT_EQ(registry.ExecuteCall({{"name", "echo"}, {"arguments", {{"text", "hi"}}}}), "hi");
    EXPECT_EQ(registry.ExecuteCall({{"name", "echo"}, {"arguments", {{"text", 12}}}}), "12");
    EXPECT_EQ(registry.ExecuteCall(nlohmann::json::array()),
              "Error: tool call must be an object with a string 'name'");
    EXPECT_EQ(registry.ExecuteCall({{"arguments", {}}}),
              "Error: tool call must be an object with a string 'name'");
}

TEST(StressTestToolTest, UsesInjectedGeneratorAndJudge) {
    GeneratorStub executor;
    RecordingRunner runner;
    stress::StressTester tester(executor, runner);
    StressTestTool tool(tester, "generator source", "judge source", 3);

    const auto output = tool.Execute({{"solution_code", "solver source"}});
    EXPECT_EQ(output, "=== INTERACTIVE STRESS TEST PASSED ===\nAll 3 tests passed!");
    EXPECT_EQ(runner.calls, 3);
    EXPECT_EQ(executor.last_source, "generator source");
    EXPECT_EQ(runner.last_judge, "judge source");
    EXPECT_EQ(runner.last_solver, "solver source");
    EXPECT_EQ(runner.last_input, "4\n");
}

TEST(StressTestToolTest, CallArgumentsOverrideDefaults) {
    GeneratorStub executor;
    RecordingRunner runner;
    stress::StressTester tester(executor, runner);
    StressTestTool tool(tester, "", "", 3);

    const auto output = tool.Execute({{"solution_code", "solver"},
                                      {"generator_code", "gen"},
                                      {"judge_code", "judge"},
                                      {"num_tests", "5"}});
    EXPECT_EQ(output, "=== INTERACTIVE STRESS TEST PASSED ===\nAll 5 tests passed!");
    EXPECT_EQ(executor.last_source, "gen");
}

TEST(StressTestToolTest, ReportsFailureText) {
    GeneratorStub executor;
    RecordingRunner runner;
    runner.verdict = judge::Verdict::kWrongAnswer;
    stress::StressTester tester(executor, runner);
    StressTestTool tool(tester, "gen", "judge");

    const auto output = tool.Execute({{"solution_code", "solver"}});
    EXPECT_EQ(output.rfind("=== INTERACTIVE TEST FAILED ===\nTest #1\nVerdict: WA\n", 0), 0u);
    EXPECT_EQ(runner.calls, 1);
}

TEST(StressTestToolTest, ArgumentErrors) {
    GeneratorStub executor;
    RecordingRunner runner;
    stress::StressTester tester(executor, runner);

    StressTestTool configured(tester, "gen", "judge");
    EXPECT_EQ(configured.Execute({}), "Error: missing solution_code");
    EXPECT_EQ(configured.Execute({{"solution_code", "s"}, {"num_tests", "many"}}),
              "Error: num_tests must be an integer");
    EXPECT_EQ(configured.Execute({{"solution_code", "s"}, {"num_tests", "3.5"}}),
              "Error: num_tests must be an integer");
    EXPECT_EQ(configured.Execute({{"solution_code", "s"}, {"num_tests", "0"}}).rfind("Error: ", 0), 0u);

    StressTestTool bare(tester, "", "");
    EXPECT_EQ(bare.Execute({{"solution_code", "s"}}), "Error: judge or generator code not available");
    EXPECT_EQ(runner.calls, 0);
}

TEST(RunInteractionToolTest, ConvertsSecondsAndFallsBackToDefaults) {
    RecordingRunner runner;
    RunInteractionTool tool(runner, milliseconds(30000), milliseconds(2000));

    const auto output = tool.Execute({{"judge_code", "j"},
                                      {"solver_code", "s"},
                                      {"test_input", "3\n"},
                                      {"timeout_per_turn", "0.5"}});
    EXPECT_EQ(output.rfind("=== INTERACTION RESULT ===\nVerdict: AC\n", 0), 0u);
    EXPECT_EQ(runner.last_input, "3\n");
    EXPECT_EQ(runner.last_total, milliseconds(30000));
    EXPECT_EQ(runner.last_per_turn, milliseconds(500));

    tool.Execute({{"judge_code", "j"}, {"solver_code", "s"},
                  {"timeout_total", "nan"}, {"timeout_per_turn", "1e300"}});
    EXPECT_EQ(runner.last_total, milliseconds(30000));
    EXPECT_EQ(runner.last_per_turn, milliseconds(2000));

    EXPECT_EQ(tool.Execute({{"solver_code", "s"}}), "Error: missing judge_code");
    EXPECT_EQ(tool.Execute({{"judge_code", "j"}}), "Error: missing solver_code");
}

}  // namespace
}  // namespace interjudge::tools
