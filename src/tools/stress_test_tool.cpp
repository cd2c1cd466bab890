#include "tools/stress_test_tool.hpp"

#include <stdexcept>

#include "stress/report_format.hpp"
#include "utils/common.hpp"

namespace interjudge::tools {
namespace {

std::string Lookup(const std::unordered_map<std::string, std::string>& params,
                   const std::string& key,
                   const std::string& fallback) {
    auto it = params.find(key);
    if (it == params.end() || it->second.empty()) {
        return fallback;
    }
    return it->second;
}

}  // namespace

StressTestTool::StressTestTool(stress::StressTester& tester,
                               std::string generator_code,
                               std::string judge_code,
                               int default_num_tests)
    : tester_(tester)
    , generator_code_(std::move(generator_code))
    , judge_code_(std::move(judge_code))
    , default_num_tests_(default_num_tests) {}

std::string StressTestTool::ParametersJson() const {
    return R"({"type":"object","properties":{)"
           R"("solution_code":{"type":"string","description":"Solver source code"},)"
           R"("generator_code":{"type":"string","description":"Random input generator source code"},)"
           R"("judge_code":{"type":"string","description":"Judge source code; exit 0 AC, 1 WA, 2 PE"},)"
           R"("num_tests":{"type":"integer","minimum":1}},)"
           R"("required":["solution_code"]})";
}

std::string StressTestTool::Execute(const std::unordered_map<std::string, std::string>& params) {
    const auto solution_code = Lookup(params, "solution_code", "");
    if (solution_code.empty()) {
        return "Error: missing solution_code";
    }
    const auto generator_code = Lookup(params, "generator_code", generator_code_);
    const auto judge_code = Lookup(params, "judge_code", judge_code_);
    if (generator_code.empty() || judge_code.empty()) {
        return "Error: judge or generator code not available";
    }

    int num_tests = default_num_tests_;
    const auto num_tests_text = Lookup(params, "num_tests", "");
    if (!num_tests_text.empty()) {
        const auto parsed = utils::ParseInt(num_tests_text);
        if (!parsed) {
            return "Error: num_tests must be an integer";
        }
        num_tests = *parsed;
    }

    try {
        const auto report = tester_.Run(solution_code, generator_code, judge_code, num_tests);
        return stress::FormatReport(report);
    } catch (const std::invalid_argument& ex) {
        return std::string("Error: ") + ex.what();
    } catch (const judge::InteractionSetupError& ex) {
        return std::string("Error: cannot start interaction: ") + ex.what();
    }
}

}  // namespace interjudge::tools
