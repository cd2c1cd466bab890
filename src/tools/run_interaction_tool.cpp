#include "tools/run_interaction_tool.hpp"

#include <optional>

#include "stress/report_format.hpp"
#include "utils/common.hpp"

namespace interjudge::tools {
namespace {

// nullopt when absent, malformed, not positive or out of range.
std::optional<std::chrono::milliseconds> ParseSeconds(
    const std::unordered_map<std::string, std::string>& params,
    const std::string& key) {
    auto it = params.find(key);
    if (it == params.end() || it->second.empty()) {
        return std::nullopt;
    }
    return utils::ParseSeconds(it->second);
}

}  // namespace

RunInteractionTool::RunInteractionTool(judge::InteractionRunner& runner,
                                       std::chrono::milliseconds default_total,
                                       std::chrono::milliseconds default_per_turn)
    : runner_(runner)
    , default_total_(default_total)
    , default_per_turn_(default_per_turn) {}

std::string RunInteractionTool::ParametersJson() const {
    return R"({"type":"object","properties":{)"
           R"("judge_code":{"type":"string"},)"
           R"("solver_code":{"type":"string"},)"
           R"("test_input":{"type":"string"},)"
           R"("timeout_total":{"type":"number","description":"seconds"},)"
           R"("timeout_per_turn":{"type":"number","description":"seconds"}},)"
           R"("required":["judge_code","solver_code","test_input"]})";
}

std::string RunInteractionTool::Execute(const std::unordered_map<std::string, std::string>& params) {
    auto judge_it = params.find("judge_code");
    auto solver_it = params.find("solver_code");
    if (judge_it == params.end() || judge_it->second.empty()) {
        return "Error: missing judge_code";
    }
    if (solver_it == params.end() || solver_it->second.empty()) {
        return "Error: missing solver_code";
    }
    auto input_it = params.find("test_input");
    const std::string test_input = input_it == params.end() ? std::string() : input_it->second;

    const auto total = ParseSeconds(params, "timeout_total").value_or(default_total_);
    const auto per_turn = ParseSeconds(params, "timeout_per_turn").value_or(default_per_turn_);

    try {
        const auto result = runner_.Run(judge_it->second, solver_it->second, test_input, total, per_turn);
        return stress::FormatInteraction(result);
    } catch (const judge::InteractionSetupError& ex) {
        return std::string("Error: cannot start interaction: ") + ex.what();
    }
}

}  // namespace interjudge::tools
