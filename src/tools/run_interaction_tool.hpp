#pragma once

#include <chrono>
#include <string>

#include "judge/interaction_runner.hpp"
#include "tools/tool.hpp"

namespace interjudge::tools {

class RunInteractionTool : public Tool {
public:
    RunInteractionTool(judge::InteractionRunner& runner,
                       std::chrono::milliseconds default_total,
                       std::chrono::milliseconds default_per_turn);

    std::string Name() const override { return "run_interaction"; }
    std::string Description() const override {
        return "Run the solver against the judge once on the given test input.";
    }
    std::string ParametersJson() const override;
    std::string Execute(const std::unordered_map<std::string, std::string>& params) override;

private:
    judge::InteractionRunner& runner_;
    std::chrono::milliseconds default_total_;
    std::chrono::milliseconds default_per_turn_;
};

}  // namespace interjudge::tools
