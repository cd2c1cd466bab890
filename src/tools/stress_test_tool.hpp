#pragma once

#include <string>

#include "stress/stress_test.hpp"
#include "tools/tool.hpp"

namespace interjudge::tools {

// Exposes the stress tester as "interactive_stress_test". The generator and
// judge are usually injected once per problem; a call may still override them.
class StressTestTool : public Tool {
public:
    StressTestTool(stress::StressTester& tester,
                   std::string generator_code,
                   std::string judge_code,
                   int default_num_tests = stress::kDefaultNumTests);

    std::string Name() const override { return "interactive_stress_test"; }
    std::string Description() const override {
        return "Run the solver against the judge on many randomly generated inputs; "
               "stops at the first failure and returns the full interaction log.";
    }
    std::string ParametersJson() const override;
    std::string Execute(const std::unordered_map<std::string, std::string>& params) override;

private:
    stress::StressTester& tester_;
    std::string generator_code_;
    std::string judge_code_;
    int default_num_tests_;
};

}  // namespace interjudge::tools
