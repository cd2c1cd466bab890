#pragma once

#include <string>

#include "nlohmann/json.hpp"

#include "judge/interaction_runner.hpp"
#include "stress/stress_test.hpp"

namespace interjudge::stress {

// Plain-text rendering meant to be read by whoever fixes the solver.
std::string FormatReport(const StressTestReport& report);
std::string FormatInteraction(const judge::InteractionResult& result);

nlohmann::json InteractionResultToJson(const judge::InteractionResult& result);
nlohmann::json ReportToJson(const StressTestReport& report);

}  // namespace interjudge::stress
