#include "stress/report_format.hpp"

#include <iomanip>
#include <sstream>

#include "utils/common.hpp"

namespace interjudge::stress {
namespace {

void AppendOutcome(std::ostringstream& out, const judge::InteractionResult& result) {
    out << "Verdict: " << judge::ToString(result.verdict) << "\n";
    out << "Time: " << std::fixed << std::setprecision(1)
        << static_cast<double>(result.elapsed.count()) << "ms\n";
    if (result.exit_code) {
        out << "Exit Code: " << *result.exit_code << "\n";
    }
    if (result.error_message) {
        out << "Error: " << *result.error_message << "\n";
    }
}

nlohmann::json OptionalInt(const std::optional<int>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json OptionalString(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

}  // namespace

std::string FormatInteraction(const judge::InteractionResult& result) {
    std::ostringstream out;
    out << "=== INTERACTION RESULT ===\n";
    AppendOutcome(out, result);
    out << "\nInteraction Log:\n" << result.TranscriptText();
    return out.str();
}

std::string FormatReport(const StressTestReport& report) {
    std::ostringstream out;
    switch (report.kind) {
        case ReportKind::kPassed:
            out << "=== INTERACTIVE STRESS TEST PASSED ===\n"
                << "All " << report.num_tests << " tests passed!";
            break;
        case ReportKind::kGeneratorFailed: {
            const auto& failure = *report.generator;
            out << "=== GENERATOR ERROR ===\n"
                << "Test #" << report.trial << "\n"
                << "Error:\n"
                << (failure.error_message.empty() ? "Unknown error" : failure.error_message) << "\n"
                << "Stdout:\n"
                << utils::TrimRight(failure.partial_output) << "\n"
                << "Status: " << sandbox::ToString(failure.status);
            break;
        }
        case ReportKind::kInteractionFailed: {
            const auto& result = *report.interaction;
            out << "=== INTERACTIVE TEST FAILED ===\n"
                << "Test #" << report.trial << "\n";
            AppendOutcome(out, result);
            out << "\nTest Input:\n" << report.test_input;
            if (!report.test_input.empty() && report.test_input.back() != '\n') {
                out << "\n";
            }
            out << "\nInteraction Log:\n" << result.TranscriptText();
            break;
        }
    }
    return out.str();
}

nlohmann::json InteractionResultToJson(const judge::InteractionResult& result) {
    nlohmann::json transcript = nlohmann::json::array();
    for (const auto& line : result.transcript) {
        transcript.push_back(line.Render());
    }
    return {
        {"verdict", judge::ToString(result.verdict)},
        {"time_ms", result.elapsed.count()},
        {"exit_code", OptionalInt(result.exit_code)},
        {"error", OptionalString(result.error_message)},
        {"transcript", std::move(transcript)}
    };
}

nlohmann::json ReportToJson(const StressTestReport& report) {
    nlohmann::json json = nlohmann::json::object();
    json["kind"] = ToString(report.kind);
    json["num_tests"] = report.num_tests;
    json["trial"] = report.trial == 0 ? nlohmann::json(nullptr) : nlohmann::json(report.trial);
    switch (report.kind) {
        case ReportKind::kPassed:
            break;
        case ReportKind::kGeneratorFailed:
            json["status"] = sandbox::ToString(report.generator->status);
            json["error"] = report.generator->error_message;
            json["output"] = report.generator->partial_output;
            break;
        case ReportKind::kInteractionFailed: {
            auto interaction = InteractionResultToJson(*report.interaction);
            for (auto& item : interaction.items()) {
                json[item.key()] = item.value();
            }
            json["input"] = report.test_input;
            break;
        }
    }
    return json;
}

}  // namespace interjudge::stress
