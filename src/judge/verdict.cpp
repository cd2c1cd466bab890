#include "judge/verdict.hpp"

namespace interjudge::judge {

const char* ToString(Verdict verdict) {
    switch (verdict) {
        case Verdict::kAccepted: return "AC";
        case Verdict::kWrongAnswer: return "WA";
        case Verdict::kProtocolError: return "PE";
        case Verdict::kTimeLimitExceeded: return "TLE";
        case Verdict::kRuntimeError: return "RE";
    }
    return "RE";
}

Verdict ResolveVerdict(int exit_code) {
    switch (exit_code) {
        case 0: return Verdict::kAccepted;
        case 1: return Verdict::kWrongAnswer;
        case 2: return Verdict::kProtocolError;
        default: return Verdict::kRuntimeError;
    }
}

}  // namespace interjudge::judge
