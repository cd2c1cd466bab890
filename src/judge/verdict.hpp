#pragma once

namespace interjudge::judge {

enum class Verdict {
    kAccepted,
    kWrongAnswer,
    kProtocolError,
    kTimeLimitExceeded,
    kRuntimeError
};

// Short form used in transcripts and reports: "AC", "WA", "PE", "TLE", "RE".
const char* ToString(Verdict verdict);

// Judge exit code convention: 0 accepted, 1 wrong answer, 2 protocol error.
// Every other code, including signal terminations, is a runtime error.
Verdict ResolveVerdict(int exit_code);

}  // namespace interjudge::judge
