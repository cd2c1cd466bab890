#pragma once

#include <chrono>

namespace interjudge::judge {

// Tracks the total and idle budgets of one trial against a monotonic clock.
// The idle clock restarts whenever MarkActivity() is called.
class TimeoutGovernor {
public:
    using Clock = std::chrono::steady_clock;
    using Duration = std::chrono::steady_clock::duration;

    static constexpr std::chrono::milliseconds kPollQuantum{100};

    TimeoutGovernor(Duration total_budget, Duration idle_budget);

    void MarkActivity();

    Duration ElapsedTotal() const;
    Duration ElapsedIdle() const;

    bool TotalExceeded() const;
    bool IdleExceeded() const;

    // Longest the event loop may block before budgets must be re-checked:
    // min(remaining total, remaining idle, poll quantum), never negative.
    Duration NextWait() const;

private:
    Duration total_budget_;
    Duration idle_budget_;
    Clock::time_point start_;
    Clock::time_point last_activity_;
};

}  // namespace interjudge::judge
