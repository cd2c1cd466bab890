#include "judge/timeout_governor.hpp"

#include <algorithm>

namespace interjudge::judge {

TimeoutGovernor::TimeoutGovernor(Duration total_budget, Duration idle_budget)
    : total_budget_(total_budget)
    , idle_budget_(idle_budget)
    , start_(Clock::now())
    , last_activity_(start_) {}

void TimeoutGovernor::MarkActivity() {
    last_activity_ = Clock::now();
}

TimeoutGovernor::Duration TimeoutGovernor::ElapsedTotal() const {
    return Clock::now() - start_;
}

TimeoutGovernor::Duration TimeoutGovernor::ElapsedIdle() const {
    return Clock::now() - last_activity_;
}

bool TimeoutGovernor::TotalExceeded() const {
    return ElapsedTotal() > total_budget_;
}

bool TimeoutGovernor::IdleExceeded() const {
    return ElapsedIdle() > idle_budget_;
}

TimeoutGovernor::Duration TimeoutGovernor::NextWait() const {
    const auto now = Clock::now();
    const Duration remaining_total = total_budget_ - (now - start_);
    const Duration remaining_idle = idle_budget_ - (now - last_activity_);
    const Duration quantum = std::chrono::duration_cast<Duration>(kPollQuantum);
    return std::max(Duration::zero(), std::min({remaining_total, remaining_idle, quantum}));
}

}  // namespace interjudge::judge
