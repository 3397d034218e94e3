#pragma once

#include <mcp_fleet/core/clock.hpp>

#include <algorithm>

namespace mcp_fleet {

// ---------------------------------------------------------------------------
// BackoffPolicy: delay before automatic restart number `attempt` (0-based):
// min(base * 2^attempt, max). `max_attempts` bounds how many automatic
// restarts are made before the tool is declared failed.
// ---------------------------------------------------------------------------
class BackoffPolicy {
public:
    BackoffPolicy(Millis base, Millis max, int max_attempts)
        : base_(base), max_(std::max(base, max)), max_attempts_(std::max(0, max_attempts)) {}

    [[nodiscard]] Millis DelayFor(int attempt) const {
        if (attempt <= 0 || base_.count() == 0) {
            return std::min(base_, max_);
        }
        auto delay = base_.count();
        for (int i = 0; i < attempt; ++i) {
            if (delay > max_.count() / 2) {
                return max_;
            }
            delay *= 2;
        }
        return std::min(Millis(delay), max_);
    }

    /// True once `attempts_made` automatic restarts have used up the budget.
    [[nodiscard]] bool Exhausted(int attempts_made) const noexcept {
        return attempts_made >= max_attempts_;
    }

    /// Upper bound on the total delay spent across a full restart budget.
    [[nodiscard]] Millis TotalDelay() const {
        Millis total{0};
        for (int i = 0; i < max_attempts_; ++i) {
            total += DelayFor(i);
        }
        return total;
    }

    [[nodiscard]] Millis Base() const noexcept { return base_; }
    [[nodiscard]] Millis Max() const noexcept { return max_; }
    [[nodiscard]] int MaxAttempts() const noexcept { return max_attempts_; }

private:
    Millis base_;
    Millis max_;
    int max_attempts_;
};

} // namespace mcp_fleet
