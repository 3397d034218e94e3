#pragma once

#include <chrono>

namespace mcp_fleet {

using SteadyClock = std::chrono::steady_clock;
using TimePoint = SteadyClock::time_point;
using Millis = std::chrono::milliseconds;

// ---------------------------------------------------------------------------
// IClock: monotonic time source.
//
// Session lifecycle sweeps and health bookkeeping read time through this
// interface so tests can drive them with a manual clock instead of real
// waits. Deadlines on wire I/O always use SteadyClock directly.
// ---------------------------------------------------------------------------
class IClock {
public:
    virtual ~IClock() = default;
    [[nodiscard]] virtual TimePoint Now() const = 0;
};

class SystemClock : public IClock {
public:
    [[nodiscard]] TimePoint Now() const override { return SteadyClock::now(); }
};

/// Process-wide SystemClock for components constructed without a clock.
inline IClock& DefaultClock() {
    static SystemClock clock;
    return clock;
}

template <typename Duration>
[[nodiscard]] Millis ToMillis(Duration d) {
    return std::chrono::duration_cast<Millis>(d);
}

/// Convert a duration in (possibly fractional) seconds to milliseconds.
[[nodiscard]] inline Millis SecondsToMillis(double seconds) {
    return Millis(static_cast<Millis::rep>(seconds * 1000.0));
}

} // namespace mcp_fleet
