#include <mcp_fleet/session/concurrency_gate.hpp>

#include <algorithm>

namespace mcp_fleet {

ConcurrencyGate::ConcurrencyGate(int limit) : limit_(std::max(1, limit)) {}

bool ConcurrencyGate::Acquire(TimePoint deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    const auto ticket = next_ticket_++;
    auto position = queue_.insert(queue_.end(), ticket);

    const bool admitted = cv_.wait_until(lock, deadline, [&] {
        return queue_.front() == ticket && in_flight_ < limit_;
    });
    queue_.erase(position);
    if (!admitted) {
        // The next waiter may now be at the front.
        cv_.notify_all();
        return false;
    }
    ++in_flight_;
    peak_ = std::max(peak_, in_flight_);
    cv_.notify_all();
    return true;
}

void ConcurrencyGate::Release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_flight_ > 0) --in_flight_;
    }
    cv_.notify_all();
}

void ConcurrencyGate::SetLimit(int limit) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        limit_ = std::max(1, limit);
    }
    cv_.notify_all();
}

int ConcurrencyGate::Limit() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return limit_;
}

int ConcurrencyGate::InFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

int ConcurrencyGate::Waiting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(queue_.size());
}

int ConcurrencyGate::PeakInFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_;
}

} // namespace mcp_fleet
