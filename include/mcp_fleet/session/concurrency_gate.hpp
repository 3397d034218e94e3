#pragma once

#include <mcp_fleet/core/clock.hpp>

#include <condition_variable>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>

namespace mcp_fleet {

// ---------------------------------------------------------------------------
// ConcurrencyGate: bounds the calls in flight against one tool instance.
//
// Waiters are admitted strictly in arrival order, so with a limit of 1 the
// calls reach the tool in the order they were submitted. A waiter whose
// deadline passes leaves the queue without disturbing the others.
// ---------------------------------------------------------------------------
class ConcurrencyGate {
public:
    explicit ConcurrencyGate(int limit);

    ConcurrencyGate(const ConcurrencyGate&) = delete;
    ConcurrencyGate& operator=(const ConcurrencyGate&) = delete;

    /// Wait for a slot until `deadline`. False on timeout.
    bool Acquire(TimePoint deadline);
    void Release();

    void SetLimit(int limit);

    [[nodiscard]] int Limit() const;
    [[nodiscard]] int InFlight() const;
    [[nodiscard]] int Waiting() const;
    /// Most calls ever in flight at once.
    [[nodiscard]] int PeakInFlight() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    int limit_;
    int in_flight_ = 0;
    int peak_ = 0;
    uint64_t next_ticket_ = 0;
    std::list<uint64_t> queue_;
};

using GatePtr = std::shared_ptr<ConcurrencyGate>;

// Holds one gate slot for its lifetime.
class GatePass {
public:
    GatePass() = default;
    explicit GatePass(GatePtr gate) : gate_(std::move(gate)) {}
    ~GatePass() { Reset(); }

    GatePass(GatePass&& other) noexcept : gate_(std::move(other.gate_)) {}
    GatePass& operator=(GatePass&& other) noexcept {
        if (this != &other) {
            Reset();
            gate_ = std::move(other.gate_);
        }
        return *this;
    }
    GatePass(const GatePass&) = delete;
    GatePass& operator=(const GatePass&) = delete;

    void Reset() {
        if (gate_) {
            gate_->Release();
            gate_.reset();
        }
    }

private:
    GatePtr gate_;
};

} // namespace mcp_fleet
