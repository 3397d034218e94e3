#pragma once

#include <cstddef>
#include <deque>
#include <utility>
#include <vector>

namespace mcp_fleet {

// ---------------------------------------------------------------------------
// RingBuffer<T>: bounded FIFO that evicts the oldest entry when full.
//
// Not synchronized; owners guard it with their own mutex.
// ---------------------------------------------------------------------------
template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    void Push(T value) {
        if (items_.size() == capacity_) {
            items_.pop_front();
            ++dropped_;
        }
        items_.push_back(std::move(value));
    }

    [[nodiscard]] std::vector<T> Snapshot() const {
        return std::vector<T>(items_.begin(), items_.end());
    }

    /// The newest `n` entries, oldest first.
    [[nodiscard]] std::vector<T> Tail(size_t n) const {
        if (n >= items_.size()) return Snapshot();
        return std::vector<T>(items_.end() - static_cast<std::ptrdiff_t>(n), items_.end());
    }

    [[nodiscard]] const T& Back() const { return items_.back(); }
    [[nodiscard]] size_t Size() const noexcept { return items_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return items_.empty(); }
    [[nodiscard]] size_t Capacity() const noexcept { return capacity_; }
    [[nodiscard]] size_t Dropped() const noexcept { return dropped_; }

    void Clear() {
        items_.clear();
        dropped_ = 0;
    }

private:
    size_t capacity_;
    size_t dropped_ = 0;
    std::deque<T> items_;
};

} // namespace mcp_fleet
