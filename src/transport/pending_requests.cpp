#include <mcp_fleet/transport/pending_requests.hpp>

#include <mcp_fleet/core/log.hpp>

namespace mcp_fleet {

PendingRequests::PendingRequests(std::string tool) : tool_(std::move(tool)) {}

int64_t PendingRequests::NextId() {
    return next_id_.fetch_add(1);
}

void PendingRequests::Finish(const SlotPtr& slot, std::optional<nlohmann::json> response,
                             std::optional<Error> error) {
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->done) return;
        slot->done = true;
        slot->response = std::move(response);
        slot->error = std::move(error);
    }
    slot->cv.notify_all();
}

PendingRequests::SlotPtr PendingRequests::Add(int64_t id) {
    auto slot = std::make_shared<Slot>();
    std::optional<Error> closed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            closed = closed_;
        } else {
            slots_[id] = slot;
        }
    }
    if (closed) {
        Finish(slot, std::nullopt, std::move(closed));
    }
    return slot;
}

bool PendingRequests::Complete(int64_t id, nlohmann::json response) {
    SlotPtr slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(id);
        if (it == slots_.end()) {
            return false;
        }
        slot = it->second;
        slots_.erase(it);
    }
    Finish(slot, std::move(response), std::nullopt);
    return true;
}

void PendingRequests::Fail(int64_t id, const Error& error) {
    SlotPtr slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(id);
        if (it == slots_.end()) {
            return;
        }
        slot = it->second;
        slots_.erase(it);
    }
    Finish(slot, std::nullopt, error);
}

Result<nlohmann::json, Error> PendingRequests::Wait(const SlotPtr& slot, int64_t id,
                                                    TimePoint deadline,
                                                    const std::string& method) {
    {
        std::unique_lock<std::mutex> lock(slot->mutex);
        slot->cv.wait_until(lock, deadline, [&] { return slot->done; });
        if (slot->done) {
            if (slot->error) {
                return Result<nlohmann::json, Error>::Err(*slot->error);
            }
            return Result<nlohmann::json, Error>::Ok(std::move(*slot->response));
        }
    }

    // Deadline passed: abandon the id. A response racing in right now either
    // finished the slot already (use it) or will find the id gone.
    {
        std::lock_guard<std::mutex> lock(mutex_);
        slots_.erase(id);
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->done) {
        if (slot->error) {
            return Result<nlohmann::json, Error>::Err(*slot->error);
        }
        return Result<nlohmann::json, Error>::Ok(std::move(*slot->response));
    }
    slot->done = true;
    LogDebug("transport", "Request " + std::to_string(id) + " (" + method +
                              ") to '" + tool_ + "' timed out");
    return Result<nlohmann::json, Error>::Err(Error::Make(
        ErrorKind::RequestTimeout, method, "No response before deadline", tool_));
}

void PendingRequests::Close(const Error& reason) {
    std::map<int64_t, SlotPtr> slots;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!closed_) {
            closed_ = reason;
        }
        slots.swap(slots_);
    }
    for (auto& [id, slot] : slots) {
        Finish(slot, std::nullopt, reason);
    }
}

std::size_t PendingRequests::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

bool PendingRequests::Closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_.has_value();
}

} // namespace mcp_fleet
