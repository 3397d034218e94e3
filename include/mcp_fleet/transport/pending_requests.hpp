#pragma once

#include <mcp_fleet/core/clock.hpp>
#include <mcp_fleet/core/result.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_fleet {

// ---------------------------------------------------------------------------
// PendingRequests: correlation table for one connection.
//
// Each outstanding wire id owns a slot. The reader side completes a slot by
// id exactly once; late, unknown or duplicate ids are rejected so a
// response can never reach a caller that did not issue it. A waiter that
// hits its deadline removes its own slot, which turns the eventual late
// response into an unknown id.
// ---------------------------------------------------------------------------
class PendingRequests {
public:
    struct Slot {
        std::mutex mutex;
        std::condition_variable cv;
        bool done = false;
        std::optional<nlohmann::json> response;
        std::optional<Error> error;
    };
    using SlotPtr = std::shared_ptr<Slot>;

    explicit PendingRequests(std::string tool);

    /// Next wire id (1, 2, ...). Never reused for the life of the connection.
    int64_t NextId();

    /// Register an id. If the table is already closed the slot comes back
    /// failed with the close reason.
    SlotPtr Add(int64_t id);

    /// Deliver a response. Returns false when the id is not outstanding.
    bool Complete(int64_t id, nlohmann::json response);

    /// Fail one outstanding id (e.g. the write never reached the tool).
    void Fail(int64_t id, const Error& error);

    /// Block until the slot completes or the deadline passes.
    Result<nlohmann::json, Error> Wait(const SlotPtr& slot, int64_t id, TimePoint deadline,
                                       const std::string& method);

    /// Fail every outstanding id and reject future ones.
    void Close(const Error& reason);

    [[nodiscard]] std::size_t Size() const;
    [[nodiscard]] bool Closed() const;

private:
    static void Finish(const SlotPtr& slot, std::optional<nlohmann::json> response,
                       std::optional<Error> error);

    std::string tool_;
    std::atomic<int64_t> next_id_{1};
    mutable std::mutex mutex_;
    std::map<int64_t, SlotPtr> slots_;
    std::optional<Error> closed_;
};

} // namespace mcp_fleet
