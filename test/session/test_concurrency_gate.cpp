#include <catch2/catch_test_macros.hpp>

#include <mcp_fleet/session/concurrency_gate.hpp>

#include "../mocks/fixtures.hpp"

#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

using namespace mcp_fleet;
using namespace mcp_fleet::testing;

namespace {

TimePoint In(Millis ms) {
    return SteadyClock::now() + ms;
}

} // anonymous namespace

TEST_CASE("ConcurrencyGate: admits up to the limit", "[session][gate]") {
    ConcurrencyGate gate(2);
    CHECK(gate.Acquire(In(Millis(50))));
    CHECK(gate.Acquire(In(Millis(50))));
    CHECK(gate.InFlight() == 2);
    CHECK_FALSE(gate.Acquire(In(Millis(50))));
    CHECK(gate.Waiting() == 0);

    gate.Release();
    CHECK(gate.Acquire(In(Millis(50))));
    CHECK(gate.PeakInFlight() == 2);
}

TEST_CASE("ConcurrencyGate: limit is at least one", "[session][gate]") {
    ConcurrencyGate gate(0);
    CHECK(gate.Limit() == 1);
    gate.SetLimit(-3);
    CHECK(gate.Limit() == 1);
}

TEST_CASE("ConcurrencyGate: waiters are admitted in arrival order", "[session][gate]") {
    ConcurrencyGate gate(1);
    REQUIRE(gate.Acquire(In(Millis(1000))));

    std::mutex order_mutex;
    std::vector<int> order;
    std::vector<std::thread> waiters;
    for (int i = 0; i < 4; ++i) {
        waiters.emplace_back([&, i] {
            if (gate.Acquire(In(Millis(5000)))) {
                {
                    std::lock_guard<std::mutex> lock(order_mutex);
                    order.push_back(i);
                }
                gate.Release();
            }
        });
        // Each waiter must be queued before the next one starts.
        REQUIRE(WaitUntil([&] { return gate.Waiting() == i + 1; }));
    }

    gate.Release();
    for (auto& t : waiters) t.join();

    CHECK(order == std::vector<int>{0, 1, 2, 3});
    CHECK(gate.PeakInFlight() == 1);
    CHECK(gate.InFlight() == 0);
}

TEST_CASE("ConcurrencyGate: a timed-out waiter does not block the queue", "[session][gate]") {
    ConcurrencyGate gate(1);
    REQUIRE(gate.Acquire(In(Millis(1000))));

    std::atomic<bool> first_admitted{true};
    std::atomic<bool> second_admitted{false};
    std::thread first([&] { first_admitted = gate.Acquire(In(Millis(50))); });
    REQUIRE(WaitUntil([&] { return gate.Waiting() == 1; }));
    std::thread second([&] {
        if (gate.Acquire(In(Millis(5000)))) {
            second_admitted = true;
            gate.Release();
        }
    });

    first.join();
    CHECK_FALSE(first_admitted);
    gate.Release();
    second.join();
    CHECK(second_admitted);
}

TEST_CASE("ConcurrencyGate: raising the limit wakes waiters", "[session][gate]") {
    ConcurrencyGate gate(1);
    REQUIRE(gate.Acquire(In(Millis(1000))));

    std::atomic<bool> admitted{false};
    std::thread waiter([&] { admitted = gate.Acquire(In(Millis(5000))); });
    REQUIRE(WaitUntil([&] { return gate.Waiting() == 1; }));

    gate.SetLimit(2);
    waiter.join();
    CHECK(admitted);
    CHECK(gate.InFlight() == 2);
}

TEST_CASE("GatePass: releases on destruction and move", "[session][gate]") {
    auto gate = std::make_shared<ConcurrencyGate>(1);
    {
        REQUIRE(gate->Acquire(In(Millis(50))));
        GatePass pass(gate);
        CHECK(gate->InFlight() == 1);

        GatePass moved = std::move(pass);
        CHECK(gate->InFlight() == 1);
    }
    CHECK(gate->InFlight() == 0);

    REQUIRE(gate->Acquire(In(Millis(50))));
    GatePass pass(gate);
    pass.Reset();
    CHECK(gate->InFlight() == 0);
    pass.Reset();
    CHECK(gate->InFlight() == 0);
}
