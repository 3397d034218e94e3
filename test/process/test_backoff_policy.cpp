#include <catch2/catch_test_macros.hpp>

#include <mcp_fleet/process/backoff_policy.hpp>

using namespace mcp_fleet;

TEST_CASE("BackoffPolicy: doubles up to the cap", "[process][backoff]") {
    BackoffPolicy policy(Millis(5000), Millis(60000), 3);
    CHECK(policy.DelayFor(0) == Millis(5000));
    CHECK(policy.DelayFor(1) == Millis(10000));
    CHECK(policy.DelayFor(2) == Millis(20000));
    CHECK(policy.DelayFor(3) == Millis(40000));
    CHECK(policy.DelayFor(4) == Millis(60000));
    CHECK(policy.DelayFor(60) == Millis(60000));
}

TEST_CASE("BackoffPolicy: attempt budget", "[process][backoff]") {
    BackoffPolicy policy(Millis(100), Millis(1000), 2);
    CHECK_FALSE(policy.Exhausted(0));
    CHECK_FALSE(policy.Exhausted(1));
    CHECK(policy.Exhausted(2));
    CHECK(policy.TotalDelay() == Millis(300));

    BackoffPolicy none(Millis(100), Millis(1000), -4);
    CHECK(none.MaxAttempts() == 0);
    CHECK(none.Exhausted(0));
}

TEST_CASE("BackoffPolicy: degenerate settings", "[process][backoff]") {
    BackoffPolicy zero(Millis(0), Millis(1000), 3);
    CHECK(zero.DelayFor(5) == Millis(0));

    BackoffPolicy inverted(Millis(500), Millis(100), 3);
    CHECK(inverted.Max() == Millis(500));
    CHECK(inverted.DelayFor(2) == Millis(500));
}
