#include <catch2/catch_test_macros.hpp>

#include <mcp_fleet/core/terminal.hpp>

#include <cstdlib>

using namespace mcp_fleet;

TEST_CASE("UseColorForStderr: explicit flags win", "[core][terminal]") {
    CHECK_FALSE(UseColorForStderr(true, true));
    CHECK_FALSE(UseColorForStderr(false, true));
    if (!NoColorEnvSet()) {
        CHECK(UseColorForStderr(true, false));
    }
}

TEST_CASE("NoColorEnvSet: follows NO_COLOR", "[core][terminal]") {
    setenv("NO_COLOR", "1", 1);
    CHECK(NoColorEnvSet());
    CHECK_FALSE(UseColorForStderr(true, false));
    unsetenv("NO_COLOR");
    CHECK_FALSE(NoColorEnvSet());
}
