#include <mcp_fleet/core/terminal.hpp>

#include <cstdlib>

#include <unistd.h>

namespace mcp_fleet {

bool IsStderrTty() {
    return isatty(STDERR_FILENO) != 0;
}

bool NoColorEnvSet() {
    const char* val = std::getenv("NO_COLOR");
    return val != nullptr;
}

bool UseColorForStderr(bool force_color, bool force_no_color) {
    if (force_no_color || NoColorEnvSet()) return false;
    return force_color || IsStderrTty();
}

} // namespace mcp_fleet
