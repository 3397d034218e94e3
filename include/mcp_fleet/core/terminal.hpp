#pragma once

namespace mcp_fleet {

/// Returns true if stderr is a terminal (for colored log output).
bool IsStderrTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Resolve whether log output on stderr should be colored.
bool UseColorForStderr(bool force_color, bool force_no_color);

} // namespace mcp_fleet
