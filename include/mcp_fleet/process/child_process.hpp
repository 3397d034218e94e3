#pragma once

#include <mcp_fleet/core/clock.hpp>
#include <mcp_fleet/core/result.hpp>
#include <mcp_fleet/core/unique_fd.hpp>

#include <sys/types.h>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcp_fleet {

struct SpawnOptions {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;  // overlaid on the parent environment
    std::string working_directory;
};

/// Parent environment overlaid with `overrides`, plus the Python stdio
/// defaults unless the caller set them. Returned as KEY=VALUE strings.
std::vector<std::string> BuildChildEnvironment(const std::map<std::string, std::string>& overrides);

// ---------------------------------------------------------------------------
// ChildProcess: one forked tool process in its own process group.
//
// stdin, stdout and stderr are pipes; the parent ends are handed out once
// with Take*(). exec failures are reported back over a close-on-exec pipe,
// so Spawn() either returns a running child or a ProcessStart error.
// The destructor kills and reaps a child that is still alive.
// ---------------------------------------------------------------------------
class ChildProcess {
public:
    static Result<std::unique_ptr<ChildProcess>, Error> Spawn(const SpawnOptions& options,
                                                              const std::string& tool);
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    [[nodiscard]] pid_t Pid() const noexcept { return pid_; }

    UniqueFd TakeStdin() { return std::move(stdin_); }
    UniqueFd TakeStdout() { return std::move(stdout_); }
    UniqueFd TakeStderr() { return std::move(stderr_); }

    /// Non-blocking liveness check; reaps the child if it has exited.
    bool Alive();

    /// Wait up to `timeout` for the child to exit. True if it exited.
    bool WaitFor(Millis timeout);

    /// SIGTERM the process group, wait `grace`, then SIGKILL and reap.
    void Terminate(Millis grace);

    /// SIGKILL the process group and reap.
    void Kill();

    /// "exit code N" / "killed by signal N" once reaped.
    [[nodiscard]] std::optional<std::string> ExitDescription() const;

private:
    ChildProcess(pid_t pid, UniqueFd in, UniqueFd out, UniqueFd err);

    bool ReapLocked(bool block);

    pid_t pid_;
    UniqueFd stdin_;
    UniqueFd stdout_;
    UniqueFd stderr_;

    mutable std::mutex mutex_;
    bool reaped_ = false;
    int status_ = 0;
};

} // namespace mcp_fleet
