#include <mcp_fleet/process/child_process.hpp>

#include <mcp_fleet/core/log.hpp>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <mutex>
#include <thread>

extern char** environ;

namespace mcp_fleet {

namespace {

constexpr Millis kReapPollInterval{20};
constexpr Millis kKillWait{2000};

// What the child reports over the exec-status pipe when it cannot exec.
struct ExecFailure {
    int stage;  // 1 = chdir, 2 = exec
    int error;
};

void IgnoreSigpipeOnce() {
    static std::once_flag once;
    std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

Error MakeSpawnError(const std::string& tool, const std::string& message) {
    return Error::Make(ErrorKind::ProcessStart, "Spawn", message, tool);
}

bool MakePipe(int fds[2]) {
    return ::pipe2(fds, O_CLOEXEC) == 0;
}

} // anonymous namespace

std::vector<std::string> BuildChildEnvironment(
    const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
        std::string entry(*e);
        const auto eq = entry.find('=');
        if (eq == std::string::npos) continue;
        merged[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    merged.emplace("PYTHONIOENCODING", "utf-8");
    merged.emplace("PYTHONUNBUFFERED", "1");
    for (const auto& [key, value] : overrides) {
        merged[key] = value;
    }

    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        out.push_back(key + "=" + value);
    }
    return out;
}

ChildProcess::ChildProcess(pid_t pid, UniqueFd in, UniqueFd out, UniqueFd err)
    : pid_(pid), stdin_(std::move(in)), stdout_(std::move(out)), stderr_(std::move(err)) {}

ChildProcess::~ChildProcess() {
    if (Alive()) {
        Kill();
    }
}

Result<std::unique_ptr<ChildProcess>, Error> ChildProcess::Spawn(const SpawnOptions& options,
                                                                 const std::string& tool) {
    using R = Result<std::unique_ptr<ChildProcess>, Error>;
    IgnoreSigpipeOnce();

    if (options.command.empty()) {
        return R::Err(MakeSpawnError(tool, "No command configured"));
    }

    // Everything the child needs is prepared before fork.
    std::vector<std::string> argv_storage;
    argv_storage.push_back(options.command);
    argv_storage.insert(argv_storage.end(), options.args.begin(), options.args.end());
    std::vector<char*> argv;
    for (auto& arg : argv_storage) argv.push_back(arg.data());
    argv.push_back(nullptr);

    auto env_storage = BuildChildEnvironment(options.env);
    std::vector<char*> envp;
    for (auto& entry : env_storage) envp.push_back(entry.data());
    envp.push_back(nullptr);

    int in_pipe[2], out_pipe[2], err_pipe[2], status_pipe[2];
    if (!MakePipe(in_pipe)) {
        return R::Err(MakeSpawnError(tool, std::string("pipe failed: ") + std::strerror(errno)));
    }
    UniqueFd in_read(in_pipe[0]), in_write(in_pipe[1]);
    if (!MakePipe(out_pipe)) {
        return R::Err(MakeSpawnError(tool, std::string("pipe failed: ") + std::strerror(errno)));
    }
    UniqueFd out_read(out_pipe[0]), out_write(out_pipe[1]);
    if (!MakePipe(err_pipe)) {
        return R::Err(MakeSpawnError(tool, std::string("pipe failed: ") + std::strerror(errno)));
    }
    UniqueFd err_read(err_pipe[0]), err_write(err_pipe[1]);
    if (!MakePipe(status_pipe)) {
        return R::Err(MakeSpawnError(tool, std::string("pipe failed: ") + std::strerror(errno)));
    }
    UniqueFd status_read(status_pipe[0]), status_write(status_pipe[1]);

    const char* cwd = options.working_directory.empty() ? nullptr
                                                        : options.working_directory.c_str();

    const pid_t pid = ::fork();
    if (pid < 0) {
        return R::Err(MakeSpawnError(tool, std::string("fork failed: ") + std::strerror(errno)));
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on.
        ::dup2(in_read.Get(), STDIN_FILENO);
        ::dup2(out_write.Get(), STDOUT_FILENO);
        ::dup2(err_write.Get(), STDERR_FILENO);
        ::setpgid(0, 0);
        ::signal(SIGPIPE, SIG_DFL);

        ExecFailure failure{0, 0};
        if (cwd != nullptr && ::chdir(cwd) != 0) {
            failure = {1, errno};
        } else {
            ::execvpe(argv[0], argv.data(), envp.data());
            failure = {2, errno};
        }
        (void)!::write(status_write.Get(), &failure, sizeof(failure));
        ::_exit(127);
    }

    // Parent.
    ::setpgid(pid, pid);
    in_read.Reset();
    out_write.Reset();
    err_write.Reset();
    status_write.Reset();

    ExecFailure failure{0, 0};
    ssize_t n;
    do {
        n = ::read(status_read.Get(), &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);

    std::unique_ptr<ChildProcess> child(
        new ChildProcess(pid, std::move(in_write), std::move(out_read), std::move(err_read)));

    if (n == static_cast<ssize_t>(sizeof(failure))) {
        child->WaitFor(kKillWait);
        const std::string what = failure.stage == 1
                                     ? "cannot enter working directory '" +
                                           options.working_directory + "'"
                                     : "cannot execute '" + options.command + "'";
        return R::Err(MakeSpawnError(tool, what + ": " + std::strerror(failure.error)));
    }

    LogInfo("process", "Spawned '" + tool + "' (pid " + std::to_string(pid) + "): " +
                           options.command);
    return R::Ok(std::move(child));
}

bool ChildProcess::ReapLocked(bool block) {
    if (reaped_) return true;
    int status = 0;
    pid_t w;
    do {
        w = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (w < 0 && errno == EINTR);
    if (w == pid_) {
        reaped_ = true;
        status_ = status;
        return true;
    }
    if (w < 0 && errno == ECHILD) {
        // Someone else reaped it; treat as gone.
        reaped_ = true;
        return true;
    }
    return false;
}

bool ChildProcess::Alive() {
    std::lock_guard<std::mutex> lock(mutex_);
    return !ReapLocked(false);
}

bool ChildProcess::WaitFor(Millis timeout) {
    const auto deadline = SteadyClock::now() + timeout;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (ReapLocked(false)) return true;
        }
        if (SteadyClock::now() >= deadline) return false;
        std::this_thread::sleep_for(kReapPollInterval);
    }
}

void ChildProcess::Terminate(Millis grace) {
    if (!Alive()) return;
    ::kill(-pid_, SIGTERM);
    ::kill(pid_, SIGTERM);
    if (WaitFor(grace)) return;
    LogWarn("process", "pid " + std::to_string(pid_) + " ignored SIGTERM; killing");
    Kill();
}

void ChildProcess::Kill() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reaped_) return;
    }
    ::kill(-pid_, SIGKILL);
    ::kill(pid_, SIGKILL);
    if (!WaitFor(kKillWait)) {
        std::lock_guard<std::mutex> lock(mutex_);
        ReapLocked(true);
    }
}

std::optional<std::string> ChildProcess::ExitDescription() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!reaped_) return std::nullopt;
    if (WIFEXITED(status_)) {
        return "exit code " + std::to_string(WEXITSTATUS(status_));
    }
    if (WIFSIGNALED(status_)) {
        return "killed by signal " + std::to_string(WTERMSIG(status_));
    }
    return "exited";
}

} // namespace mcp_fleet
