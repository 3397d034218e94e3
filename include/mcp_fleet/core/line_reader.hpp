#pragma once

#include <mcp_fleet/core/unique_fd.hpp>

#include <atomic>
#include <functional>
#include <string>
#include <thread>

namespace mcp_fleet {

// ---------------------------------------------------------------------------
// LineReader: background thread that splits a pipe into lines.
//
// Partial reads are buffered until a newline arrives; a trailing '\r' is
// stripped. on_eof runs once, on the reader thread, when the pipe closes or
// fails. Stop() may be called from any thread, including from a callback.
// ---------------------------------------------------------------------------
class LineReader {
public:
    using LineCallback = std::function<void(std::string line)>;
    using EofCallback = std::function<void()>;

    LineReader(UniqueFd fd, std::string name, LineCallback on_line, EofCallback on_eof);
    ~LineReader();

    LineReader(const LineReader&) = delete;
    LineReader& operator=(const LineReader&) = delete;

    void Start();
    void Stop();

    [[nodiscard]] bool Running() const noexcept { return running_.load(); }

private:
    void Run();

    UniqueFd fd_;
    std::string name_;
    LineCallback on_line_;
    EofCallback on_eof_;
    std::atomic<bool> stop_{false};
    std::atomic<bool> running_{false};
    std::thread thread_;
};

} // namespace mcp_fleet
