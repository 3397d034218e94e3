#include <mcp_fleet/core/line_reader.hpp>

#include <mcp_fleet/core/log.hpp>

#include <poll.h>

#include <cerrno>
#include <cstring>

namespace mcp_fleet {

namespace {

constexpr int kPollIntervalMs = 100;
constexpr std::size_t kReadChunk = 4096;
// A line longer than this is flushed as-is so one runaway writer cannot
// grow the buffer without bound.
constexpr std::size_t kMaxLineBytes = 16 * 1024 * 1024;

} // anonymous namespace

LineReader::LineReader(UniqueFd fd, std::string name, LineCallback on_line,
                       EofCallback on_eof)
    : fd_(std::move(fd)),
      name_(std::move(name)),
      on_line_(std::move(on_line)),
      on_eof_(std::move(on_eof)) {}

LineReader::~LineReader() {
    Stop();
}

void LineReader::Start() {
    if (running_.exchange(true)) {
        return;
    }
    stop_ = false;
    thread_ = std::thread([this] { Run(); });
}

void LineReader::Stop() {
    stop_ = true;
    if (thread_.joinable()) {
        if (thread_.get_id() == std::this_thread::get_id()) {
            thread_.detach();
        } else {
            thread_.join();
        }
    }
}

void LineReader::Run() {
    std::string buffer;
    char chunk[kReadChunk];

    auto emit = [&](std::string line) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (on_line_) {
            on_line_(std::move(line));
        }
    };

    while (!stop_) {
        pollfd pfd{fd_.Get(), POLLIN, 0};
        const int ready = ::poll(&pfd, 1, kPollIntervalMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            LogWarn("transport", name_ + ": poll failed: " + std::strerror(errno));
            break;
        }
        if (ready == 0) {
            continue;
        }

        const auto n = ::read(fd_.Get(), chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            LogDebug("transport", name_ + ": read failed: " + std::strerror(errno));
            break;
        }
        if (n == 0) {
            break;  // EOF
        }

        buffer.append(chunk, static_cast<std::size_t>(n));
        std::size_t start = 0;
        for (auto nl = buffer.find('\n', start); nl != std::string::npos;
             nl = buffer.find('\n', start)) {
            emit(buffer.substr(start, nl - start));
            start = nl + 1;
        }
        buffer.erase(0, start);
        if (buffer.size() > kMaxLineBytes) {
            emit(std::move(buffer));
            buffer.clear();
        }
    }

    if (!stop_) {
        if (!buffer.empty()) {
            emit(std::move(buffer));
        }
        running_ = false;
        if (on_eof_) {
            on_eof_();
        }
        return;
    }
    running_ = false;
}

} // namespace mcp_fleet
