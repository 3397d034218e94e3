#include <catch2/catch_test_macros.hpp>

#include <mcp_fleet/core/line_reader.hpp>

#include <unistd.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>

using namespace mcp_fleet;

namespace {

struct Collected {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::string> lines;
    bool eof = false;

    bool WaitForEof() {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, std::chrono::seconds(5), [this] { return eof; });
    }
};

void WriteAll(int fd, const std::string& text) {
    auto written = ::write(fd, text.data(), text.size());
    REQUIRE(written == static_cast<ssize_t>(text.size()));
}

} // anonymous namespace

TEST_CASE("LineReader: splits chunks into lines and reports EOF", "[core][line_reader]") {
    int fds[2];
    REQUIRE(::pipe(fds) == 0);
    UniqueFd write_end(fds[1]);

    Collected got;
    LineReader reader(
        UniqueFd(fds[0]), "test",
        [&got](std::string line) {
            std::lock_guard<std::mutex> lock(got.mutex);
            got.lines.push_back(std::move(line));
        },
        [&got] {
            std::lock_guard<std::mutex> lock(got.mutex);
            got.eof = true;
            got.cv.notify_all();
        });
    reader.Start();

    WriteAll(write_end.Get(), "{\"a\":1}\r\n{\"b\"");
    WriteAll(write_end.Get(), ":2}\n\ntrailing");
    write_end.Reset();

    REQUIRE(got.WaitForEof());
    std::lock_guard<std::mutex> lock(got.mutex);
    CHECK(got.lines == std::vector<std::string>{"{\"a\":1}", "{\"b\":2}", "", "trailing"});
    CHECK_FALSE(reader.Running());
}

TEST_CASE("LineReader: Stop does not report EOF", "[core][line_reader]") {
    int fds[2];
    REQUIRE(::pipe(fds) == 0);
    UniqueFd write_end(fds[1]);

    bool eof = false;
    LineReader reader(UniqueFd(fds[0]), "test", [](std::string) {}, [&eof] { eof = true; });
    reader.Start();
    CHECK(reader.Running());
    reader.Stop();
    CHECK_FALSE(eof);
}
