#include <doctest/doctest.h>
#include "serial_io.hpp"
#include "slip.hpp"

#include <unistd.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace hideez;

namespace {

// Both ends of a pipe, closed on scope exit.
struct Pipe {
    int rd = -1, wr = -1;
    Pipe() {
        int fds[2];
        REQUIRE(::pipe(fds) == 0);
        rd = fds[0];
        wr = fds[1];
    }
    ~Pipe() {
        close_serial(rd);
        close_serial(wr);
    }
};

} // namespace

TEST_CASE("read_frame returns a frame written by write_frame") {
    Pipe p;
    const std::vector<uint8_t> payload{'{', '}', slip::END, slip::ESC};
    std::string err;
    REQUIRE(write_frame(p.wr, payload, err));

    std::vector<uint8_t> out;
    REQUIRE(read_frame(p.rd, out, 200, err));
    CHECK(out == payload);
}

TEST_CASE("read_frame times out on a silent line") {
    Pipe p;
    std::vector<uint8_t> out;
    std::string err;
    CHECK(!read_frame(p.rd, out, 20, err));
    CHECK(err == "timeout");
}

TEST_CASE("Steady noise without a frame end still times out") {
    Pipe p;
    std::atomic<bool> stop{false};
    std::thread noise([&] {
        const uint8_t b = 0x55;
        for (int i = 0; i < 80 && !stop; ++i) {
            if (::write(p.wr, &b, 1) != 1) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    });

    const auto t0 = std::chrono::steady_clock::now();
    std::vector<uint8_t> out;
    std::string err;
    const bool ok = read_frame(p.rd, out, 50, err);
    const auto elapsed = std::chrono::steady_clock::now() - t0;

    stop = true;
    noise.join();

    CHECK(!ok);
    CHECK(err == "timeout");
    CHECK(elapsed < std::chrono::milliseconds(300));
}
