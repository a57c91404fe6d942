// ============================================================================
// serial_io.cpp: implementation for serial_io.hpp
// ============================================================================

#include "serial_io.hpp"
#include "slip.hpp"

#include <fcntl.h>         // ::open flags
#include <unistd.h>        // ::read, ::write, ::close, usleep
#include <termios.h>       // raw mode
#include <poll.h>          // bounded waits
#include <cerrno>
#include <chrono>
#include <cstring>         // strerror

namespace hideez {

// ---------------------------------------------------------------------------
// to_speed(): integer baud -> termios constant. Unknown rates use 115200.
// ---------------------------------------------------------------------------
static speed_t to_speed(int baud) {
    switch (baud) {
        case 9600:   return B9600;
        case 19200:  return B19200;
        case 38400:  return B38400;
        case 57600:  return B57600;
        case 230400: return B230400;
        default:     return B115200;
    }
}

// ---------------------------------------------------------------------------
// set_raw(): 8N1, no echo, no line discipline, no flow control.
// VMIN/VTIME are zero; read_frame() does its waiting in poll().
// ---------------------------------------------------------------------------
static bool set_raw(int fd, speed_t sp) {
    termios tio{};
    if (tcgetattr(fd, &tio) != 0) return false;

    cfmakeraw(&tio);
    cfsetispeed(&tio, sp);
    cfsetospeed(&tio, sp);

    tio.c_cflag |= (CLOCAL | CREAD);
    tio.c_cflag &= ~CRTSCTS;
    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;

    if (tcsetattr(fd, TCSANOW, &tio) != 0) return false;
    tcflush(fd, TCIOFLUSH);
    return true;
}

int open_serial(const std::string& dev, int baud, int boot_delay_ms, std::string& err) {
    int fd = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) {
        err = std::string("open_failed:") + std::strerror(errno);
        return -1;
    }

    if (!set_raw(fd, to_speed(baud))) {
        ::close(fd);
        err = "termios_failed";
        return -1;
    }

    if (boot_delay_ms > 0) usleep(static_cast<useconds_t>(boot_delay_ms) * 1000);
    tcflush(fd, TCIOFLUSH);                       // drop anything printed during reset
    return fd;
}

// ---------------------------------------------------------------------------
// write_frame()
// Loops on partial writes. EAGAIN waits for POLLOUT for up to one second.
// ---------------------------------------------------------------------------
bool write_frame(int fd, const std::vector<uint8_t>& payload, std::string& err) {
    std::vector<uint8_t> wire;
    slip::encode(payload.data(), payload.size(), wire);

    std::size_t off = 0;
    while (off < wire.size()) {
        ssize_t n = ::write(fd, wire.data() + off, wire.size() - off);
        if (n > 0) {
            off += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
            pollfd pfd{fd, POLLOUT, 0};
            if (::poll(&pfd, 1, 1000) > 0) continue;
            err = "write_failed:timeout";
            return false;
        }
        err = std::string("write_failed:") + std::strerror(errno);
        return false;
    }
    tcdrain(fd);
    return true;
}

// ---------------------------------------------------------------------------
// read_frame()
// Reads in chunks and feeds the SLIP decoder until one frame completes.
// Bytes after the closing END are discarded; the protocol is strictly
// request/response so nothing should follow.
// ---------------------------------------------------------------------------
bool read_frame(int fd, std::vector<uint8_t>& out, int timeout_ms, std::string& err) {
    slip::decoder dec;
    out.clear();
    uint8_t chunk[256];
    pollfd pfd{fd, POLLIN, 0};
    // One budget for the whole frame: bytes that never complete a frame must
    // not keep extending the wait.
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    while (true) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0) { err = "timeout"; return false; }

        int pr = ::poll(&pfd, 1, static_cast<int>(left));
        if (pr == 0) { err = "timeout"; return false; }
        if (pr < 0) {
            if (errno == EINTR) continue;
            err = "poll_failed";
            return false;
        }
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
            err = "read_failed:hangup";
            return false;
        }
        if (pfd.revents & POLLIN) {
            ssize_t n = ::read(fd, chunk, sizeof(chunk));
            if (n < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                err = std::string("read_failed:") + std::strerror(errno);
                return false;
            }
            for (ssize_t i = 0; i < n; ++i) {
                if (dec.feed(chunk[i], out)) return true;
            }
        }
    }
}

void close_serial(int fd) {
    if (fd >= 0) ::close(fd);
}

} // namespace hideez
