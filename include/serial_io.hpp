/**
 * @page hz-serial-io Serial I/O
 * @file serial_io.hpp
 * @brief Raw-mode Linux TTY access and SLIP frame exchange with the wallet.
 *
 * @details
 * Free functions, no hidden threads. The caller owns the descriptor returned
 * by open_serial() and releases it with close_serial().
 *
 *   open_serial() -> write_frame()/read_frame() ... -> close_serial()
 *
 * All functions report failure through their return value and, where an
 * @p err parameter exists, a short stable reason string:
 *   "open_failed:<errno text>", "termios_failed", "write_failed:<errno text>",
 *   "timeout", "poll_failed", "read_failed".
 *
 * Permissions: the invoking user needs read/write access to the tty
 * (typically membership in the dialout group).
 */
#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace hideez {

/**
 * @brief Open @p dev in raw 8N1 mode.
 *
 * @param dev            tty path, e.g. "/dev/ttyACM0" or "/dev/serial/by-id/usb-..."
 * @param baud           9600, 19200, 38400, 57600, 115200 or 230400; anything else maps to 115200
 * @param boot_delay_ms  pause after open for USB CDC devices that reset on open
 * @param err            reason on failure
 * @return descriptor (>= 0) on success, -1 on failure
 */
int open_serial(const std::string& dev, int baud, int boot_delay_ms, std::string& err);

/**
 * @brief SLIP-encode @p payload and write the whole frame.
 *
 * Partial writes are continued until the frame is out or the port errors.
 */
bool write_frame(int fd, const std::vector<uint8_t>& payload, std::string& err);

/**
 * @brief Read exactly one SLIP frame.
 *
 * @param timeout_ms  upper bound on the wait for the whole frame
 * @return true with the decoded payload in @p out; false with "timeout" or an I/O reason in @p err
 */
bool read_frame(int fd, std::vector<uint8_t>& out, int timeout_ms, std::string& err);

/// Close @p fd if it is non-negative.
void close_serial(int fd);

} // namespace hideez
