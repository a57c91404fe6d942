#pragma once
/**
 * @file transport.hpp
 * @brief Frame transport seam between the client and the physical link.
 *
 * The client never touches file descriptors. It writes and reads whole
 * frames through ITransport; SerialTransport backs that with serial_io.
 * Tests substitute an in-memory implementation.
 */

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace hideez {

/**
 * @brief One opened (or openable) device link.
 *
 * Contract:
 *  - open() acquires the link; calling it twice is harmless.
 *  - write() sends one frame; read() returns one frame or fails.
 *  - close() releases the link; the destructor of implementations calls it.
 *  - get_path() is the "serial:/dev/..." style identifier shown to users.
 */
class ITransport {
public:
    virtual ~ITransport() = default;
    virtual bool open(std::string& err) = 0;
    virtual void close() = 0;
    virtual bool write(const std::vector<uint8_t>& frame, std::string& err) = 0;
    virtual bool read(std::vector<uint8_t>& frame, int timeout_ms, std::string& err) = 0;
    virtual std::string get_path() const = 0;
};

struct SerialConfig {
    std::string dev;          // e.g. /dev/ttyACM0
    int baud{115200};
    int boot_delay_ms{400};
};

constexpr const char* SERIAL_PREFIX = "serial:";

/// SLIP-framed serial link. Owns its descriptor.
class SerialTransport : public ITransport {
public:
    explicit SerialTransport(SerialConfig cfg) : cfg_(std::move(cfg)) {}
    ~SerialTransport() override { close(); }

    SerialTransport(const SerialTransport&) = delete;
    SerialTransport& operator=(const SerialTransport&) = delete;

    bool open(std::string& err) override;
    void close() override;
    bool write(const std::vector<uint8_t>& frame, std::string& err) override;
    bool read(std::vector<uint8_t>& frame, int timeout_ms, std::string& err) override;
    std::string get_path() const override { return SERIAL_PREFIX + cfg_.dev; }

    bool is_open() const { return fd_ >= 0; }

private:
    SerialConfig cfg_;
    int fd_{-1};
};

} // namespace hideez
