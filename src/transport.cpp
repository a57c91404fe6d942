#include "hideez/transport.hpp"
#include "serial_io.hpp"

namespace hideez {

bool SerialTransport::open(std::string& err) {
    if (fd_ >= 0) return true;
    fd_ = open_serial(cfg_.dev, cfg_.baud, cfg_.boot_delay_ms, err);
    return fd_ >= 0;
}

void SerialTransport::close() {
    close_serial(fd_);
    fd_ = -1;
}

bool SerialTransport::write(const std::vector<uint8_t>& frame, std::string& err) {
    if (fd_ < 0) { err = "not_open"; return false; }
    return write_frame(fd_, frame, err);
}

bool SerialTransport::read(std::vector<uint8_t>& frame, int timeout_ms, std::string& err) {
    if (fd_ < 0) { err = "not_open"; return false; }
    return read_frame(fd_, frame, timeout_ms, err);
}

} // namespace hideez
