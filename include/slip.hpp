#pragma once

/**
 * @page hz-slip SLIP Framing
 * @file slip.hpp
 * @brief SLIP (RFC 1055) encoder and byte-at-a-time decoder for the device link.
 *
 * @details
 * Every request and reply exchanged with the wallet travels as one SLIP frame.
 * The frame only marks boundaries; the payload inside is opaque to this header.
 *
 * Byte values:
 *   END     (0xC0) frame boundary
 *   ESC     (0xDB) escape introducer
 *   ESC_END (0xDC) escaped END inside payload
 *   ESC_ESC (0xDD) escaped ESC inside payload
 *
 * Encoding: END, payload with END/ESC escaped, END.
 *
 * Decoding:
 *   - Bytes are ignored until an END opens a frame.
 *   - END with a non-empty buffer closes the frame; END with an empty buffer
 *     (re)opens one, so boot chatter and back-to-back END bytes are dropped.
 *   - ESC followed by anything other than ESC_END/ESC_ESC drops the partial
 *     frame; the decoder waits for the next END.
 *
 * @code
 *   std::vector<uint8_t> wire;
 *   hideez::slip::encode(payload.data(), payload.size(), wire);
 *
 *   hideez::slip::decoder dec;
 *   std::vector<uint8_t> frame;
 *   for (uint8_t b : wire)
 *       if (dec.feed(b, frame)) handle(frame);
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <vector>

namespace hideez {
namespace slip {

constexpr uint8_t END     = 0xC0;
constexpr uint8_t ESC     = 0xDB;
constexpr uint8_t ESC_END = 0xDC;
constexpr uint8_t ESC_ESC = 0xDD;

/**
 * @brief Append one SLIP frame carrying @p len bytes at @p data to @p out.
 *
 * @p out is cleared first. Worst case output size is 2 * len + 2.
 */
inline void encode(const uint8_t* data, std::size_t len, std::vector<uint8_t>& out) {
    out.clear();
    out.reserve(len * 2 + 2);
    out.push_back(END);
    for (std::size_t i = 0; i < len; ++i) {
        const uint8_t b = data[i];
        if (b == END) {
            out.push_back(ESC);
            out.push_back(ESC_END);
        } else if (b == ESC) {
            out.push_back(ESC);
            out.push_back(ESC_ESC);
        } else {
            out.push_back(b);
        }
    }
    out.push_back(END);
}

inline std::vector<uint8_t> encode(const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> out;
    encode(payload.data(), payload.size(), out);
    return out;
}

/**
 * @brief Stateful SLIP decoder. Feed bytes as they arrive from the port.
 */
class decoder {
public:
    /**
     * @brief Consume one byte.
     * @param b      next byte from the stream
     * @param frame  receives the payload when a frame completes
     * @return true when @p frame holds a complete, non-empty payload
     */
    bool feed(uint8_t b, std::vector<uint8_t>& frame) {
        if (b == END) {
            if (in_frame_ && !buf_.empty()) {
                frame.swap(buf_);
                buf_.clear();
                in_frame_ = false;
                esc_ = false;
                return true;
            }
            buf_.clear();
            in_frame_ = true;
            esc_ = false;
            return false;
        }

        if (!in_frame_) return false;

        if (esc_) {
            esc_ = false;
            if (b == ESC_END) {
                b = END;
            } else if (b == ESC_ESC) {
                b = ESC;
            } else {
                reset();
                return false;
            }
        } else if (b == ESC) {
            esc_ = true;
            return false;
        }

        buf_.push_back(b);
        return false;
    }

    /// Drop any partial frame and wait for the next END.
    void reset() {
        buf_.clear();
        in_frame_ = false;
        esc_ = false;
    }

    bool in_frame() const { return in_frame_; }

private:
    std::vector<uint8_t> buf_;
    bool esc_ = false;
    bool in_frame_ = false;
};

} // namespace slip
} // namespace hideez
