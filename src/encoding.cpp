#include "hideez/encoding.hpp"

#include <cctype>

namespace hideez {

static inline int unhex_nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    return -1;
}

std::string to_hex(const Bytes& v) {
    static constexpr char LUT[] = "0123456789abcdef";
    std::string out;
    out.resize(v.size() * 2);
    for (std::size_t i = 0; i < v.size(); ++i) {
        out[2 * i]     = LUT[v[i] >> 4];
        out[2 * i + 1] = LUT[v[i] & 0x0F];
    }
    return out;
}

bool from_hex(const std::string& raw, Bytes& out) {
    std::size_t start = 0;
    if (raw.size() >= 2 && raw[0] == '0' && (raw[1] == 'x' || raw[1] == 'X')) start = 2;

    const std::size_t n = raw.size() - start;
    if (n % 2 != 0) return false;

    Bytes result(n / 2);
    for (std::size_t i = 0; i < result.size(); ++i) {
        const int hi = unhex_nibble(raw[start + 2 * i]);
        const int lo = unhex_nibble(raw[start + 2 * i + 1]);
        if (hi < 0 || lo < 0) return false;
        result[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    out.swap(result);
    return true;
}

// ============================================================================
// base64
// ============================================================================

static const char B64[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

static inline int unb64(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

std::string to_base64(const Bytes& v) {
    std::string out;
    out.reserve(((v.size() + 2) / 3) * 4);

    std::size_t i = 0;
    for (; i + 3 <= v.size(); i += 3) {
        const uint32_t w = (uint32_t(v[i]) << 16) | (uint32_t(v[i + 1]) << 8) | v[i + 2];
        out.push_back(B64[(w >> 18) & 0x3F]);
        out.push_back(B64[(w >> 12) & 0x3F]);
        out.push_back(B64[(w >> 6) & 0x3F]);
        out.push_back(B64[w & 0x3F]);
    }

    const std::size_t rest = v.size() - i;
    if (rest == 1) {
        const uint32_t w = uint32_t(v[i]) << 16;
        out.push_back(B64[(w >> 18) & 0x3F]);
        out.push_back(B64[(w >> 12) & 0x3F]);
        out += "==";
    } else if (rest == 2) {
        const uint32_t w = (uint32_t(v[i]) << 16) | (uint32_t(v[i + 1]) << 8);
        out.push_back(B64[(w >> 18) & 0x3F]);
        out.push_back(B64[(w >> 12) & 0x3F]);
        out.push_back(B64[(w >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

bool from_base64(const std::string& text, Bytes& out) {
    std::string s;
    s.reserve(text.size());
    for (char c : text)
        if (!std::isspace(static_cast<unsigned char>(c))) s.push_back(c);

    if (s.size() % 4 != 0) return false;        // whole quanta only

    std::size_t pad = 0;
    if (!s.empty() && s[s.size() - 1] == '=') ++pad;
    if (pad && s[s.size() - 2] == '=') ++pad;

    Bytes result;
    result.reserve(s.size() / 4 * 3);

    uint32_t acc = 0;
    int bits = 0;
    for (std::size_t i = 0; i < s.size() - pad; ++i) {
        const int d = unb64(s[i]);
        if (d < 0) return false;                // includes '=' before the tail

        acc = (acc << 6) | static_cast<uint32_t>(d);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result.push_back(static_cast<uint8_t>((acc >> bits) & 0xFF));
        }
    }

    if (acc & ((1u << bits) - 1)) return false; // non-canonical trailing bits

    out.swap(result);
    return true;
}

} // namespace hideez
