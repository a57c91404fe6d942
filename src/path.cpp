#include "hideez/path.hpp"

#include <cctype>

namespace hideez {

// ---------------------------------------------------------------------------
// parse_component()
// Decimal digits, then at most one hardening marker. Overflow past 2^31 - 1
// before hardening is an error: the hardened bit is not part of the index.
// ---------------------------------------------------------------------------
static bool parse_component(const std::string& s, uint32_t& out) {
    if (s.empty()) return false;

    std::size_t end = s.size();
    bool hardened = false;
    const char last = s.back();
    if (last == '\'' || last == 'h' || last == 'H') {
        hardened = true;
        --end;
    }
    if (end == 0) return false;

    uint64_t v = 0;
    for (std::size_t i = 0; i < end; ++i) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        if (!std::isdigit(c)) return false;
        v = v * 10 + (c - '0');
        if (v >= HARDENED) return false;
    }

    out = static_cast<uint32_t>(v);
    if (hardened) out = H_(out);
    return true;
}

bool parse_path(const std::string& text, AddressN& out, std::string& err) {
    AddressN result;
    if (text.empty()) {
        out.clear();
        return true;
    }

    std::size_t pos = 0;
    bool first = true;
    while (true) {
        const std::size_t slash = text.find('/', pos);
        const std::string part = text.substr(pos, slash == std::string::npos ? std::string::npos
                                                                              : slash - pos);
        if (first && (part == "m" || part == "M")) {
            // root marker, contributes no index
        } else {
            uint32_t idx = 0;
            if (!parse_component(part, idx)) {
                err = "bad_value:path";
                return false;
            }
            result.push_back(idx);
        }
        first = false;
        if (slash == std::string::npos) break;
        pos = slash + 1;
    }

    out.swap(result);
    return true;
}

std::string format_path(const AddressN& path) {
    std::string s = "m";
    for (uint32_t i : path) {
        s += '/';
        s += std::to_string(i & ~HARDENED);
        if (is_hardened(i)) s += '\'';
    }
    return s;
}

} // namespace hideez
