#pragma once
/**
 * @file encoding.hpp
 * @brief Hex and base64 for payloads typed on the command line or shown to users.
 */

#include <cstdint>
#include <string>
#include <vector>

namespace hideez {

using Bytes = std::vector<uint8_t>;

/// Lowercase hex, two digits per byte.
std::string to_hex(const Bytes& v);

/**
 * @brief Decode hex (either case). An optional "0x" prefix is accepted.
 * @return false on odd length or a non-hex digit; @p out is untouched then
 */
bool from_hex(const std::string& hex, Bytes& out);

/// Standard alphabet (RFC 4648), padded.
std::string to_base64(const Bytes& v);

/**
 * @brief Decode padded standard base64. Whitespace is skipped.
 * @return false on a character outside the alphabet, a length that is not a
 *         multiple of 4, '=' anywhere but the last two places, or nonzero
 *         trailing bits
 */
bool from_base64(const std::string& text, Bytes& out);

inline Bytes to_bytes(const std::string& s) { return Bytes(s.begin(), s.end()); }

inline std::string to_string(const Bytes& b) { return std::string(b.begin(), b.end()); }

} // namespace hideez
