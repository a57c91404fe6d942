#pragma once
/**
 * @file path.hpp
 * @brief BIP-32 derivation path text <-> index sequence.
 *
 * @details
 * `m/44'/0'/0'/0/0` becomes `{0x8000002C, 0x80000000, 0x80000000, 0, 0}`.
 *
 * Accepted form:
 *   - optional leading `m` or `M` component
 *   - components separated by `/`
 *   - each component a decimal index below 2^31, optionally suffixed by
 *     `'`, `h` or `H` to set the hardened bit
 *   - the empty string is the empty path
 *
 * Everything else is rejected with err = "bad_value:path".
 */

#include <cstdint>
#include <string>
#include <vector>

namespace hideez {

using AddressN = std::vector<uint32_t>;

constexpr uint32_t HARDENED = 0x80000000u;

/// Index @p i with the hardened bit set.
constexpr uint32_t H_(uint32_t i) { return i | HARDENED; }

constexpr bool is_hardened(uint32_t i) { return (i & HARDENED) != 0; }

/**
 * @brief Parse a derivation path.
 * @param text  e.g. "m/49'/0'/0'/0/3"
 * @param out   filled on success; untouched on failure
 * @param err   "bad_value:path" on failure
 */
bool parse_path(const std::string& text, AddressN& out, std::string& err);

/// Render as `m/44'/0'/0'/0/0`. The empty path renders as `m`.
std::string format_path(const AddressN& path);

} // namespace hideez
