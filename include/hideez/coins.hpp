#pragma once
/**
 * @file coins.hpp
 * @brief Coins the CLI can sign for, with the page that broadcasts a signed transaction.
 */

#include <string>
#include <vector>

namespace hideez {

struct CoinInfo {
    std::string name;         // as passed to -c/--coin and sent to the device
    std::string shortcut;     // ticker
    std::string pushtx_url;   // broadcast form for the signed hex
};

/// Table order is the order shown in "Supported coin types".
const std::vector<CoinInfo>& known_coins();

/**
 * @brief Exact, case-sensitive lookup by name.
 * @param err  "unknown_coin:<name>" on failure
 */
bool find_coin(const std::string& name, CoinInfo& out, std::string& err);

/// "Bitcoin, Testnet, ..." for diagnostics.
std::string supported_coin_list();

} // namespace hideez
