#include "hideez/coins.hpp"

namespace hideez {

const std::vector<CoinInfo>& known_coins() {
    static const std::vector<CoinInfo> coins = {
        {"Bitcoin",      "BTC",  "https://btc-bitcore1.trezor.io/tx/send"},
        {"Testnet",      "TEST", "https://testnet-bitcore1.trezor.io/tx/send"},
        {"Bcash",        "BCH",  "https://bch-bitcore2.trezor.io/tx/send"},
        {"Litecoin",     "LTC",  "https://ltc-bitcore1.trezor.io/tx/send"},
        {"Dash",         "DASH", "https://dash-bitcore1.trezor.io/tx/send"},
        {"Zcash",        "ZEC",  "https://zec-bitcore1.trezor.io/tx/send"},
        {"Bitcoin Gold", "BTG",  "https://btg-bitcore2.trezor.io/tx/send"},
        {"Dogecoin",     "DOGE", "https://doge-bitcore1.trezor.io/tx/send"},
    };
    return coins;
}

bool find_coin(const std::string& name, CoinInfo& out, std::string& err) {
    for (const auto& c : known_coins()) {
        if (c.name == name) { out = c; return true; }
    }
    err = "unknown_coin:" + name;
    return false;
}

std::string supported_coin_list() {
    std::string s;
    for (const auto& c : known_coins()) {
        if (!s.empty()) s += ", ";
        s += c.name;
    }
    return s;
}

} // namespace hideez
