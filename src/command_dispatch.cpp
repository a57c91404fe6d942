/**
 * @file command_dispatch.cpp
 * @brief Sub-command table, argument conversion and the one-call-per-command switch.
 *
 * Conversion helpers never throw; they return false and leave a stable
 * "bad_value:<what>" in err. validate_args() and run_command() share the same
 * make_* builders so a value accepted before the device is opened is the
 * value that reaches the device.
 */

#include "command_dispatch.hpp"

#include "hideez/choices.hpp"
#include "hideez/coins.hpp"
#include "hideez/encoding.hpp"
#include "hideez/path.hpp"
#include "hideez/tx_builder.hpp"
#include "hideez/version.hpp"

#include <cctype>
#include <cstdio>
#include <ostream>

namespace hideez {

using nlohmann::json;

// ---------- name table ----------

namespace {

struct NameEntry {
    const char* name;
    CommandKind kind;
};

const NameEntry kNames[] = {
    {"ping",             CommandKind::PING},
    {"get-features",     CommandKind::GET_FEATURES},
    {"list",             CommandKind::LIST},
    {"version",          CommandKind::VERSION},
    {"get-address",      CommandKind::GET_ADDRESS},
    {"get-public-node",  CommandKind::GET_PUBLIC_NODE},
    {"sign-tx",          CommandKind::SIGN_TX},
    {"sign-message",     CommandKind::SIGN_MESSAGE},
    {"verify-message",   CommandKind::VERIFY_MESSAGE},
    {"encrypt-keyvalue", CommandKind::ENCRYPT_KEYVALUE},
    {"decrypt-keyvalue", CommandKind::DECRYPT_KEYVALUE},
    {"encrypt-message",  CommandKind::ENCRYPT_MESSAGE},
    {"decrypt-message",  CommandKind::DECRYPT_MESSAGE},
    {"cosi-commit",      CommandKind::COSI_COMMIT},
    {"cosi-sign",        CommandKind::COSI_SIGN},
};

// Cast to unsigned char first so std::tolower is well-defined for high-bit chars.
std::string lower(std::string s) {
    for (auto& c : s)
        c = (char)std::tolower((unsigned char)c);
    return s;
}

} // namespace

bool name_to_kind(const std::string& raw_name, CommandKind& out) {
    const std::string name = lower(raw_name);
    for (const auto& e : kNames) {
        if (name == e.name) { out = e.kind; return true; }
    }
    return false;
}

const char* kind_to_name(CommandKind kind) {
    for (const auto& e : kNames) {
        if (e.kind == kind) return e.name;
    }
    return "unknown";
}

bool needs_device(CommandKind kind) {
    return kind != CommandKind::LIST && kind != CommandKind::VERSION;
}

// ---------- conversion helpers ----------

namespace {

bool bad_value(const char* what, std::string& err) {
    err = std::string("bad_value:") + what;
    return false;
}

bool hex_arg(const std::string& text, const char* what, Bytes& out, std::string& err) {
    if (!from_hex(text, out)) return bad_value(what, err);
    return true;
}

bool base64_arg(const std::string& text, const char* what, Bytes& out, std::string& err) {
    if (!from_base64(text, out)) return bad_value(what, err);
    return true;
}

// Sizes of the fixed parts of an encrypted message payload.
constexpr size_t NONCE_LEN = 33;
constexpr size_t HMAC_LEN = 8;

bool make_get_address(const CommandArgs& a, GetAddressParams& p, std::string& err) {
    p.coin = a.coin;
    p.show_display = a.show_display;
    return parse_path(a.address_n, p.address_n, err)
        && input_script_type_from_name(a.script_type, p.script_type, err);
}

bool make_get_public_node(const CommandArgs& a, GetPublicNodeParams& p, std::string& err) {
    p.coin = a.coin;
    p.show_display = a.show_display;
    if (!parse_path(a.address_n, p.address_n, err)) return false;
    if (!input_script_type_from_name(a.script_type, p.script_type, err)) return false;
    if (!a.curve.empty()) {
        Curve c;
        if (!curve_from_name(a.curve, c, err)) return false;
        p.curve = c;
    }
    return true;
}

bool make_sign_message(const CommandArgs& a, SignMessageParams& p, std::string& err) {
    p.coin = a.coin;
    p.message = a.message;
    return parse_path(a.address_n, p.address_n, err)
        && input_script_type_from_name(a.script_type, p.script_type, err);
}

bool make_verify_message(const CommandArgs& a, VerifyMessageParams& p, std::string& err) {
    p.coin = a.coin;
    p.address = a.address;
    p.message = a.message;
    return base64_arg(a.signature, "signature", p.signature, err);
}

bool make_keyvalue(const CommandArgs& a, KeyValueParams& p, std::string& err) {
    p.key = a.key;
    return parse_path(a.address_n, p.address_n, err)
        && hex_arg(a.value, "value", p.value, err);
}

bool make_encrypt_message(const CommandArgs& a, EncryptMessageParams& p, std::string& err) {
    p.coin = a.coin;
    p.message = a.message;
    p.display_only = a.display_only;
    return hex_arg(a.pubkey, "pubkey", p.pubkey, err)
        && parse_path(a.address_n, p.address_n, err);
}

// payload = nonce(33) | message | hmac(8)
bool make_decrypt_message(const CommandArgs& a, DecryptMessageParams& p, std::string& err) {
    if (!parse_path(a.address_n, p.address_n, err)) return false;

    Bytes raw;
    if (!base64_arg(a.payload, "payload", raw, err)) return false;
    if (raw.size() < NONCE_LEN + HMAC_LEN) return bad_value("payload", err);

    p.nonce.assign(raw.begin(), raw.begin() + NONCE_LEN);
    p.message.assign(raw.begin() + NONCE_LEN, raw.end() - HMAC_LEN);
    p.hmac.assign(raw.end() - HMAC_LEN, raw.end());
    return true;
}

bool make_cosi_commit(const CommandArgs& a, CosiCommitParams& p, std::string& err) {
    return parse_path(a.address_n, p.address_n, err)
        && hex_arg(a.data, "data", p.data, err);
}

bool make_cosi_sign(const CommandArgs& a, CosiSignParams& p, std::string& err) {
    return parse_path(a.address_n, p.address_n, err)
        && hex_arg(a.data, "data", p.data, err)
        && hex_arg(a.global_commitment, "global_commitment", p.global_commitment, err)
        && hex_arg(a.global_pubkey, "global_pubkey", p.global_pubkey, err);
}

std::string fingerprint_hex(uint32_t fp) {
    char buf[9];
    std::snprintf(buf, sizeof(buf), "%08x", fp);
    return buf;
}

// ---------- per-command runners ----------

bool run_sign_tx(const CommandArgs& a, CommandContext& ctx, Result& out, std::string& err) {
    CoinInfo coin;
    if (!find_coin(a.coin, coin, err)) return false;
    if (!ctx.prompt) { err = "input_closed"; return false; }

    SignTxParams tx;
    tx.coin = coin.name;
    if (!collect_transaction(*ctx.prompt, tx, err)) return false;

    SignedTx signed_tx;
    const bool ok = ctx.client->sign_tx(tx, signed_tx, err);
    ctx.client->close();
    if (!ok) return false;

    const std::string hex = to_hex(signed_tx.serialized_tx);
    if (ctx.json) {
        out = make_mapping(json{{"serialized_tx", hex}, {"broadcast_url", coin.pushtx_url}});
    } else {
        out = make_sequence(json::array({"Signed Transaction:",
                                         hex,
                                         "",
                                         "Use the following form to broadcast it to the network:",
                                         coin.pushtx_url}));
    }
    return true;
}

} // namespace

// ---------- validation ----------

bool validate_args(CommandKind kind, const CommandArgs& a, std::string& err) {
    switch (kind) {
        case CommandKind::PING:
        case CommandKind::GET_FEATURES:
        case CommandKind::LIST:
        case CommandKind::VERSION:
            return true;
        case CommandKind::GET_ADDRESS:     { GetAddressParams p;     return make_get_address(a, p, err); }
        case CommandKind::GET_PUBLIC_NODE: { GetPublicNodeParams p;  return make_get_public_node(a, p, err); }
        case CommandKind::SIGN_TX:         { CoinInfo c;             return find_coin(a.coin, c, err); }
        case CommandKind::SIGN_MESSAGE:    { SignMessageParams p;    return make_sign_message(a, p, err); }
        case CommandKind::VERIFY_MESSAGE:  { VerifyMessageParams p;  return make_verify_message(a, p, err); }
        case CommandKind::ENCRYPT_KEYVALUE:
        case CommandKind::DECRYPT_KEYVALUE:{ KeyValueParams p;       return make_keyvalue(a, p, err); }
        case CommandKind::ENCRYPT_MESSAGE: { EncryptMessageParams p; return make_encrypt_message(a, p, err); }
        case CommandKind::DECRYPT_MESSAGE: { DecryptMessageParams p; return make_decrypt_message(a, p, err); }
        case CommandKind::COSI_COMMIT:     { CosiCommitParams p;     return make_cosi_commit(a, p, err); }
        case CommandKind::COSI_SIGN:       { CosiSignParams p;       return make_cosi_sign(a, p, err); }
    }
    err = "unknown_command";
    return false;
}

// ---------- dispatch ----------

bool run_command(CommandKind kind, const CommandArgs& a, CommandContext& ctx,
                 Result& out, std::string& err) {
    if (needs_device(kind) && !ctx.client) { err = "device_not_found"; return false; }
    Client* client = ctx.client;

    switch (kind) {
        case CommandKind::LIST: {
            json paths = json::array();
            for (const auto& d : ctx.enumerate()) paths.push_back(d.path);
            out = make_sequence(paths);
            return true;
        }

        case CommandKind::VERSION:
            out = make_scalar(VERSION);
            return true;

        case CommandKind::PING: {
            PingParams p;
            p.message = a.message;
            p.button_protection = a.button_protection;
            p.pin_protection = a.pin_protection;
            p.passphrase_protection = a.passphrase_protection;
            Success res;
            if (!client->ping(p, res, err)) return false;
            out = make_scalar(res.message);
            return true;
        }

        case CommandKind::GET_FEATURES: {
            Features res;
            if (!client->get_features(res, err)) return false;
            out = make_message(res);
            return true;
        }

        case CommandKind::GET_ADDRESS: {
            GetAddressParams p;
            Address res;
            if (!make_get_address(a, p, err) || !client->get_address(p, res, err)) return false;
            out = make_scalar(res.address);
            return true;
        }

        case CommandKind::GET_PUBLIC_NODE: {
            GetPublicNodeParams p;
            PublicKey res;
            if (!make_get_public_node(a, p, err) || !client->get_public_node(p, res, err)) return false;
            out = make_mapping(json{
                {"node", {{"depth", res.node.depth},
                          {"fingerprint", fingerprint_hex(res.node.fingerprint)},
                          {"child_num", res.node.child_num},
                          {"chain_code", to_hex(res.node.chain_code)},
                          {"public_key", to_hex(res.node.public_key)}}},
                {"xpub", res.xpub}});
            return true;
        }

        case CommandKind::SIGN_TX:
            return run_sign_tx(a, ctx, out, err);

        case CommandKind::SIGN_MESSAGE: {
            SignMessageParams p;
            MessageSignature res;
            if (!make_sign_message(a, p, err) || !client->sign_message(p, res, err)) return false;
            out = make_mapping(json{{"message", a.message},
                                    {"address", res.address},
                                    {"signature", to_base64(res.signature)}});
            return true;
        }

        case CommandKind::VERIFY_MESSAGE: {
            VerifyMessageParams p;
            bool valid = false;
            if (!make_verify_message(a, p, err) || !client->verify_message(p, valid, err)) return false;
            out = make_scalar(valid);
            return true;
        }

        case CommandKind::ENCRYPT_KEYVALUE:
        case CommandKind::DECRYPT_KEYVALUE: {
            KeyValueParams p;
            Bytes res;
            if (!make_keyvalue(a, p, err)) return false;
            const bool ok = kind == CommandKind::ENCRYPT_KEYVALUE
                                ? client->encrypt_keyvalue(p, res, err)
                                : client->decrypt_keyvalue(p, res, err);
            if (!ok) return false;
            out = make_scalar(to_hex(res));
            return true;
        }

        case CommandKind::ENCRYPT_MESSAGE: {
            EncryptMessageParams p;
            EncryptedMessage res;
            if (!make_encrypt_message(a, p, err) || !client->encrypt_message(p, res, err)) return false;
            Bytes payload = res.nonce;
            payload.insert(payload.end(), res.message.begin(), res.message.end());
            payload.insert(payload.end(), res.hmac.begin(), res.hmac.end());
            out = make_mapping(json{{"nonce", to_hex(res.nonce)},
                                    {"message", to_hex(res.message)},
                                    {"hmac", to_hex(res.hmac)},
                                    {"payload", to_base64(payload)}});
            return true;
        }

        case CommandKind::DECRYPT_MESSAGE: {
            DecryptMessageParams p;
            DecryptedMessage res;
            if (!make_decrypt_message(a, p, err) || !client->decrypt_message(p, res, err)) return false;
            out = make_message(res);
            return true;
        }

        case CommandKind::COSI_COMMIT: {
            CosiCommitParams p;
            CosiCommitment res;
            if (!make_cosi_commit(a, p, err) || !client->cosi_commit(p, res, err)) return false;
            out = make_message(res);
            return true;
        }

        case CommandKind::COSI_SIGN: {
            CosiSignParams p;
            CosiSignature res;
            if (!make_cosi_sign(a, p, err) || !client->cosi_sign(p, res, err)) return false;
            out = make_message(res);
            return true;
        }
    }

    err = "unknown_command";
    return false;
}

// ---------- error reporting ----------

int exit_code_for(const std::string& err) {
    if (err.empty()) return 0;
    if (err.compare(0, 10, "bad_value:") == 0 || err == "input_closed") return 2;
    return 1;
}

void print_error(std::ostream& os, const std::string& err, const std::string& path) {
    static const std::string kUnknownCoin = "unknown_coin:";

    if (err == "device_not_found") {
        os << "Failed to find a Hideez device.\n";
        if (!path.empty()) os << "Using path: " << path << "\n";
        return;
    }
    if (err.compare(0, kUnknownCoin.size(), kUnknownCoin) == 0) {
        os << "Coin \"" << err.substr(kUnknownCoin.size()) << "\" is not recognized.\n"
           << "Supported coin types: " << supported_coin_list() << "\n";
        return;
    }
    os << "status=error reason=" << err << "\n";
}

} // namespace hideez
