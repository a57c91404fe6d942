#include "hideez/client.hpp"
#include "hideez/log.hpp"

namespace hideez {

using nlohmann::json;

// ---------- request field encoders ----------

static json path_json(const AddressN& n) {
    json a = json::array();
    for (uint32_t i : n) a.push_back(i);
    return a;
}

static json input_json(const TxInput& in) {
    return json{{"prev_hash", to_hex(in.prev_hash)},
                {"prev_index", in.prev_index},
                {"address_n", path_json(in.address_n)},
                {"amount", in.amount},
                {"sequence", in.sequence},
                {"script_type", to_wire(in.script_type)}};
}

static json output_json(const TxOutput& out) {
    json o{{"amount", out.amount}, {"script_type", to_wire(out.script_type)}};
    if (!out.address.empty()) o["address"] = out.address;
    else                      o["address_n"] = path_json(out.address_n);
    return o;
}

// Reply field as text: strings as-is, other values in their JSON spelling,
// absent or null as "".
static std::string field_text(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return {};
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

// ============================================================================
// LinkClient
// ============================================================================

LinkClient::LinkClient(std::unique_ptr<ITransport> transport, int timeout_ms)
    : transport_(std::move(transport)), timeout_ms_(timeout_ms) {}

LinkClient::~LinkClient() { close(); }

bool LinkClient::open(std::string& err) {
    if (!transport_) { err = "not_open"; return false; }
    if (!transport_->open(err)) return false;
    log::debug("open", {{"path", transport_->get_path()}});
    return true;
}

std::string LinkClient::path() const {
    return transport_ ? transport_->get_path() : std::string();
}

void LinkClient::close() {
    if (!transport_) return;
    transport_->close();
    transport_.reset();
}

bool LinkClient::send(const json& msg, std::string& err) {
    if (!transport_) { err = "not_open"; return false; }
    const std::string text = msg.dump();
    const Bytes frame(text.begin(), text.end());
    log::debug("send", {{"type", msg.value("type", "")}, {"bytes", std::to_string(frame.size())}});
    log::debug("frame", {{"dir", "out"}, {"hex", to_hex(frame)}});
    return transport_->write(frame, err);
}

bool LinkClient::receive(json& msg, std::string& err) {
    if (!transport_) { err = "not_open"; return false; }
    Bytes frame;
    if (!transport_->read(frame, timeout_ms_, err)) return false;
    log::debug("frame", {{"dir", "in"}, {"hex", to_hex(frame)}});

    msg = json::parse(frame.begin(), frame.end(), nullptr, /*allow_exceptions=*/false);
    if (msg.is_discarded() || !msg.is_object() || !msg.contains("type") || !msg["type"].is_string()) {
        err = "bad_response:frame";
        return false;
    }
    log::debug("recv", {{"type", msg["type"].get<std::string>()},
                        {"bytes", std::to_string(frame.size())}});
    return true;
}

bool LinkClient::call(const json& request, const char* expected_type,
                      json& reply, std::string& err) {
    if (!send(request, err)) return false;

    for (int round = 0; round < MAX_ROUNDS; ++round) {
        if (!receive(reply, err)) return false;
        const std::string type = reply["type"].get<std::string>();

        if (type == expected_type) return true;

        if (type == "ButtonRequest") {
            log::warn("Please confirm the action on your device", {{"code", field_text(reply, "code")}});
            if (!send(json{{"type", "ButtonAck"}}, err)) return false;
            continue;
        }

        if (type == "Failure") {
            std::string code = field_text(reply, "code");
            if (code.empty()) code = "Failure_Unknown";
            err = "failure:" + code + ":" + field_text(reply, "message");
            return false;
        }

        if (type == "PinMatrixRequest" || type == "PassphraseRequest") {
            std::string ignored;
            if (!send(json{{"type", "Cancel"}}, ignored))
                log::debug("cancel_failed", {{"reason", ignored}});
            err = "unsupported_request:" + type;
            return false;
        }

        err = "unexpected_response:" + type;
        return false;
    }

    err = "too_many_button_requests";
    return false;
}

template <typename T>
bool LinkClient::call_decode(const json& request, T& out, std::string& err) {
    json reply;
    if (!call(request, T::TYPE, reply, err)) return false;
    return decode(reply, out, err);
}

// ---------- operations ----------

bool LinkClient::ping(const PingParams& p, Success& out, std::string& err) {
    return call_decode(json{{"type", "Ping"},
                            {"message", p.message},
                            {"button_protection", p.button_protection},
                            {"pin_protection", p.pin_protection},
                            {"passphrase_protection", p.passphrase_protection}},
                       out, err);
}

bool LinkClient::get_features(Features& out, std::string& err) {
    return call_decode(json{{"type", "GetFeatures"}}, out, err);
}

bool LinkClient::get_address(const GetAddressParams& p, Address& out, std::string& err) {
    return call_decode(json{{"type", "GetAddress"},
                            {"coin_name", p.coin},
                            {"address_n", path_json(p.address_n)},
                            {"script_type", to_wire(p.script_type)},
                            {"show_display", p.show_display}},
                       out, err);
}

bool LinkClient::get_public_node(const GetPublicNodeParams& p, PublicKey& out, std::string& err) {
    json req{{"type", "GetPublicKey"},
             {"coin_name", p.coin},
             {"address_n", path_json(p.address_n)},
             {"script_type", to_wire(p.script_type)},
             {"show_display", p.show_display}};
    if (p.curve) req["ecdsa_curve_name"] = to_wire(*p.curve);
    return call_decode(req, out, err);
}

bool LinkClient::sign_tx(const SignTxParams& p, SignedTx& out, std::string& err) {
    json inputs = json::array();
    for (const auto& in : p.inputs) inputs.push_back(input_json(in));
    json outputs = json::array();
    for (const auto& o : p.outputs) outputs.push_back(output_json(o));

    return call_decode(json{{"type", "SignTx"},
                            {"coin_name", p.coin},
                            {"version", p.version},
                            {"lock_time", p.lock_time},
                            {"inputs", inputs},
                            {"outputs", outputs}},
                       out, err);
}

bool LinkClient::sign_message(const SignMessageParams& p, MessageSignature& out, std::string& err) {
    return call_decode(json{{"type", "SignMessage"},
                            {"coin_name", p.coin},
                            {"address_n", path_json(p.address_n)},
                            {"message", to_hex(to_bytes(p.message))},
                            {"script_type", to_wire(p.script_type)}},
                       out, err);
}

bool LinkClient::verify_message(const VerifyMessageParams& p, bool& valid, std::string& err) {
    json reply;
    const json req{{"type", "VerifyMessage"},
                   {"coin_name", p.coin},
                   {"address", p.address},
                   {"signature", to_hex(p.signature)},
                   {"message", to_hex(to_bytes(p.message))}};
    if (call(req, Success::TYPE, reply, err)) {
        valid = true;
        return true;
    }
    if (err.compare(0, 8, "failure:") == 0) {
        log::debug("verify_rejected", {{"reason", err}});
        err.clear();
        valid = false;
        return true;
    }
    return false;
}

bool LinkClient::cipher_keyvalue(const KeyValueParams& p, bool encrypt, Bytes& out, std::string& err) {
    CipheredKeyValue res;
    if (!call_decode(json{{"type", "CipherKeyValue"},
                          {"address_n", path_json(p.address_n)},
                          {"key", p.key},
                          {"value", to_hex(p.value)},
                          {"encrypt", encrypt},
                          {"ask_on_encrypt", p.ask_on_encrypt},
                          {"ask_on_decrypt", p.ask_on_decrypt}},
                     res, err))
        return false;
    out = std::move(res.value);
    return true;
}

bool LinkClient::encrypt_keyvalue(const KeyValueParams& p, Bytes& out, std::string& err) {
    return cipher_keyvalue(p, /*encrypt=*/true, out, err);
}

bool LinkClient::decrypt_keyvalue(const KeyValueParams& p, Bytes& out, std::string& err) {
    return cipher_keyvalue(p, /*encrypt=*/false, out, err);
}

bool LinkClient::encrypt_message(const EncryptMessageParams& p, EncryptedMessage& out, std::string& err) {
    return call_decode(json{{"type", "EncryptMessage"},
                            {"pubkey", to_hex(p.pubkey)},
                            {"message", to_hex(to_bytes(p.message))},
                            {"display_only", p.display_only},
                            {"coin_name", p.coin},
                            {"address_n", path_json(p.address_n)}},
                       out, err);
}

bool LinkClient::decrypt_message(const DecryptMessageParams& p, DecryptedMessage& out, std::string& err) {
    return call_decode(json{{"type", "DecryptMessage"},
                            {"address_n", path_json(p.address_n)},
                            {"nonce", to_hex(p.nonce)},
                            {"message", to_hex(p.message)},
                            {"hmac", to_hex(p.hmac)}},
                       out, err);
}

bool LinkClient::cosi_commit(const CosiCommitParams& p, CosiCommitment& out, std::string& err) {
    return call_decode(json{{"type", "CosiCommit"},
                            {"address_n", path_json(p.address_n)},
                            {"data", to_hex(p.data)}},
                       out, err);
}

bool LinkClient::cosi_sign(const CosiSignParams& p, CosiSignature& out, std::string& err) {
    return call_decode(json{{"type", "CosiSign"},
                            {"address_n", path_json(p.address_n)},
                            {"data", to_hex(p.data)},
                            {"global_commitment", to_hex(p.global_commitment)},
                            {"global_pubkey", to_hex(p.global_pubkey)}},
                       out, err);
}

} // namespace hideez
