#include "hideez/messages.hpp"

namespace hideez {

using nlohmann::json;

// ---------- field readers ----------
// Required readers fail with "bad_response:<key>". Optional readers accept a
// missing key or null, and fail only on a value of the wrong type.

namespace {

bool bad(const char* key, std::string& err) {
    err = std::string("bad_response:") + key;
    return false;
}

bool read_str(const json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return bad(key, err);
    out = it->get<std::string>();
    return true;
}

bool read_u32(const json& j, const char* key, uint32_t& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_integer()) return bad(key, err);
    const auto v = it->get<int64_t>();
    if (v < 0 || v > 0xFFFFFFFFll) return bad(key, err);
    out = static_cast<uint32_t>(v);
    return true;
}

bool read_bytes(const json& j, const char* key, Bytes& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return bad(key, err);
    if (!from_hex(it->get_ref<const std::string&>(), out)) return bad(key, err);
    return true;
}

bool absent(const json& j, const char* key) {
    auto it = j.find(key);
    return it == j.end() || it->is_null();
}

bool opt_str(const json& j, const char* key, std::optional<std::string>& out, std::string& err) {
    if (absent(j, key)) { out.reset(); return true; }
    std::string v;
    if (!read_str(j, key, v, err)) return false;
    out = std::move(v);
    return true;
}

bool opt_u32(const json& j, const char* key, std::optional<uint32_t>& out, std::string& err) {
    if (absent(j, key)) { out.reset(); return true; }
    uint32_t v = 0;
    if (!read_u32(j, key, v, err)) return false;
    out = v;
    return true;
}

bool opt_bool(const json& j, const char* key, std::optional<bool>& out, std::string& err) {
    if (absent(j, key)) { out.reset(); return true; }
    const auto& v = j.at(key);
    if (!v.is_boolean()) return bad(key, err);
    out = v.get<bool>();
    return true;
}

bool opt_bytes(const json& j, const char* key, std::optional<Bytes>& out, std::string& err) {
    if (absent(j, key)) { out.reset(); return true; }
    Bytes v;
    if (!read_bytes(j, key, v, err)) return false;
    out = std::move(v);
    return true;
}

template <typename T>
void put(json& j, const char* key, const std::optional<T>& v) {
    if (v) j[key] = *v;
}

void put(json& j, const char* key, const std::optional<Bytes>& v) {
    if (v) j[key] = to_hex(*v);
}

} // namespace

// ============================================================================
// to_json
// ============================================================================

void to_json(json& j, const Success& m) {
    j = json{{"message", m.message}};
}

void to_json(json& j, const Features& m) {
    j = json::object();
    put(j, "vendor", m.vendor);
    put(j, "major_version", m.major_version);
    put(j, "minor_version", m.minor_version);
    put(j, "patch_version", m.patch_version);
    put(j, "bootloader_mode", m.bootloader_mode);
    put(j, "device_id", m.device_id);
    put(j, "pin_protection", m.pin_protection);
    put(j, "passphrase_protection", m.passphrase_protection);
    put(j, "language", m.language);
    put(j, "label", m.label);
    put(j, "initialized", m.initialized);
    put(j, "revision", m.revision);
    put(j, "bootloader_hash", m.bootloader_hash);
    put(j, "imported", m.imported);
    put(j, "pin_cached", m.pin_cached);
    put(j, "passphrase_cached", m.passphrase_cached);
    put(j, "needs_backup", m.needs_backup);
    put(j, "flags", m.flags);
    put(j, "model", m.model);
}

void to_json(json& j, const HDNode& m) {
    j = json{{"depth", m.depth},
             {"fingerprint", m.fingerprint},
             {"child_num", m.child_num},
             {"chain_code", to_hex(m.chain_code)},
             {"public_key", to_hex(m.public_key)}};
}

void to_json(json& j, const PublicKey& m) {
    j = json{{"node", m.node}, {"xpub", m.xpub}};
}

void to_json(json& j, const Address& m) {
    j = json{{"address", m.address}};
}

void to_json(json& j, const MessageSignature& m) {
    j = json{{"address", m.address}, {"signature", to_hex(m.signature)}};
}

void to_json(json& j, const EncryptedMessage& m) {
    j = json{{"nonce", to_hex(m.nonce)}, {"message", to_hex(m.message)}, {"hmac", to_hex(m.hmac)}};
}

void to_json(json& j, const DecryptedMessage& m) {
    j = json{{"message", to_hex(m.message)}, {"address", m.address}};
}

void to_json(json& j, const CipheredKeyValue& m) {
    j = json{{"value", to_hex(m.value)}};
}

void to_json(json& j, const CosiCommitment& m) {
    j = json{{"commitment", to_hex(m.commitment)}, {"pubkey", to_hex(m.pubkey)}};
}

void to_json(json& j, const CosiSignature& m) {
    j = json{{"signature", to_hex(m.signature)}};
}

void to_json(json& j, const SignedTx& m) {
    json sigs = json::array();
    for (const auto& s : m.signatures) sigs.push_back(to_hex(s));
    j = json{{"signatures", sigs}, {"serialized_tx", to_hex(m.serialized_tx)}};
}

// ============================================================================
// decode
// ============================================================================

bool decode(const json& j, Success& out, std::string& err) {
    if (absent(j, "message")) { out.message.clear(); return true; }
    return read_str(j, "message", out.message, err);
}

bool decode(const json& j, Features& out, std::string& err) {
    return opt_str(j, "vendor", out.vendor, err)
        && opt_u32(j, "major_version", out.major_version, err)
        && opt_u32(j, "minor_version", out.minor_version, err)
        && opt_u32(j, "patch_version", out.patch_version, err)
        && opt_bool(j, "bootloader_mode", out.bootloader_mode, err)
        && opt_str(j, "device_id", out.device_id, err)
        && opt_bool(j, "pin_protection", out.pin_protection, err)
        && opt_bool(j, "passphrase_protection", out.passphrase_protection, err)
        && opt_str(j, "language", out.language, err)
        && opt_str(j, "label", out.label, err)
        && opt_bool(j, "initialized", out.initialized, err)
        && opt_bytes(j, "revision", out.revision, err)
        && opt_bytes(j, "bootloader_hash", out.bootloader_hash, err)
        && opt_bool(j, "imported", out.imported, err)
        && opt_bool(j, "pin_cached", out.pin_cached, err)
        && opt_bool(j, "passphrase_cached", out.passphrase_cached, err)
        && opt_bool(j, "needs_backup", out.needs_backup, err)
        && opt_u32(j, "flags", out.flags, err)
        && opt_str(j, "model", out.model, err);
}

bool decode(const json& j, PublicKey& out, std::string& err) {
    auto it = j.find("node");
    if (it == j.end() || !it->is_object()) return bad("node", err);
    const json& n = *it;
    return read_u32(n, "depth", out.node.depth, err)
        && read_u32(n, "fingerprint", out.node.fingerprint, err)
        && read_u32(n, "child_num", out.node.child_num, err)
        && read_bytes(n, "chain_code", out.node.chain_code, err)
        && read_bytes(n, "public_key", out.node.public_key, err)
        && read_str(j, "xpub", out.xpub, err);
}

bool decode(const json& j, Address& out, std::string& err) {
    return read_str(j, "address", out.address, err);
}

bool decode(const json& j, MessageSignature& out, std::string& err) {
    return read_str(j, "address", out.address, err)
        && read_bytes(j, "signature", out.signature, err);
}

bool decode(const json& j, EncryptedMessage& out, std::string& err) {
    return read_bytes(j, "nonce", out.nonce, err)
        && read_bytes(j, "message", out.message, err)
        && read_bytes(j, "hmac", out.hmac, err);
}

bool decode(const json& j, DecryptedMessage& out, std::string& err) {
    if (!read_bytes(j, "message", out.message, err)) return false;
    if (absent(j, "address")) { out.address.clear(); return true; }
    return read_str(j, "address", out.address, err);
}

bool decode(const json& j, CipheredKeyValue& out, std::string& err) {
    return read_bytes(j, "value", out.value, err);
}

bool decode(const json& j, CosiCommitment& out, std::string& err) {
    return read_bytes(j, "commitment", out.commitment, err)
        && read_bytes(j, "pubkey", out.pubkey, err);
}

bool decode(const json& j, CosiSignature& out, std::string& err) {
    return read_bytes(j, "signature", out.signature, err);
}

bool decode(const json& j, SignedTx& out, std::string& err) {
    out.signatures.clear();
    auto it = j.find("signatures");
    if (it != j.end() && !it->is_null()) {
        if (!it->is_array()) return bad("signatures", err);
        for (const auto& s : *it) {
            Bytes b;
            if (!s.is_string() || !from_hex(s.get_ref<const std::string&>(), b))
                return bad("signatures", err);
            out.signatures.push_back(std::move(b));
        }
    }
    return read_bytes(j, "serialized_tx", out.serialized_tx, err);
}

} // namespace hideez
