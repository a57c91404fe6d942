#pragma once
/**
 * @file messages.hpp
 * @brief Typed request parameters and response messages exchanged with the wallet client.
 *
 * @details
 * Request structs are what the dispatcher builds from CLI input. Response
 * structs are what a Client returns. Every response type has:
 *
 *   - TYPE: the message name shown in output ("Features", "CosiCommitment", ...)
 *   - to_json(): its field mapping, bytes hex-encoded, absent optionals omitted
 *   - decode(): strict reader for a reply object (bytes arrive hex-encoded)
 *
 * decode() fails with "bad_response:<field>" when a required field is missing
 * or has the wrong JSON type.
 */

#include "hideez/choices.hpp"
#include "hideez/encoding.hpp"
#include "hideez/path.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hideez {

// ============================================================================
// Requests
// ============================================================================

struct PingParams {
    std::string message;
    bool button_protection{false};
    bool pin_protection{false};
    bool passphrase_protection{false};
};

struct GetAddressParams {
    std::string coin{"Bitcoin"};
    AddressN address_n;
    InputScriptType script_type{InputScriptType::SPENDADDRESS};
    bool show_display{false};
};

struct GetPublicNodeParams {
    std::string coin{"Bitcoin"};
    AddressN address_n;
    std::optional<Curve> curve;
    InputScriptType script_type{InputScriptType::SPENDADDRESS};
    bool show_display{false};
};

struct TxInput {
    Bytes prev_hash;                    // 32 bytes, display order
    uint32_t prev_index{0};
    AddressN address_n;
    uint64_t amount{0};
    uint32_t sequence{0xfffffffd};
    InputScriptType script_type{InputScriptType::SPENDADDRESS};
};

/// Exactly one of address / address_n is set.
struct TxOutput {
    std::string address;
    AddressN address_n;
    uint64_t amount{0};
    OutputScriptType script_type{OutputScriptType::PAYTOADDRESS};
};

struct SignTxParams {
    std::string coin{"Bitcoin"};
    std::vector<TxInput> inputs;
    std::vector<TxOutput> outputs;
    uint32_t version{2};
    uint32_t lock_time{0};
};

struct SignMessageParams {
    std::string coin{"Bitcoin"};
    AddressN address_n;
    std::string message;
    InputScriptType script_type{InputScriptType::SPENDADDRESS};
};

struct VerifyMessageParams {
    std::string coin{"Bitcoin"};
    std::string address;
    Bytes signature;
    std::string message;
};

struct KeyValueParams {
    AddressN address_n;
    std::string key;
    Bytes value;
    bool ask_on_encrypt{true};
    bool ask_on_decrypt{true};
};

struct EncryptMessageParams {
    Bytes pubkey;
    std::string message;
    bool display_only{false};
    std::string coin{"Bitcoin"};
    AddressN address_n;
};

struct DecryptMessageParams {
    AddressN address_n;
    Bytes nonce;
    Bytes message;
    Bytes hmac;
};

struct CosiCommitParams {
    AddressN address_n;
    Bytes data;
};

struct CosiSignParams {
    AddressN address_n;
    Bytes data;
    Bytes global_commitment;
    Bytes global_pubkey;
};

// ============================================================================
// Responses
// ============================================================================

struct Success {
    static constexpr const char* TYPE = "Success";
    std::string message;
};

struct Features {
    static constexpr const char* TYPE = "Features";
    std::optional<std::string> vendor;
    std::optional<uint32_t> major_version;
    std::optional<uint32_t> minor_version;
    std::optional<uint32_t> patch_version;
    std::optional<bool> bootloader_mode;
    std::optional<std::string> device_id;
    std::optional<bool> pin_protection;
    std::optional<bool> passphrase_protection;
    std::optional<std::string> language;
    std::optional<std::string> label;
    std::optional<bool> initialized;
    std::optional<Bytes> revision;
    std::optional<Bytes> bootloader_hash;
    std::optional<bool> imported;
    std::optional<bool> pin_cached;
    std::optional<bool> passphrase_cached;
    std::optional<bool> needs_backup;
    std::optional<uint32_t> flags;
    std::optional<std::string> model;
};

struct HDNode {
    uint32_t depth{0};
    uint32_t fingerprint{0};
    uint32_t child_num{0};
    Bytes chain_code;
    Bytes public_key;
};

struct PublicKey {
    static constexpr const char* TYPE = "PublicKey";
    HDNode node;
    std::string xpub;
};

struct Address {
    static constexpr const char* TYPE = "Address";
    std::string address;
};

struct MessageSignature {
    static constexpr const char* TYPE = "MessageSignature";
    std::string address;
    Bytes signature;
};

struct EncryptedMessage {
    static constexpr const char* TYPE = "EncryptedMessage";
    Bytes nonce;
    Bytes message;
    Bytes hmac;
};

struct DecryptedMessage {
    static constexpr const char* TYPE = "DecryptedMessage";
    Bytes message;
    std::string address;
};

struct CipheredKeyValue {
    static constexpr const char* TYPE = "CipheredKeyValue";
    Bytes value;
};

struct CosiCommitment {
    static constexpr const char* TYPE = "CosiCommitment";
    Bytes commitment;
    Bytes pubkey;
};

struct CosiSignature {
    static constexpr const char* TYPE = "CosiSignature";
    Bytes signature;
};

struct SignedTx {
    static constexpr const char* TYPE = "SignedTx";
    std::vector<Bytes> signatures;
    Bytes serialized_tx;
};

void to_json(nlohmann::json& j, const Success& m);
void to_json(nlohmann::json& j, const Features& m);
void to_json(nlohmann::json& j, const HDNode& m);
void to_json(nlohmann::json& j, const PublicKey& m);
void to_json(nlohmann::json& j, const Address& m);
void to_json(nlohmann::json& j, const MessageSignature& m);
void to_json(nlohmann::json& j, const EncryptedMessage& m);
void to_json(nlohmann::json& j, const DecryptedMessage& m);
void to_json(nlohmann::json& j, const CipheredKeyValue& m);
void to_json(nlohmann::json& j, const CosiCommitment& m);
void to_json(nlohmann::json& j, const CosiSignature& m);
void to_json(nlohmann::json& j, const SignedTx& m);

bool decode(const nlohmann::json& j, Success& out, std::string& err);
bool decode(const nlohmann::json& j, Features& out, std::string& err);
bool decode(const nlohmann::json& j, PublicKey& out, std::string& err);
bool decode(const nlohmann::json& j, Address& out, std::string& err);
bool decode(const nlohmann::json& j, MessageSignature& out, std::string& err);
bool decode(const nlohmann::json& j, EncryptedMessage& out, std::string& err);
bool decode(const nlohmann::json& j, DecryptedMessage& out, std::string& err);
bool decode(const nlohmann::json& j, CipheredKeyValue& out, std::string& err);
bool decode(const nlohmann::json& j, CosiCommitment& out, std::string& err);
bool decode(const nlohmann::json& j, CosiSignature& out, std::string& err);
bool decode(const nlohmann::json& j, SignedTx& out, std::string& err);

} // namespace hideez
