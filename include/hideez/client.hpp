#pragma once
/**
 * @file client.hpp
 * @brief Wallet client interface and the link-backed implementation.
 *
 * @details
 * Client is the seam the dispatcher talks to: one method per device
 * operation, typed parameters in, typed message out, `bool` + `err` for
 * failure. Nothing above this header knows how requests reach the device.
 *
 * LinkClient forwards each call over an ITransport as one JSON request frame
 * and reads JSON reply frames until the expected reply arrives:
 *
 *   -> {"type":"GetAddress","coin_name":"Bitcoin","address_n":[2147483692,...],...}
 *   <- {"type":"ButtonRequest","code":"ButtonRequest_Address"}
 *   -> {"type":"ButtonAck"}
 *   <- {"type":"Address","address":"1..."}
 *
 * Bytes travel hex-encoded, paths as arrays of integers. Reply handling:
 *   - ButtonRequest: tell the user to confirm on the device, answer ButtonAck
 *   - Failure:       err = "failure:<code>:<message>"
 *   - PinMatrixRequest / PassphraseRequest: answered with Cancel,
 *                    err = "unsupported_request:<type>"
 *   - anything else: err = "unexpected_response:<type>"
 *
 * Link errors come through unchanged from the transport ("timeout", ...).
 */

#include "hideez/messages.hpp"
#include "hideez/transport.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace hideez {

class Client {
public:
    virtual ~Client() = default;

    virtual bool ping(const PingParams& p, Success& out, std::string& err) = 0;
    virtual bool get_features(Features& out, std::string& err) = 0;
    virtual bool get_address(const GetAddressParams& p, Address& out, std::string& err) = 0;
    virtual bool get_public_node(const GetPublicNodeParams& p, PublicKey& out, std::string& err) = 0;
    virtual bool sign_tx(const SignTxParams& p, SignedTx& out, std::string& err) = 0;
    virtual bool sign_message(const SignMessageParams& p, MessageSignature& out, std::string& err) = 0;

    /**
     * @brief Ask the device to check a signature.
     * @param valid  false when the device rejects the signature
     * @return false only when the exchange itself failed
     */
    virtual bool verify_message(const VerifyMessageParams& p, bool& valid, std::string& err) = 0;

    virtual bool encrypt_keyvalue(const KeyValueParams& p, Bytes& out, std::string& err) = 0;
    virtual bool decrypt_keyvalue(const KeyValueParams& p, Bytes& out, std::string& err) = 0;
    virtual bool encrypt_message(const EncryptMessageParams& p, EncryptedMessage& out, std::string& err) = 0;
    virtual bool decrypt_message(const DecryptMessageParams& p, DecryptedMessage& out, std::string& err) = 0;
    virtual bool cosi_commit(const CosiCommitParams& p, CosiCommitment& out, std::string& err) = 0;
    virtual bool cosi_sign(const CosiSignParams& p, CosiSignature& out, std::string& err) = 0;

    /// Release the device. Further calls fail.
    virtual void close() = 0;
};

class LinkClient : public Client {
public:
    static constexpr int DEFAULT_TIMEOUT_MS = 60000;
    static constexpr int MAX_ROUNDS = 16;      // ButtonRequest round-trips per call

    explicit LinkClient(std::unique_ptr<ITransport> transport,
                        int timeout_ms = DEFAULT_TIMEOUT_MS);
    ~LinkClient() override;

    /// Open the underlying transport.
    bool open(std::string& err);
    std::string path() const;

    bool ping(const PingParams& p, Success& out, std::string& err) override;
    bool get_features(Features& out, std::string& err) override;
    bool get_address(const GetAddressParams& p, Address& out, std::string& err) override;
    bool get_public_node(const GetPublicNodeParams& p, PublicKey& out, std::string& err) override;
    bool sign_tx(const SignTxParams& p, SignedTx& out, std::string& err) override;
    bool sign_message(const SignMessageParams& p, MessageSignature& out, std::string& err) override;
    bool verify_message(const VerifyMessageParams& p, bool& valid, std::string& err) override;
    bool encrypt_keyvalue(const KeyValueParams& p, Bytes& out, std::string& err) override;
    bool decrypt_keyvalue(const KeyValueParams& p, Bytes& out, std::string& err) override;
    bool encrypt_message(const EncryptMessageParams& p, EncryptedMessage& out, std::string& err) override;
    bool decrypt_message(const DecryptMessageParams& p, DecryptedMessage& out, std::string& err) override;
    bool cosi_commit(const CosiCommitParams& p, CosiCommitment& out, std::string& err) override;
    bool cosi_sign(const CosiSignParams& p, CosiSignature& out, std::string& err) override;
    void close() override;

private:
    bool send(const nlohmann::json& msg, std::string& err);
    bool receive(nlohmann::json& msg, std::string& err);

    /// Send @p request and read until a reply of @p expected_type arrives.
    bool call(const nlohmann::json& request, const char* expected_type,
              nlohmann::json& reply, std::string& err);

    template <typename T>
    bool call_decode(const nlohmann::json& request, T& out, std::string& err);

    bool cipher_keyvalue(const KeyValueParams& p, bool encrypt, Bytes& out, std::string& err);

    std::unique_ptr<ITransport> transport_;
    int timeout_ms_;
};

} // namespace hideez
