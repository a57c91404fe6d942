#include <doctest/doctest.h>
#include "command_dispatch.hpp"
#include "hideez/encoding.hpp"
#include "hideez/formatter.hpp"

#include <sstream>

using namespace hideez;
using nlohmann::json;

namespace {

// Client double: remembers what it was asked and answers with canned values.
class FakeClient : public Client {
public:
    std::string fail_with;        // when set, every call fails with this
    int calls = 0;
    bool closed = false;

    GetAddressParams last_address;
    GetPublicNodeParams last_public_node;
    SignTxParams last_tx;
    KeyValueParams last_keyvalue;
    bool last_keyvalue_encrypt = false;
    DecryptMessageParams last_decrypt;
    CosiSignParams last_cosi_sign;

    bool ping(const PingParams& p, Success& out, std::string& err) override {
        if (!begin(err)) return false;
        out.message = p.message;
        return true;
    }
    bool get_features(Features& out, std::string& err) override {
        if (!begin(err)) return false;
        out.vendor = "hideez.com";
        out.initialized = true;
        return true;
    }
    bool get_address(const GetAddressParams& p, Address& out, std::string& err) override {
        if (!begin(err)) return false;
        last_address = p;
        out.address = "1BoatSLRHtKNngkdXEeobR76b53LETtpyT";
        return true;
    }
    bool get_public_node(const GetPublicNodeParams& p, PublicKey& out, std::string& err) override {
        if (!begin(err)) return false;
        last_public_node = p;
        out.node.depth = 3;
        out.node.fingerprint = 0x0badf00d;
        out.node.child_num = 0x80000000u;
        out.node.chain_code = {0x01, 0x02};
        out.node.public_key = {0x03};
        out.xpub = "xpub6C";
        return true;
    }
    bool sign_tx(const SignTxParams& p, SignedTx& out, std::string& err) override {
        if (!begin(err)) return false;
        last_tx = p;
        out.serialized_tx = {0x02, 0x00, 0x00, 0x00};
        return true;
    }
    bool sign_message(const SignMessageParams&, MessageSignature& out, std::string& err) override {
        if (!begin(err)) return false;
        out.address = "1BoatSLRHtKNngkdXEeobR76b53LETtpyT";
        out.signature = to_bytes("sig");
        return true;
    }
    bool verify_message(const VerifyMessageParams& p, bool& valid, std::string& err) override {
        if (!begin(err)) return false;
        valid = to_string(p.signature) == "sig";
        return true;
    }
    bool encrypt_keyvalue(const KeyValueParams& p, Bytes& out, std::string& err) override {
        if (!begin(err)) return false;
        last_keyvalue = p;
        last_keyvalue_encrypt = true;
        out = {0xaa, 0xbb};
        return true;
    }
    bool decrypt_keyvalue(const KeyValueParams& p, Bytes& out, std::string& err) override {
        if (!begin(err)) return false;
        last_keyvalue = p;
        last_keyvalue_encrypt = false;
        out = p.value;
        return true;
    }
    bool encrypt_message(const EncryptMessageParams&, EncryptedMessage& out, std::string& err) override {
        if (!begin(err)) return false;
        out.nonce = {0x01};
        out.message = {0x02, 0x03};
        out.hmac = {0x04};
        return true;
    }
    bool decrypt_message(const DecryptMessageParams& p, DecryptedMessage& out, std::string& err) override {
        if (!begin(err)) return false;
        last_decrypt = p;
        out.message = to_bytes("hi");
        return true;
    }
    bool cosi_commit(const CosiCommitParams&, CosiCommitment& out, std::string& err) override {
        if (!begin(err)) return false;
        out.commitment = {0xc0};
        out.pubkey = {0x99};
        return true;
    }
    bool cosi_sign(const CosiSignParams& p, CosiSignature& out, std::string& err) override {
        if (!begin(err)) return false;
        last_cosi_sign = p;
        out.signature = {0x5a};
        return true;
    }
    void close() override { closed = true; }

private:
    bool begin(std::string& err) {
        ++calls;
        if (fail_with.empty()) return true;
        err = fail_with;
        return false;
    }
};

struct Harness {
    FakeClient client;
    std::istringstream in;
    std::ostringstream prompts;
    Prompt prompt{in, prompts};
    CommandContext ctx;

    explicit Harness(const std::string& input = "") : in(input) {
        ctx.client = &client;
        ctx.prompt = &prompt;
    }

    bool run(CommandKind kind, const CommandArgs& args, Result& out, std::string& err) {
        return validate_args(kind, args, err) && run_command(kind, args, ctx, out, err);
    }
};

} // namespace

TEST_CASE("Sub-command names resolve case-insensitively") {
    CommandKind k;
    REQUIRE(name_to_kind("get-public-node", k));
    CHECK(k == CommandKind::GET_PUBLIC_NODE);
    REQUIRE(name_to_kind("Sign-TX", k));
    CHECK(k == CommandKind::SIGN_TX);
    CHECK(!name_to_kind("get_public_node", k));
    CHECK(std::string(kind_to_name(CommandKind::COSI_SIGN)) == "cosi-sign");
    CHECK(!needs_device(CommandKind::LIST));
    CHECK(!needs_device(CommandKind::VERSION));
    CHECK(needs_device(CommandKind::PING));
}

TEST_CASE("get-address converts path and script type and returns the address") {
    Harness h;
    CommandArgs a;
    a.address_n = "m/49'/0'/0'/0/0";
    a.script_type = "p2sh-segwit";
    a.show_display = true;

    Result r;
    std::string err;
    REQUIRE(h.run(CommandKind::GET_ADDRESS, a, r, err));
    CHECK(h.client.calls == 1);
    CHECK(h.client.last_address.address_n == AddressN{0x80000031u, H_(0), H_(0), 0, 0});
    CHECK(h.client.last_address.script_type == InputScriptType::SPENDP2SHWITNESS);
    CHECK(h.client.last_address.show_display);
    CHECK(r.kind == ResultKind::Scalar);
    CHECK(format_result(r, false) == "1BoatSLRHtKNngkdXEeobR76b53LETtpyT\n");
}

TEST_CASE("Bad user values are caught before the device is called") {
    Harness h;
    Result r;
    std::string err;

    CommandArgs a;
    a.address_n = "m/44'/zero";
    CHECK(!h.run(CommandKind::GET_ADDRESS, a, r, err));
    CHECK(err == "bad_value:path");
    CHECK(exit_code_for(err) == 2);

    CommandArgs b;
    b.curve = "curve448";
    CHECK(!h.run(CommandKind::GET_PUBLIC_NODE, b, r, err));
    CHECK(err == "bad_value:curve");

    CommandArgs c;
    c.value = "abc";
    CHECK(!h.run(CommandKind::ENCRYPT_KEYVALUE, c, r, err));
    CHECK(err == "bad_value:value");

    CommandArgs d;
    d.signature = "***";
    CHECK(!h.run(CommandKind::VERIFY_MESSAGE, d, r, err));
    CHECK(err == "bad_value:signature");

    CHECK(h.client.calls == 0);
}

TEST_CASE("get-public-node is reshaped with hex fields and an 8 digit fingerprint") {
    Harness h;
    CommandArgs a;
    a.address_n = "m/44'/0'/0'";
    a.curve = "secp256k1";

    Result r;
    std::string err;
    REQUIRE(h.run(CommandKind::GET_PUBLIC_NODE, a, r, err));
    REQUIRE(h.client.last_public_node.curve.has_value());
    CHECK(*h.client.last_public_node.curve == Curve::SECP256K1);

    CHECK(r.kind == ResultKind::Mapping);
    CHECK(r.value["node"]["fingerprint"] == "0badf00d");
    CHECK(r.value["node"]["chain_code"] == "0102");
    CHECK(r.value["node"]["public_key"] == "03");
    CHECK(r.value["node"]["child_num"] == 0x80000000u);
    CHECK(r.value["xpub"] == "xpub6C");
    CHECK(format_result(r, false).find("node.fingerprint: 0badf00d\n") != std::string::npos);
}

TEST_CASE("get-features returns the Features message") {
    Harness h;
    Result r;
    std::string err;
    REQUIRE(h.run(CommandKind::GET_FEATURES, CommandArgs{}, r, err));
    CHECK(r.kind == ResultKind::Message);
    CHECK(format_result(r, true) == "{\"Features\":{\"initialized\":true,\"vendor\":\"hideez.com\"}}\n");
}

TEST_CASE("ping echoes the message as a scalar") {
    Harness h;
    CommandArgs a;
    a.message = "hello world";
    Result r;
    std::string err;
    REQUIRE(h.run(CommandKind::PING, a, r, err));
    CHECK(format_result(r, false) == "hello world\n");
}

TEST_CASE("sign-message and verify-message use base64 signatures") {
    Harness h;
    CommandArgs a;
    a.address_n = "m/44'/0'/0'/0/0";
    a.message = "hi";

    Result r;
    std::string err;
    REQUIRE(h.run(CommandKind::SIGN_MESSAGE, a, r, err));
    CHECK(r.value == json{{"message", "hi"},
                          {"address", "1BoatSLRHtKNngkdXEeobR76b53LETtpyT"},
                          {"signature", "c2ln"}});

    CommandArgs v;
    v.address = "1BoatSLRHtKNngkdXEeobR76b53LETtpyT";
    v.signature = "c2ln";
    v.message = "hi";
    REQUIRE(h.run(CommandKind::VERIFY_MESSAGE, v, r, err));
    CHECK(format_result(r, false) == "true\n");
    CHECK(format_result(r, true) == "true\n");
}

TEST_CASE("Key-value encryption returns hex and keeps the direction") {
    Harness h;
    CommandArgs a;
    a.address_n = "m/10016'/0";
    a.key = "pw";
    a.value = "00112233";

    Result r;
    std::string err;
    REQUIRE(h.run(CommandKind::ENCRYPT_KEYVALUE, a, r, err));
    CHECK(h.client.last_keyvalue_encrypt);
    CHECK(h.client.last_keyvalue.key == "pw");
    CHECK(h.client.last_keyvalue.value == Bytes{0x00, 0x11, 0x22, 0x33});
    CHECK(format_result(r, false) == "aabb\n");

    REQUIRE(h.run(CommandKind::DECRYPT_KEYVALUE, a, r, err));
    CHECK(!h.client.last_keyvalue_encrypt);
    CHECK(format_result(r, false) == "00112233\n");
}

TEST_CASE("encrypt-message adds a base64 payload of nonce, message and hmac") {
    Harness h;
    CommandArgs a;
    a.pubkey = "02aabb";
    a.message = "secret";

    Result r;
    std::string err;
    REQUIRE(h.run(CommandKind::ENCRYPT_MESSAGE, a, r, err));
    CHECK(r.value["nonce"] == "01");
    CHECK(r.value["message"] == "0203");
    CHECK(r.value["hmac"] == "04");
    CHECK(r.value["payload"] == to_base64({0x01, 0x02, 0x03, 0x04}));
}

TEST_CASE("decrypt-message splits the payload into nonce, message and hmac") {
    Harness h;
    Bytes raw(33, 0x11);
    raw.push_back(0x42);
    raw.push_back(0x43);
    raw.insert(raw.end(), 8, 0x99);

    CommandArgs a;
    a.address_n = "m/1'";
    a.payload = to_base64(raw);

    Result r;
    std::string err;
    REQUIRE(h.run(CommandKind::DECRYPT_MESSAGE, a, r, err));
    CHECK(h.client.last_decrypt.nonce == Bytes(33, 0x11));
    CHECK(h.client.last_decrypt.message == Bytes{0x42, 0x43});
    CHECK(h.client.last_decrypt.hmac == Bytes(8, 0x99));
    CHECK(r.kind == ResultKind::Message);
    CHECK(r.message_type == "DecryptedMessage");

    a.payload = to_base64(Bytes(40, 0x00));
    CHECK(!h.run(CommandKind::DECRYPT_MESSAGE, a, r, err));
    CHECK(err == "bad_value:payload");
}

TEST_CASE("CoSi commands decode hex arguments and return device messages") {
    Harness h;
    CommandArgs a;
    a.address_n = "m/10018'/0'";
    a.data = "deadbeef";
    a.global_commitment = "aa";
    a.global_pubkey = "bb";

    Result r;
    std::string err;
    REQUIRE(h.run(CommandKind::COSI_COMMIT, a, r, err));
    CHECK(format_result(r, true) == "{\"CosiCommitment\":{\"commitment\":\"c0\",\"pubkey\":\"99\"}}\n");

    REQUIRE(h.run(CommandKind::COSI_SIGN, a, r, err));
    CHECK(h.client.last_cosi_sign.data == Bytes{0xde, 0xad, 0xbe, 0xef});
    CHECK(h.client.last_cosi_sign.global_pubkey == Bytes{0xbb});
    CHECK(format_result(r, false) == "CosiSignature\n  signature: 5a\n");
}

TEST_CASE("sign-tx with an unknown coin fails before prompting or calling the device") {
    Harness h("ignored\n");
    CommandArgs a;
    a.coin = "Bitconnect";

    Result r;
    std::string err;
    CHECK(!h.run(CommandKind::SIGN_TX, a, r, err));
    CHECK(err == "unknown_coin:Bitconnect");
    CHECK(exit_code_for(err) == 1);
    CHECK(h.client.calls == 0);
    CHECK(h.prompts.str().empty());

    std::ostringstream diag;
    print_error(diag, err, "");
    CHECK(diag.str() ==
          "Coin \"Bitconnect\" is not recognized.\n"
          "Supported coin types: Bitcoin, Testnet, Bcash, Litecoin, Dash, Zcash, Bitcoin Gold, Dogecoin\n");
}

TEST_CASE("sign-tx signs the collected transaction, closes the device and prints the broadcast form") {
    const std::string txid(64, 'a');
    Harness h(txid + ":0\n"
              "m/44'/0'/0'/0/0\n"
              "10000\n\n\n"
              "\n"                                    // end of inputs
              "1BoatSLRHtKNngkdXEeobR76b53LETtpyT\n"
              "9000\n\n"
              "\n\n"                                  // end of outputs
              "\n\n");                                // version, locktime
    CommandArgs a;
    a.coin = "Testnet";

    Result r;
    std::string err;
    REQUIRE(h.run(CommandKind::SIGN_TX, a, r, err));
    CHECK(h.client.closed);
    CHECK(h.client.last_tx.coin == "Testnet");
    CHECK(h.client.last_tx.inputs.size() == 1);
    CHECK(h.client.last_tx.outputs.size() == 1);
    CHECK(h.client.last_tx.version == 2);

    CHECK(format_result(r, false) ==
          "Signed Transaction:\n"
          "02000000\n"
          "\n"
          "Use the following form to broadcast it to the network:\n"
          "https://testnet-bitcore1.trezor.io/tx/send\n");
}

TEST_CASE("sign-tx in JSON mode returns the serialized transaction and URL") {
    Harness h("\n\n\n\n\n");
    h.ctx.json = true;
    Result r;
    std::string err;
    REQUIRE(h.run(CommandKind::SIGN_TX, CommandArgs{}, r, err));
    CHECK(r.kind == ResultKind::Mapping);
    CHECK(r.value == json{{"serialized_tx", "02000000"},
                          {"broadcast_url", "https://btc-bitcore1.trezor.io/tx/send"}});
}

TEST_CASE("Device failures propagate with exit status 1") {
    Harness h;
    h.client.fail_with = "failure:Failure_ActionCancelled:Cancelled";
    Result r;
    std::string err;
    CHECK(!h.run(CommandKind::GET_FEATURES, CommandArgs{}, r, err));
    CHECK(err == "failure:Failure_ActionCancelled:Cancelled");
    CHECK(exit_code_for(err) == 1);

    std::ostringstream diag;
    print_error(diag, err, "");
    CHECK(diag.str() == "status=error reason=failure:Failure_ActionCancelled:Cancelled\n");
}

TEST_CASE("Device commands without a client report device_not_found") {
    CommandContext ctx;
    Result r;
    std::string err;
    CHECK(!run_command(CommandKind::PING, CommandArgs{}, ctx, r, err));
    CHECK(err == "device_not_found");

    std::ostringstream diag;
    print_error(diag, err, "serial:/dev/ttyACM7");
    CHECK(diag.str() == "Failed to find a Hideez device.\nUsing path: serial:/dev/ttyACM7\n");
}

TEST_CASE("list and version need no device") {
    CommandContext ctx;
    ctx.enumerate = [] {
        return std::vector<DeviceInfo>{{"serial:/dev/ttyACM0", "/dev/ttyACM0"},
                                       {"serial:/dev/ttyUSB1", "/dev/ttyUSB1"}};
    };

    Result r;
    std::string err;
    REQUIRE(run_command(CommandKind::LIST, CommandArgs{}, ctx, r, err));
    CHECK(format_result(r, false) == "serial:/dev/ttyACM0\nserial:/dev/ttyUSB1\n");

    REQUIRE(run_command(CommandKind::VERSION, CommandArgs{}, ctx, r, err));
    CHECK(r.kind == ResultKind::Scalar);
    CHECK(!r.value.get<std::string>().empty());
}

TEST_CASE("Exit codes by error class") {
    CHECK(exit_code_for("") == 0);
    CHECK(exit_code_for("bad_value:payload") == 2);
    CHECK(exit_code_for("input_closed") == 2);
    CHECK(exit_code_for("device_not_found") == 1);
    CHECK(exit_code_for("unknown_coin:X") == 1);
    CHECK(exit_code_for("timeout") == 1);
}
