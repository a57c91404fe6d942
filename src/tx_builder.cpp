#include "hideez/tx_builder.hpp"
#include "hideez/choices.hpp"
#include "hideez/path.hpp"

#include <algorithm>
#include <limits>

namespace hideez {

bool parse_uint(const std::string& text, uint64_t max, const char* what,
                uint64_t& out, std::string& err) {
    auto fail = [&] { err = std::string("bad_value:") + what; return false; };
    if (text.empty() || text.size() > 20) return fail();

    uint64_t v = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return fail();
        const uint64_t d = static_cast<uint64_t>(c - '0');
        if (v > (std::numeric_limits<uint64_t>::max() - d) / 10) return fail();
        v = v * 10 + d;
    }
    if (v > max) return fail();
    out = v;
    return true;
}

bool parse_outpoint(const std::string& text, Bytes& hash, uint32_t& index, std::string& err) {
    const auto colon = text.find(':');
    if (colon == std::string::npos) { err = "bad_value:outpoint"; return false; }

    const std::string txid = text.substr(0, colon);
    Bytes h;
    if (txid.size() != 64 || !from_hex(txid, h)) { err = "bad_value:outpoint"; return false; }

    uint64_t vout = 0;
    if (!parse_uint(text.substr(colon + 1), 0xFFFFFFFFull, "outpoint", vout, err)) return false;

    hash = std::move(h);
    index = static_cast<uint32_t>(vout);
    return true;
}

namespace {

Prompt::Validator uint_check(uint64_t max, const char* what) {
    return [max, what](const std::string& s, std::string& reason) {
        uint64_t v = 0;
        return parse_uint(s, max, what, v, reason);
    };
}

bool path_check(const std::string& s, std::string& reason) {
    AddressN n;
    return parse_path(s, n, reason);
}

bool optional_path_check(const std::string& s, std::string& reason) {
    return s.empty() || path_check(s, reason);
}

bool script_type_check(const std::string& s, std::string& reason) {
    const auto& names = script_type_names();
    if (std::find(names.begin(), names.end(), s) != names.end()) return true;
    reason = "bad_value:script_type";
    return false;
}

bool optional_outpoint_check(const std::string& s, std::string& reason) {
    if (s.empty()) return true;
    Bytes h;
    uint32_t i = 0;
    return parse_outpoint(s, h, i, reason);
}

constexpr uint64_t U64_MAX = std::numeric_limits<uint64_t>::max();
constexpr uint64_t U32_MAX = 0xFFFFFFFFull;

} // namespace

bool collect_inputs(Prompt& prompt, std::vector<TxInput>& inputs, std::string& err) {
    for (;;) {
        std::string outpoint;
        if (!prompt.ask("Previous output to spend (txid:vout)", std::string(), outpoint, err,
                        optional_outpoint_check))
            return false;
        if (outpoint.empty()) return true;

        TxInput in;
        if (!parse_outpoint(outpoint, in.prev_hash, in.prev_index, err)) return false;

        std::string answer;
        if (!prompt.ask("BIP-32 path to derive the key", std::nullopt, answer, err, path_check)) return false;
        if (!parse_path(answer, in.address_n, err)) return false;

        if (!prompt.ask("Input amount (satoshis)", std::string("0"), answer, err,
                        uint_check(U64_MAX, "amount")))
            return false;
        if (!parse_uint(answer, U64_MAX, "amount", in.amount, err)) return false;

        if (!prompt.ask("Sequence number", std::to_string(0xfffffffdu), answer, err,
                        uint_check(U32_MAX, "sequence")))
            return false;
        uint64_t seq = 0;
        if (!parse_uint(answer, U32_MAX, "sequence", seq, err)) return false;
        in.sequence = static_cast<uint32_t>(seq);

        if (!prompt.ask("Input type", default_script_type(in.address_n), answer, err, script_type_check))
            return false;
        if (!input_script_type_from_name(answer, in.script_type, err)) return false;

        inputs.push_back(std::move(in));
    }
}

bool collect_outputs(Prompt& prompt, std::vector<TxOutput>& outputs, std::string& err) {
    for (;;) {
        TxOutput out;
        std::string answer;

        if (!prompt.ask("Output address (for non-change output)", std::string(), out.address, err))
            return false;

        if (out.address.empty()) {
            if (!prompt.ask("BIP-32 path (for change output)", std::string(), answer, err,
                            optional_path_check))
                return false;
            if (answer.empty()) return true;
            if (!parse_path(answer, out.address_n, err)) return false;
        }

        if (!prompt.ask("Amount to spend (satoshis)", std::nullopt, answer, err,
                        uint_check(U64_MAX, "amount")))
            return false;
        if (!parse_uint(answer, U64_MAX, "amount", out.amount, err)) return false;

        const std::string def = out.address.empty() ? default_script_type(out.address_n)
                                                    : std::string("address");
        if (!prompt.ask("Output type", def, answer, err, script_type_check)) return false;
        if (!output_script_type_from_name(answer, out.script_type, err)) return false;

        outputs.push_back(std::move(out));
    }
}

bool collect_transaction(Prompt& prompt, SignTxParams& tx, std::string& err) {
    tx.inputs.clear();
    tx.outputs.clear();
    if (!collect_inputs(prompt, tx.inputs, err)) return false;
    if (!collect_outputs(prompt, tx.outputs, err)) return false;

    std::string answer;
    uint64_t v = 0;
    if (!prompt.ask("Transaction version", std::string("2"), answer, err, uint_check(U32_MAX, "version")) ||
        !parse_uint(answer, U32_MAX, "version", v, err))
        return false;
    tx.version = static_cast<uint32_t>(v);

    if (!prompt.ask("Transaction locktime", std::string("0"), answer, err, uint_check(U32_MAX, "locktime")) ||
        !parse_uint(answer, U32_MAX, "locktime", v, err))
        return false;
    tx.lock_time = static_cast<uint32_t>(v);
    return true;
}

} // namespace hideez
