#pragma once
/**
 * @file tx_builder.hpp
 * @brief Interactive collection of transaction inputs and outputs for sign-tx.
 *
 * @details
 * Inputs are asked for until "Previous output to spend" is left empty:
 *
 *   Previous output to spend (txid:vout) []: 9f3c...e1:0
 *   BIP-32 path to derive the key: m/49'/0'/0'/0/0
 *   Input amount (satoshis) [0]: 150000
 *   Sequence number [4294967293]:
 *   Input type [p2sh-segwit]:
 *
 * Outputs are asked for until both the address and the change path are empty.
 * An output to an address defaults to type "address"; a change output gets
 * the default for its path (see default_script_type()).
 *
 * Finally the transaction version [2] and locktime [0].
 */

#include "hideez/messages.hpp"
#include "hideez/prompt.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace hideez {

/**
 * @brief Parse "txid:vout".
 * @param hash   32 bytes decoded from the 64 hex digit txid
 * @param err    "bad_value:outpoint"
 */
bool parse_outpoint(const std::string& text, Bytes& hash, uint32_t& index, std::string& err);

/// Decimal, no sign, at most @p max. Fails with "bad_value:<what>".
bool parse_uint(const std::string& text, uint64_t max, const char* what,
                uint64_t& out, std::string& err);

bool collect_inputs(Prompt& prompt, std::vector<TxInput>& inputs, std::string& err);
bool collect_outputs(Prompt& prompt, std::vector<TxOutput>& outputs, std::string& err);

/// Inputs, outputs, version and locktime into @p tx. tx.coin is left as is.
bool collect_transaction(Prompt& prompt, SignTxParams& tx, std::string& err);

} // namespace hideez
