#pragma once
/**
 * @file choices.hpp
 * @brief Fixed name <-> enum tables for the option values the CLI accepts.
 *
 * @details
 * Script type names are shared by inputs, outputs and address requests:
 *
 *   name          input                output
 *   ------------  -------------------  --------------------
 *   address       SPENDADDRESS         PAYTOADDRESS
 *   segwit        SPENDWITNESS         PAYTOWITNESS
 *   p2sh-segwit   SPENDP2SHWITNESS     PAYTOP2SHWITNESS
 *
 * Curve names: secp256k1, nist256p1, ed25519.
 *
 * Lookups are case-sensitive and fail with "bad_value:<option>".
 */

#include "hideez/path.hpp"

#include <string>
#include <vector>

namespace hideez {

enum class InputScriptType {
    SPENDADDRESS,
    SPENDMULTISIG,
    EXTERNAL,
    SPENDWITNESS,
    SPENDP2SHWITNESS
};

enum class OutputScriptType {
    PAYTOADDRESS,
    PAYTOSCRIPTHASH,
    PAYTOMULTISIG,
    PAYTOOPRETURN,
    PAYTOWITNESS,
    PAYTOP2SHWITNESS
};

enum class Curve {
    SECP256K1,
    NIST256P1,
    ED25519
};

/// CLI names in table order, for help text and CLI::IsMember.
const std::vector<std::string>& script_type_names();
const std::vector<std::string>& curve_names();

bool input_script_type_from_name(const std::string& name, InputScriptType& out, std::string& err);
bool output_script_type_from_name(const std::string& name, OutputScriptType& out, std::string& err);
bool curve_from_name(const std::string& name, Curve& out, std::string& err);

/// Enum spelling used in device requests, e.g. "SPENDP2SHWITNESS".
const char* to_wire(InputScriptType t);
const char* to_wire(OutputScriptType t);
/// Curve spelling used in device requests, e.g. "secp256k1".
const char* to_wire(Curve c);

/**
 * @brief Script type offered by default for a key at @p path.
 *
 * "p2sh-segwit" when the first component is 49' (BIP-49 accounts),
 * "address" otherwise, including for an empty path.
 */
std::string default_script_type(const AddressN& path);

} // namespace hideez
