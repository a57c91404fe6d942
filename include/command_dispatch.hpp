#pragma once
/**
 * @page hz-command-dispatch Hideez Command Dispatcher
 * @file command_dispatch.hpp
 * @brief Sub-command name -> typed request -> one Client call -> Result.
 *
 * @details
 * PURPOSE
 * -------
 * The dispatcher is the glue between CLI11 and the wallet client:
 *   - `main.cpp` declares options and fills a CommandArgs; it never builds
 *     a request itself.
 *   - This layer converts the raw strings (paths, hex, base64, script type
 *     and curve names) into the parameter structs of messages.hpp, calls
 *     exactly one Client method and wraps the answer in a Result.
 *   - format_result() renders that Result; nothing here prints.
 *
 * PROCESS FLOW
 * ------------
 * 1. main.cpp parses `hideez-cli get-address -n "m/49'/0'/0'/0/0"`.
 * 2. `name_to_kind("get-address")` -> CommandKind::GET_ADDRESS.
 * 3. `validate_args()` checks every user value before a device is opened.
 * 4. main.cpp opens the device when `needs_device()` says so.
 * 5. `run_command()` builds GetAddressParams (script type defaults to
 *    "address"), calls Client::get_address and returns a Scalar result.
 *
 * RESULT SHAPES
 * -------------
 *   ping               Scalar   echoed message
 *   get-features       Message  Features
 *   list               Sequence device paths
 *   version            Scalar   version string
 *   get-address        Scalar   address
 *   get-public-node    Mapping  {node:{depth,fingerprint,child_num,chain_code,public_key}, xpub}
 *   sign-tx            Sequence text block / Mapping {serialized_tx, broadcast_url} with --json
 *   sign-message       Mapping  {message, address, signature(base64)}
 *   verify-message     Scalar   bool
 *   encrypt-keyvalue   Scalar   hex
 *   decrypt-keyvalue   Scalar   hex
 *   encrypt-message    Mapping  {nonce, message, hmac, payload(base64)}
 *   decrypt-message    Message  DecryptedMessage
 *   cosi-commit        Message  CosiCommitment
 *   cosi-sign          Message  CosiSignature
 *
 * ERRORS
 * ------
 * Stable strings, as everywhere else:
 *   "bad_value:<what>"     user input could not be converted      (exit 2)
 *   "input_closed"         stdin ended at a required prompt       (exit 2)
 *   "unknown_coin:<name>"  coin not in the coins table            (exit 1)
 *   "device_not_found"     no device, or it could not be opened   (exit 1)
 *   anything else          device or link failure                 (exit 1)
 *
 * MAINTENANCE
 * -----------
 * Adding a sub-command:
 *   1) Extend CommandKind and the name table in command_dispatch.cpp.
 *   2) Add its options to CommandArgs and declare them in main.cpp.
 *   3) Add its conversion to validate_args() and its case to run_command().
 */

#include "device_registry.hpp"
#include "hideez/client.hpp"
#include "hideez/prompt.hpp"
#include "hideez/result.hpp"

#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

namespace hideez {

/**
 * @enum CommandKind
 * @brief Every sub-command the CLI offers.
 */
enum class CommandKind {
    PING,
    GET_FEATURES,
    LIST,
    VERSION,

    // Keys and addresses
    GET_ADDRESS,
    GET_PUBLIC_NODE,

    // Signing
    SIGN_TX,
    SIGN_MESSAGE,
    VERIFY_MESSAGE,

    // Symmetric and message encryption
    ENCRYPT_KEYVALUE,
    DECRYPT_KEYVALUE,
    ENCRYPT_MESSAGE,
    DECRYPT_MESSAGE,

    // CoSi
    COSI_COMMIT,
    COSI_SIGN
};

/// Map a sub-command name (case-insensitive) to its kind.
bool name_to_kind(const std::string& name, CommandKind& out);

/// Canonical sub-command name, e.g. "get-public-node".
const char* kind_to_name(CommandKind kind);

/// False for list and version.
bool needs_device(CommandKind kind);

/**
 * @brief Raw option values as declared in main.cpp.
 *
 * Fields a sub-command does not declare keep their defaults.
 */
struct CommandArgs {
    std::string coin{"Bitcoin"};                // -c/--coin
    std::string address_n;                      // -n/--address, BIP-32 path text
    std::string script_type{"address"};         // -t/--script-type
    std::string curve;                          // -e/--curve; empty = device default
    bool show_display{false};                   // -d/--show-display

    bool button_protection{false};              // ping -b
    bool pin_protection{false};                 // ping -p
    bool passphrase_protection{false};          // ping -r

    std::string message;                        // ping, sign/verify/encrypt-message
    std::string address;                        // verify-message
    std::string signature;                      // verify-message, base64

    std::string key;                            // *-keyvalue
    std::string value;                          // *-keyvalue, hex

    bool display_only{false};                   // encrypt-message -d
    std::string pubkey;                         // encrypt-message, hex
    std::string payload;                        // decrypt-message, base64

    std::string data;                           // cosi-*, hex
    std::string global_commitment;              // cosi-sign, hex
    std::string global_pubkey;                  // cosi-sign, hex
};

/// What a command may use besides its arguments.
struct CommandContext {
    Client* client{nullptr};                    // opened device; null for list/version
    Prompt* prompt{nullptr};                    // sign-tx questions
    bool json{false};                           // sign-tx picks its result shape from this
    std::function<std::vector<DeviceInfo>()> enumerate{enumerate_devices};
};

/// Convert every user value of @p kind without touching a device.
bool validate_args(CommandKind kind, const CommandArgs& args, std::string& err);

/**
 * @brief Run one sub-command.
 * @param out  the value for format_result() on success
 * @param err  stable error string on failure
 */
bool run_command(CommandKind kind, const CommandArgs& args, CommandContext& ctx,
                 Result& out, std::string& err);

/// 0 for "", 2 for user input errors, 1 otherwise.
int exit_code_for(const std::string& err);

/**
 * @brief Print the diagnostic for @p err.
 *
 * device_not_found and unknown_coin get their explanatory lines; everything
 * else is printed as `status=error reason=<err>`.
 *
 * @param path  device path the user asked for; may be empty
 */
void print_error(std::ostream& os, const std::string& err, const std::string& path);

} // namespace hideez
