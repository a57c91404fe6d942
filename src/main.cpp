// src/main.cpp
// hideez-cli: one sub-command per wallet operation.
//
//   hideez-cli [-p serial:/dev/ttyACM0] [-j] [-v] <sub-command> [options]
//
// Flow: CLI11 parse -> validate user values -> open device (unless list/version)
//       -> run_command -> format_result -> stdout. Diagnostics go to stderr.

#include "command_dispatch.hpp"
#include "device_registry.hpp"
#include "hideez/choices.hpp"
#include "hideez/client.hpp"
#include "hideez/formatter.hpp"
#include "hideez/log.hpp"
#include "hideez/prompt.hpp"
#include "hideez/version.hpp"

#include <CLI/CLI.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <utility>

namespace {

void add_path_option(CLI::App* cmd, std::string& target, bool required) {
  auto* opt = cmd->add_option("-n,--address", target, "BIP-32 path, e.g. m/44'/0'/0'/0/0");
  if (required) opt->required();
}

void add_coin_option(CLI::App* cmd, std::string& target) {
  cmd->add_option("-c,--coin", target, "Coin name")->capture_default_str();
}

void add_script_type_option(CLI::App* cmd, std::string& target) {
  cmd->add_option("-t,--script-type", target, "Script type")
     ->check(CLI::IsMember(hideez::script_type_names()))
     ->capture_default_str();
}

} // namespace

int main(int argc, char** argv) {
  CLI::App app{"Command-line tool for Hideez hardware wallets"};
  app.require_subcommand(1);
  app.set_version_flag("--version", hideez::VERSION);

  // ---- global options ----
  std::string path;
  bool verbose = false, as_json = false;
  int timeout_ms = hideez::LinkClient::DEFAULT_TIMEOUT_MS, baud = 115200, boot_delay_ms = 400;

  app.add_option("-p,--path", path, "Device path, e.g. serial:/dev/ttyACM0")->envname("HIDEEZ_PATH");
  app.add_flag("-v,--verbose", verbose, "Log communication with the device to stderr");
  app.add_flag("-j,--json", as_json, "Print the result as JSON");
  app.add_option("--timeout", timeout_ms, "Reply timeout (ms)")
     ->envname("HIDEEZ_TIMEOUT")
     ->check(CLI::PositiveNumber)
     ->capture_default_str();
  app.add_option("--baud", baud, "Baud rate")->capture_default_str();
  app.add_option("--boot-delay", boot_delay_ms, "Delay after open (ms) to let USB reset")
     ->check(CLI::NonNegativeNumber)
     ->capture_default_str();

  hideez::CommandArgs args;

  // ---- device information ----
  auto* ping = app.add_subcommand("ping", "Send ping message");
  ping->add_option("message", args.message, "Text the device echoes back")->required();
  ping->add_flag("-b,--button-protection", args.button_protection, "Require a button press");
  ping->add_flag("-p,--pin-protection", args.pin_protection, "Require the PIN");
  ping->add_flag("-r,--passphrase-protection", args.passphrase_protection, "Require the passphrase");

  app.add_subcommand("get-features", "Retrieve device features and settings");
  app.add_subcommand("list", "List connected Hideez devices");
  app.add_subcommand("version", "Show version of hideez-cli");

  // ---- keys and addresses ----
  auto* get_address = app.add_subcommand("get-address", "Get address for specified path");
  add_coin_option(get_address, args.coin);
  add_path_option(get_address, args.address_n, true);
  add_script_type_option(get_address, args.script_type);
  get_address->add_flag("-d,--show-display", args.show_display, "Show the address on the device");

  auto* get_public_node = app.add_subcommand("get-public-node", "Get public node of given path");
  add_coin_option(get_public_node, args.coin);
  add_path_option(get_public_node, args.address_n, true);
  get_public_node->add_option("-e,--curve", args.curve, "ECDSA curve name")
                 ->check(CLI::IsMember(hideez::curve_names()));
  add_script_type_option(get_public_node, args.script_type);
  get_public_node->add_flag("-d,--show-display", args.show_display, "Show the public key on the device");

  // ---- signing ----
  auto* sign_tx = app.add_subcommand("sign-tx", "Sign transaction (inputs and outputs asked interactively)");
  add_coin_option(sign_tx, args.coin);

  auto* sign_message = app.add_subcommand("sign-message", "Sign message using address of given path");
  add_coin_option(sign_message, args.coin);
  add_path_option(sign_message, args.address_n, true);
  add_script_type_option(sign_message, args.script_type);
  sign_message->add_option("message", args.message, "Message to sign")->required();

  auto* verify_message = app.add_subcommand("verify-message", "Verify message");
  add_coin_option(verify_message, args.coin);
  verify_message->add_option("address", args.address, "Signing address")->required();
  verify_message->add_option("signature", args.signature, "Signature (base64)")->required();
  verify_message->add_option("message", args.message, "Signed message")->required();

  // ---- encryption ----
  auto* encrypt_kv = app.add_subcommand("encrypt-keyvalue", "Encrypt value by given key and path");
  auto* decrypt_kv = app.add_subcommand("decrypt-keyvalue", "Decrypt value by given key and path");
  for (auto* cmd : {encrypt_kv, decrypt_kv}) {
    add_path_option(cmd, args.address_n, true);
    cmd->add_option("key", args.key, "Key")->required();
    cmd->add_option("value", args.value, "Value (hex)")->required();
  }

  auto* encrypt_message = app.add_subcommand("encrypt-message", "Encrypt message");
  add_coin_option(encrypt_message, args.coin);
  encrypt_message->add_flag("-d,--display-only", args.display_only, "Only show the message on the recipient device");
  add_path_option(encrypt_message, args.address_n, false);
  encrypt_message->add_option("pubkey", args.pubkey, "Recipient public key (hex)")->required();
  encrypt_message->add_option("message", args.message, "Message to encrypt")->required();

  auto* decrypt_message = app.add_subcommand("decrypt-message", "Decrypt message");
  add_path_option(decrypt_message, args.address_n, true);
  decrypt_message->add_option("payload", args.payload, "nonce + message + hmac (base64)")->required();

  // ---- CoSi ----
  auto* cosi_commit = app.add_subcommand("cosi-commit", "Ask device to commit to CoSi signing");
  add_path_option(cosi_commit, args.address_n, true);
  cosi_commit->add_option("data", args.data, "Data to be signed (hex)")->required();

  auto* cosi_sign = app.add_subcommand("cosi-sign", "Ask device to sign using CoSi");
  add_path_option(cosi_sign, args.address_n, true);
  cosi_sign->add_option("data", args.data, "Data to be signed (hex)")->required();
  cosi_sign->add_option("global_commitment", args.global_commitment, "Aggregated commitment (hex)")->required();
  cosi_sign->add_option("global_pubkey", args.global_pubkey, "Aggregated public key (hex)")->required();

  CLI11_PARSE(app, argc, argv);

  if (verbose) hideez::log::set_level(hideez::log::Level::Debug);

  hideez::CommandKind kind;
  const std::string name = app.get_subcommands().front()->get_name();
  if (!hideez::name_to_kind(name, kind)) {
    std::cerr << "status=error reason=unknown_command name=" << name << "\n";
    return 2;
  }

  std::string err;
  if (!hideez::validate_args(kind, args, err)) {
    hideez::print_error(std::cerr, err, path);
    return hideez::exit_code_for(err);
  }

  hideez::Prompt prompt(std::cin, std::cerr);
  hideez::CommandContext ctx;
  ctx.prompt = &prompt;
  ctx.json = as_json;

  // -------- open the device --------
  std::unique_ptr<hideez::LinkClient> client;
  if (hideez::needs_device(kind)) {
    hideez::SerialConfig cfg;
    cfg.baud = baud;
    cfg.boot_delay_ms = boot_delay_ms;

    auto transport = hideez::get_transport(path, cfg, err);
    if (!transport) {
      hideez::print_error(std::cerr, err, path);
      return hideez::exit_code_for(err);
    }

    client = std::make_unique<hideez::LinkClient>(std::move(transport), timeout_ms);
    if (!client->open(err)) {
      hideez::log::debug("open_failed", {{"reason", err}});
      err = "device_not_found";
      hideez::print_error(std::cerr, err, path);
      return hideez::exit_code_for(err);
    }
    ctx.client = client.get();
  }

  // -------- run and print --------
  hideez::Result result;
  if (!hideez::run_command(kind, args, ctx, result, err)) {
    hideez::log::debug("command_failed", {{"command", hideez::kind_to_name(kind)}, {"reason", err}});
    hideez::print_error(std::cerr, err, path);
    return hideez::exit_code_for(err);
  }

  std::cout << hideez::format_result(result, as_json);
  return 0;
}
