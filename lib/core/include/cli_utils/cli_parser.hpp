#pragma once

#include <CLI/CLI.hpp>
#include <cstdlib>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace gift_relay::cli_utils {

struct cli_args
{
  bool verbose = false;
  bool show_version = false;

  /// Hex secret key; also read from GIFT_RELAY_SECRET
  std::string secret;

  bool keygen_parsed = false;
  bool pubkey_parsed = false;

  bool wrap_parsed = false;
  std::string wrap_recipient;
  std::string wrap_message;
  std::optional<std::string> wrap_reply_to;

  bool unwrap_parsed = false;
  std::string unwrap_event;

  bool conversation_id_parsed = false;
  std::vector<std::string> participants;

  bool relay_list_parsed = false;
  std::vector<std::string> relays;
};

inline auto setup_cli_app(CLI::App &app, cli_args &args) -> void;

inline auto parse_cli_args(int argc, char **argv) -> cli_args
{
  cli_args args;
  CLI::App app{ "Gift Relay - private direct messages over Nostr gift wraps", "gift_relay" };

  setup_cli_app(app, args);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    app.exit(e);
    std::exit(e.get_exit_code());// NOLINT(concurrency-mt-unsafe)
  }

  return args;
}

inline auto setup_cli_app(CLI::App &app, cli_args &args) -> void
{
  app.add_flag("-v,--verbose", args.verbose, "Enable verbose logging");
  app.add_flag("--version", args.show_version, "Show version information");
  app.add_option("-s,--secret", args.secret, "Hex secret key")->envname("GIFT_RELAY_SECRET");

  auto *keygen_cmd = app.add_subcommand("keygen", "Generate a new key pair");
  keygen_cmd->callback([&args]() { args.keygen_parsed = true; });

  auto *pubkey_cmd = app.add_subcommand("pubkey", "Print the public key of --secret");
  pubkey_cmd->callback([&args]() { args.pubkey_parsed = true; });

  auto *wrap_cmd = app.add_subcommand("wrap", "Gift wrap a message for a recipient");
  wrap_cmd->add_option("-t,--to", args.wrap_recipient, "Recipient public key")->required();
  wrap_cmd->add_option("-m,--message", args.wrap_message, "Message content")->required();
  wrap_cmd->add_option("-r,--reply-to", args.wrap_reply_to, "Id of the message being replied to");
  wrap_cmd->callback([&args]() { args.wrap_parsed = true; });

  auto *unwrap_cmd = app.add_subcommand("unwrap", "Open a gift wrap addressed to --secret");
  unwrap_cmd->add_option("-e,--event", args.unwrap_event, "Gift wrap event JSON")->required();
  unwrap_cmd->callback([&args]() { args.unwrap_parsed = true; });

  auto *conversation_cmd = app.add_subcommand("conversation-id", "Print the conversation id of a participant set");
  conversation_cmd->add_option("pubkeys", args.participants, "Participant public keys")->required();
  conversation_cmd->callback([&args]() { args.conversation_id_parsed = true; });

  auto *relay_list_cmd = app.add_subcommand("relay-list", "Sign an inbox relay list");
  relay_list_cmd->add_option("--relay", args.relays, "Inbox relay URL (repeatable)")->required();
  relay_list_cmd->callback([&args]() { args.relay_list_parsed = true; });

  app.require_subcommand(0, 1);
}

inline auto validate_cli_args(const cli_args &args) -> bool
{
  const auto needs_secret = args.pubkey_parsed or args.wrap_parsed or args.unwrap_parsed or args.relay_list_parsed;
  if (needs_secret and args.secret.empty()) {
    spdlog::error("This command requires --secret or GIFT_RELAY_SECRET");
    return false;
  }

  if (args.wrap_parsed) {
    if (args.wrap_recipient.empty()) {
      spdlog::error("Wrap command requires a recipient");
      return false;
    }
    if (args.wrap_message.empty()) {
      spdlog::error("Wrap command requires a message");
      return false;
    }
  }

  if (args.unwrap_parsed and args.unwrap_event.empty()) {
    spdlog::error("Unwrap command requires an event");
    return false;
  }

  if (args.relay_list_parsed) {
    for (const auto &relay : args.relays) {
      if (not relay.starts_with("wss://") and not relay.starts_with("ws://")) {
        spdlog::error("Invalid relay URL: {}", relay);
        return false;
      }
    }
  }

  return true;
}

}// namespace gift_relay::cli_utils
