#include <cli_utils/app_init.hpp>
#include <cli_utils/cli_parser.hpp>
#include <crypto/crypto_error.hpp>
#include <nostr/signer.hpp>
#include <nostr/tool_commands.hpp>

#include <exception>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace {

auto execute_cli_command(const gift_relay::cli_utils::cli_args &args) -> int
{
  namespace commands = gift_relay::nostr::tool_commands;

  if (args.keygen_parsed) {
    fmt::print("{}\n", commands::keygen());
    return 0;
  }

  if (args.pubkey_parsed) {
    fmt::print("{}\n", commands::pubkey(args.secret));
    return 0;
  }

  if (args.conversation_id_parsed) {
    fmt::print("{}\n", commands::conversation_id(args.participants));
    return 0;
  }

  if (args.wrap_parsed) {
    fmt::print("{}\n", commands::wrap_message(args.secret, args.wrap_recipient, args.wrap_message, args.wrap_reply_to));
    return 0;
  }

  if (args.unwrap_parsed) {
    const auto rumor = commands::unwrap_event(args.secret, args.unwrap_event);
    if (not rumor) {
      spdlog::error("Gift wrap could not be opened with this key");
      return 1;
    }
    fmt::print("{}\n", *rumor);
    return 0;
  }

  if (args.relay_list_parsed) {
    fmt::print("{}\n", commands::relay_list(args.secret, args.relays));
    return 0;
  }

  gift_relay::cli_utils::print_version();
  fmt::print("Run with --help for the available commands\n");
  return 0;
}

}// namespace

// NOLINTNEXTLINE(bugprone-exception-escape)
auto main(int argc, char **argv) -> int
{
  auto args = gift_relay::cli_utils::parse_cli_args(argc, argv);

  if (not gift_relay::cli_utils::validate_cli_args(args)) { return 1; }

  gift_relay::cli_utils::configure_logging(args);

  if (args.show_version) {
    gift_relay::cli_utils::print_version();
    return 0;
  }

  try {
    return execute_cli_command(args);
  } catch (const gift_relay::crypto::crypto_error &e) {
    spdlog::error("{}", e.what());
    return 1;
  } catch (const gift_relay::nostr::capability_error &e) {
    spdlog::error("{}", e.what());
    return 1;
  } catch (const std::exception &e) {
    spdlog::error("gift_relay failed: {}", e.what());
    return 1;
  }
}
