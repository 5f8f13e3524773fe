#pragma once

#include <optional>
#include <string>
#include <vector>

/**
 * Offline operations behind the gift_relay tool. Each returns the text to print.
 */
namespace gift_relay::nostr::tool_commands {

/// {"secret": hex, "pubkey": hex}
[[nodiscard]] auto keygen() -> std::string;

/// @throws crypto::crypto_error for a malformed secret
[[nodiscard]] auto pubkey(const std::string &secret_hex) -> std::string;

/// @throws crypto::crypto_error if any participant is not a valid public key
[[nodiscard]] auto conversation_id(const std::vector<std::string> &pubkeys) -> std::string;

/**
 * @brief Gift wraps a chat message for @p recipient.
 *
 * @return Signed kind 1059 event JSON
 * @throws crypto::crypto_error for malformed keys
 * @throws std::invalid_argument if @p message is not valid UTF-8
 */
[[nodiscard]] auto wrap_message(const std::string &secret_hex,
  const std::string &recipient,
  const std::string &message,
  const std::optional<std::string> &reply_to) -> std::string;

/**
 * @brief Opens a gift wrap addressed to the secret's key.
 *
 * @return Rumor JSON, or std::nullopt if the event cannot be parsed or opened
 * @throws crypto::crypto_error for a malformed secret
 */
[[nodiscard]] auto unwrap_event(const std::string &secret_hex, const std::string &event_json)
  -> std::optional<std::string>;

/// Signed kind 10050 event JSON listing @p relays
[[nodiscard]] auto relay_list(const std::string &secret_hex, const std::vector<std::string> &relays) -> std::string;

}// namespace gift_relay::nostr::tool_commands
