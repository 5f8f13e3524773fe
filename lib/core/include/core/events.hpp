#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace gift_relay::core::events {

/// Per-relay outcome of publishing a message's wraps
enum class delivery_status : std::uint8_t {
  pending,///< Publish issued, no outcome yet
  sent,///< Relay accepted every wrap
  failed,///< Relay rejected a wrap
  timeout,///< No outcome before the send timeout
};

[[nodiscard]] constexpr auto to_string(delivery_status status) -> std::string_view
{
  switch (status) {
  case delivery_status::pending:
    return "pending";
  case delivery_status::sent:
    return "sent";
  case delivery_status::failed:
    return "failed";
  case delivery_status::timeout:
    return "timeout";
  }
  return "unknown";
}

/// A direct message was folded into a conversation
struct message_added
{
  std::string conversation_id;///< Sorted participant pubkeys joined by '+'
  std::string message_id;///< Rumor id
  std::string sender;///< Author pubkey
  std::string content;///< Plaintext
  std::uint64_t created_at{};///< Rumor timestamp
  bool local_echo{};///< Folded optimistically from an outbound send
};

/// A reaction was attached to a message
struct reaction_added
{
  std::string conversation_id;
  std::string message_id;///< Target rumor id
  std::string sender;///< Reacting pubkey
  std::string emoji;///< Emoji or :shortcode:
};

/// Unread counter of a conversation changed
struct unread_count_changed
{
  std::string conversation_id;
  std::size_t unread{};///< Unread messages in this conversation
  std::size_t total{};///< Unread messages across all conversations
};

/// A relay's delivery status for an outbound message changed
struct delivery_status_changed
{
  std::string rumor_id;
  std::string relay;
  delivery_status status{ delivery_status::pending };
};

/// Relays finished replaying stored events for the inbox subscription
struct history_loaded
{
  std::string subscription_id;
};

using presentation_event_variant_t =
  std::variant<message_added, reaction_added, unread_count_changed, delivery_status_changed, history_loaded>;

}// namespace gift_relay::core::events
