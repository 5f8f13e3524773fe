#pragma once

#include <nostr/protocol.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace gift_relay::nostr {

/// A message folded into a conversation
struct dm_message
{
  std::string id;///< Rumor id
  std::string wrap_id;///< Wire event id, or local_<id> for an optimistic echo
  std::string pubkey;
  std::string content;
  std::uint64_t created_at{};
  protocol::tag_list tags;
};

/// Reaction to a message, unique per (pubkey, emoji)
struct reaction
{
  std::string emoji;///< Emoji or :shortcode:
  std::string pubkey;
  protocol::tag_list tags;///< Custom emoji tags only

  auto operator==(const reaction &) const -> bool = default;
};

/// Reactions keyed by target message id
using reaction_map = std::map<std::string, std::vector<reaction>>;

struct conversation
{
  std::string id;
  std::vector<std::string> participants;///< Fixed when the conversation is first seen
  std::vector<dm_message> messages;///< Ordered by created_at, ties by arrival
  reaction_map reactions;
  std::uint64_t last_message_at{};
  std::size_t unread_count{};
};

}// namespace gift_relay::nostr
