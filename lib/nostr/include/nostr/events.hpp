#pragma once

#include <nostr/gift_wrap.hpp>
#include <nostr/protocol.hpp>

#include <string>
#include <utility>
#include <variant>

namespace gift_relay::nostr::events {

/// Events delivered by the inbox subscription
namespace incoming {

  /// Received gift wrap (kind 1059) addressed to the local user
  struct gift_wrap : protocol::event_data
  {
    explicit gift_wrap(const protocol::event_data &event) : protocol::event_data(event) {}
  };

  /// Relays finished replaying stored events
  struct eose
  {
    std::string subscription_id;
  };

}// namespace incoming

/// Rumor sent by the local user, folded before any relay confirms it
struct local_echo
{
  rumor unsigned_event;
};

struct mark_read
{
  std::string conversation_id;
};

struct mark_all_read
{
};

/// Session ended; in-memory state is dropped
struct teardown
{
};

/// Mailbox of the direct-message session actor
using session_in_t =
  std::variant<incoming::gift_wrap, incoming::eose, local_echo, mark_read, mark_all_read, teardown>;

}// namespace gift_relay::nostr::events
