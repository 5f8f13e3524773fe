#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace gift_relay::nostr {

/**
 * @brief Session-wide settings for private direct messages.
 */
struct dm_config
{
  /// Always added to every subscription and publish
  std::vector<std::string> default_relays{ "wss://relay.damus.io/", "wss://nos.lol/" };

  /// Used when a pubkey has no usable inbox relay list
  std::string fallback_relay{ "wss://relay.damus.io/" };

  /// Per-relay publish deadline
  std::chrono::milliseconds send_timeout{ std::chrono::seconds(10) };
};

}// namespace gift_relay::nostr
