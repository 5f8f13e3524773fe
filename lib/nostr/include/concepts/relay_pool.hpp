#pragma once

#include <boost/asio/awaitable.hpp>
#include <concepts>
#include <functional>
#include <nlohmann/json.hpp>
#include <nostr/protocol.hpp>
#include <optional>
#include <string>
#include <vector>

namespace gift_relay::concepts {

/**
 * @brief Concept defining the relay connection pool consumed by direct messaging.
 *
 * publish reports one OK (or synthesized rejection) per relay through the callback.
 * Callbacks may run on any thread.
 */
template<typename T>
concept relay_pool = requires(T pool,
  const std::vector<std::string> &relays,
  const nostr::protocol::event_data &event,
  const std::string &subscription_id,
  const nlohmann::json &filter,
  std::function<void(const std::string &, const nostr::protocol::ok &)> on_result,
  std::function<void(const nostr::protocol::event_data &)> on_event,
  std::function<void()> on_eose) {
  pool.publish(relays, event, on_result);
  pool.subscribe(subscription_id, relays, filter, on_event, on_eose);
  pool.unsubscribe(subscription_id);
  {
    pool.fetch_one(relays, filter)
  } -> std::same_as<boost::asio::awaitable<std::optional<nostr::protocol::event_data>>>;
};

}// namespace gift_relay::concepts
