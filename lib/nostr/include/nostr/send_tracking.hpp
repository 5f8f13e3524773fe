#pragma once

#include <core/events.hpp>
#include <nostr/protocol.hpp>

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace gift_relay::nostr {

/// A signed gift wrap and the relays it is published to
struct wrap_destination
{
  protocol::event_data event;
  std::vector<std::string> relays;
};

/**
 * @brief Delivery state of one outbound rumor across its relays.
 *
 * Holds the original signed wraps so a retry republishes them unchanged. Shared
 * between the sender and observers; every accessor is thread-safe.
 */
class send_tracking
{
public:
  using delivery_status = core::events::delivery_status;

  /// Every relay of every wrap starts pending, listed once in first-seen order
  send_tracking(std::string rumor_id, std::vector<wrap_destination> wraps);

  [[nodiscard]] auto rumor_id() const -> const std::string & { return rumor_id_; }
  [[nodiscard]] auto relays() const -> const std::vector<std::string> & { return relays_; }
  [[nodiscard]] auto wraps() const -> const std::vector<wrap_destination> & { return wraps_; }

  [[nodiscard]] auto status(const std::string &relay) const -> std::optional<delivery_status>;

  /// Statuses in relay order
  [[nodiscard]] auto statuses() const -> std::vector<std::pair<std::string, delivery_status>>;

  /// At least one relay accepted every wrap sent to it
  [[nodiscard]] auto delivered() const -> bool;

  /// No relay is pending
  [[nodiscard]] auto settled() const -> bool;

  /// Settled without any relay accepting, so the user should be offered a retry
  [[nodiscard]] auto not_delivered() const -> bool;

  /**
   * @brief Sets a relay's status.
   *
   * @return false if the relay is not part of this send or already had that status
   */
  auto update(const std::string &relay, delivery_status status) -> bool;

private:
  std::string rumor_id_;
  std::vector<wrap_destination> wraps_;
  std::vector<std::string> relays_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, delivery_status> status_;
};

}// namespace gift_relay::nostr
