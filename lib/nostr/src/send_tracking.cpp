#include <nostr/send_tracking.hpp>

#include <algorithm>

namespace gift_relay::nostr {

send_tracking::send_tracking(std::string rumor_id, std::vector<wrap_destination> wraps)
  : rumor_id_(std::move(rumor_id)), wraps_(std::move(wraps))
{
  for (const auto &destination : wraps_) {
    for (const auto &relay : destination.relays) {
      if (status_.try_emplace(relay, delivery_status::pending).second) { relays_.push_back(relay); }
    }
  }
}

auto send_tracking::status(const std::string &relay) const -> std::optional<delivery_status>
{
  const std::lock_guard<std::mutex> lock(mutex_);
  if (auto found = status_.find(relay); found != status_.end()) { return found->second; }
  return std::nullopt;
}

auto send_tracking::statuses() const -> std::vector<std::pair<std::string, delivery_status>>
{
  const std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::pair<std::string, delivery_status>> result;
  result.reserve(relays_.size());
  for (const auto &relay : relays_) { result.emplace_back(relay, status_.at(relay)); }
  return result;
}

auto send_tracking::delivered() const -> bool
{
  const std::lock_guard<std::mutex> lock(mutex_);
  return std::ranges::any_of(status_, [](const auto &entry) { return entry.second == delivery_status::sent; });
}

auto send_tracking::settled() const -> bool
{
  const std::lock_guard<std::mutex> lock(mutex_);
  return std::ranges::none_of(status_, [](const auto &entry) { return entry.second == delivery_status::pending; });
}

auto send_tracking::not_delivered() const -> bool { return settled() and not delivered(); }

auto send_tracking::update(const std::string &relay, delivery_status status) -> bool
{
  const std::lock_guard<std::mutex> lock(mutex_);
  auto found = status_.find(relay);
  if (found == status_.end() or found->second == status) { return false; }
  found->second = status;
  return true;
}

}// namespace gift_relay::nostr
