#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <concepts/relay_pool.hpp>
#include <nostr/dm_cache.hpp>
#include <nostr/dm_config.hpp>
#include <nostr/protocol.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>

namespace gift_relay::nostr {

/**
 * @brief Resolves the inbox relays (kind 10050) a pubkey reads direct messages from.
 *
 * Lookups go memory cache, then persisted cache (local user only, served stale while
 * a background fetch revalidates), then the network. A pubkey without a usable list
 * resolves to the configured fallback relay, which is cached like a real answer.
 *
 * @tparam Pool Relay pool satisfying concepts::relay_pool
 */
template<concepts::relay_pool Pool>
class inbox_relay_resolver : public std::enable_shared_from_this<inbox_relay_resolver<Pool>>
{
public:
  inbox_relay_resolver(const std::shared_ptr<boost::asio::io_context> &io_context,
    std::shared_ptr<Pool> pool,
    std::shared_ptr<dm_cache> cache,
    dm_config config)
    : io_context_(io_context), pool_(std::move(pool)), cache_(std::move(cache)), config_(std::move(config))
  {}

  /**
   * @brief Relays to publish to for @p pubkey.
   *
   * @param pubkey Hex public key
   * @param persist Read and write the persisted cache; only for the local user
   * @return Never empty
   */
  auto resolve(std::string pubkey, bool persist = false) -> boost::asio::awaitable<std::vector<std::string>>
  {
    if (auto hit = cached(pubkey)) { co_return hit->relays; }

    if (persist) {
      if (auto stored = cache_->get_relay_list(pubkey); stored and not stored->relays.empty()) {
        remember(pubkey, *stored);
        spdlog::debug("[inbox_relay_resolver] Serving stored relays for {} while revalidating", pubkey);

        boost::asio::co_spawn(
          *io_context_,
          [self = this->shared_from_this(), pubkey, known_at = stored->created_at]() -> boost::asio::awaitable<void> {
            std::ignore = co_await self->refresh(pubkey, known_at, true);
          },
          boost::asio::detached);

        co_return stored->relays;
      }
    }

    co_return co_await refresh(std::move(pubkey), 0, persist);
  }

  /**
   * @brief Records a relay list known without a lookup, such as one just published.
   */
  auto seed(const std::string &pubkey, const cached_relay_list &entry, bool persist) -> void
  {
    remember(pubkey, entry);
    if (persist) { cache_->put_relay_list(pubkey, entry); }
  }

  [[nodiscard]] auto cached(const std::string &pubkey) const -> std::optional<cached_relay_list>
  {
    const std::lock_guard<std::mutex> lock(mutex_);
    if (auto found = memory_.find(pubkey); found != memory_.end()) { return found->second; }
    return std::nullopt;
  }

  /// Forgets in-memory entries; persisted entries stay
  auto clear() -> void
  {
    const std::lock_guard<std::mutex> lock(mutex_);
    memory_.clear();
  }

private:
  auto remember(const std::string &pubkey, const cached_relay_list &entry) -> void
  {
    const std::lock_guard<std::mutex> lock(mutex_);
    memory_.insert_or_assign(pubkey, entry);
  }

  /**
   * @brief Fetches the latest list and adopts it when strictly newer than @p known_at.
   */
  auto refresh(std::string pubkey, std::uint64_t known_at, bool persist)
    -> boost::asio::awaitable<std::vector<std::string>>
  {
    const nlohmann::json filter = {
      { "kinds", nlohmann::json::array({ static_cast<std::uint16_t>(protocol::kind::inbox_relays) }) },
      { "authors", nlohmann::json::array({ pubkey }) }
    };

    try {
      auto event = co_await pool_->fetch_one(config_.default_relays, filter);
      if (auto relays = accept(pubkey, event); relays and event->created_at > known_at) {
        const cached_relay_list entry{ .relays = std::move(*relays), .created_at = event->created_at };
        seed(pubkey, entry, persist);
        spdlog::debug("[inbox_relay_resolver] {} reads from {} relays", pubkey, entry.relays.size());
        co_return entry.relays;
      }
    } catch (const std::exception &e) {
      spdlog::warn("[inbox_relay_resolver] Relay list lookup for {} failed: {}", pubkey, e.what());
    }

    if (auto hit = cached(pubkey)) { co_return hit->relays; }

    spdlog::debug("[inbox_relay_resolver] No relay list for {}, using {}", pubkey, config_.fallback_relay);
    const cached_relay_list fallback{ .relays = { config_.fallback_relay }, .created_at = 0 };
    seed(pubkey, fallback, persist);
    co_return fallback.relays;
  }

  /// Relay tags of a fetched list, or std::nullopt if it is not a valid list by @p pubkey
  static auto accept(const std::string &pubkey, const std::optional<protocol::event_data> &event)
    -> std::optional<std::vector<std::string>>
  {
    if (not event) { return std::nullopt; }
    if (event->kind != protocol::kind::inbox_relays or event->pubkey != pubkey or not event->verify()) {
      spdlog::debug("[inbox_relay_resolver] Rejecting relay list {} for {}", event->id, pubkey);
      return std::nullopt;
    }

    auto relays = protocol::tag_values(event->tags, "relay");
    if (relays.empty()) { return std::nullopt; }
    return relays;
  }

  std::shared_ptr<boost::asio::io_context> io_context_;
  std::shared_ptr<Pool> pool_;
  std::shared_ptr<dm_cache> cache_;
  dm_config config_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, cached_relay_list> memory_;
};

}// namespace gift_relay::nostr
