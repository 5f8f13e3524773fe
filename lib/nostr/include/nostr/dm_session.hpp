#pragma once

#include <async/async_queue.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/experimental/channel_error.hpp>
#include <boost/asio/io_context.hpp>
#include <concepts/relay_pool.hpp>
#include <core/events.hpp>
#include <core/uuid_generator.hpp>
#include <crypto/crypto_error.hpp>
#include <crypto/keys.hpp>
#include <nostr/conversation_store.hpp>
#include <nostr/dm_cache.hpp>
#include <nostr/dm_config.hpp>
#include <nostr/events.hpp>
#include <nostr/gift_wrap.hpp>
#include <nostr/inbox_relay_resolver.hpp>
#include <nostr/protocol.hpp>
#include <nostr/publish_tracker.hpp>
#include <nostr/signer.hpp>
#include <platform/time_utils.hpp>
#include <storage/kv_store.hpp>

#include <algorithm>
#include <fmt/format.h>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace gift_relay::nostr {

/**
 * @brief Unique relays of @p first followed by the unseen ones of @p second.
 */
[[nodiscard]] inline auto merge_relays(const std::vector<std::string> &first, const std::vector<std::string> &second)
  -> std::vector<std::string>
{
  std::vector<std::string> merged;
  for (const auto *list : { &first, &second }) {
    for (const auto &relay : *list) {
      if (std::ranges::find(merged, relay) == merged.end()) { merged.push_back(relay); }
    }
  }
  return merged;
}

/**
 * @brief Private direct-message session of one local user.
 *
 * Owns the inbox subscription and the conversation state. Every inbound wrap, local
 * echo and read-state change goes through one mailbox consumed by run(), so folds
 * are serialized. Sends build both gift wraps, echo the rumor locally, and hand the
 * wraps to the publish tracker.
 *
 * @tparam Pool Relay pool satisfying concepts::relay_pool
 */
template<concepts::relay_pool Pool> class dm_session : public std::enable_shared_from_this<dm_session<Pool>>
{
public:
  using presentation_queue_t = async::async_queue<core::events::presentation_event_variant_t>;

  /**
   * @brief Constructs a session.
   *
   * @param config Relay and timeout settings
   * @param backend Signing provider of the local user
   * @param pool Relay pool
   * @param store Persistent store backing the direct-message caches
   * @param io_context Context running the session
   * @param presentation_out Optional queue receiving presentation events
   */
  dm_session(dm_config config,
    signing_backend backend,
    std::shared_ptr<Pool> pool,
    std::shared_ptr<storage::kv_store> store,
    const std::shared_ptr<boost::asio::io_context> &io_context,
    std::shared_ptr<presentation_queue_t> presentation_out = nullptr)
    : config_(std::move(config)), backend_(std::move(backend)), my_pubkey_(get_public_key(backend_)),
      pool_(std::move(pool)), cache_(std::make_shared<dm_cache>(std::move(store))), io_context_(io_context),
      in_queue_(std::make_shared<async::async_queue<events::session_in_t>>(io_context)),
      resolver_(std::make_shared<inbox_relay_resolver<Pool>>(io_context_, pool_, cache_, config_)),
      tracker_(std::make_shared<publish_tracker<Pool>>(io_context_, pool_, config_.send_timeout, presentation_out)),
      store_(my_pubkey_, cache_), presentation_out_(std::move(presentation_out))
  {}

  /**
   * @brief Subscribes to gift wraps addressed to the local user.
   *
   * @throws capability_error if the signer cannot decrypt direct messages
   */
  auto start() -> boost::asio::awaitable<void>
  {
    require_nip44(backend_);

    const auto own_inbox = co_await resolver_->resolve(my_pubkey_, true);
    const auto relays = merge_relays(own_inbox, config_.default_relays);

    subscription_id_ = core::uuid_generator::subscription_id("dm");
    protocol::validate_subscription_id(subscription_id_);

    const nlohmann::json filter = {
      { "kinds", nlohmann::json::array({ static_cast<std::uint16_t>(protocol::kind::gift_wrap) }) },
      { "#p", nlohmann::json::array({ my_pubkey_ }) }
    };

    std::weak_ptr<dm_session> weak = this->shared_from_this();
    pool_->subscribe(
      subscription_id_,
      relays,
      filter,
      [weak](const protocol::event_data &event) {
        if (auto self = weak.lock()) { self->enqueue(events::incoming::gift_wrap{ event }); }
      },
      [weak, subscription_id = subscription_id_]() {
        if (auto self = weak.lock()) { self->enqueue(events::incoming::eose{ .subscription_id = subscription_id }); }
      });

    spdlog::info("[dm_session] Subscribed {} for {} on {} relays", subscription_id_, my_pubkey_, relays.size());
  }

  // NOLINTNEXTLINE(performance-unnecessary-value-param)
  auto run_once(std::shared_ptr<boost::asio::cancellation_slot> cancel_slot = nullptr) -> boost::asio::awaitable<void>
  {
    auto evt = co_await in_queue_->pop(cancel_slot);
    std::visit([&](auto &&event) { handle(std::forward<decltype(event)>(event)); }, evt);
    co_return;
  }

  // NOLINTNEXTLINE(performance-unnecessary-value-param)
  auto run(std::shared_ptr<boost::asio::cancellation_slot> cancel_slot = nullptr) -> boost::asio::awaitable<void>
  {
    try {
      while (true) { co_await run_once(cancel_slot); }
    } catch (const boost::system::system_error &e) {
      if (e.code() == boost::asio::error::operation_aborted
          or e.code() == boost::asio::experimental::error::channel_cancelled
          or e.code() == boost::asio::experimental::error::channel_closed) {
        spdlog::debug("[dm_session] Cancelled, exiting run loop");
        co_return;
      } else {
        spdlog::error("[dm_session] Unexpected error in run loop: {}", e.what());
        throw;
      }
    }
  }

  /**
   * @brief Sends a text message to @p recipient and a copy to the local user.
   *
   * @param recipient Hex public key
   * @param content Plaintext
   * @param reply_to Rumor id being replied to
   * @return Delivery record, pending on every relay
   * @throws capability_error if the signer cannot encrypt
   * @throws crypto::crypto_error if @p recipient is not a valid public key
   * @throws std::invalid_argument if @p content is not valid UTF-8
   */
  auto send_message(std::string recipient, std::string content, std::optional<std::string> reply_to = std::nullopt)
    -> boost::asio::awaitable<std::shared_ptr<send_tracking>>
  {
    check_can_send(recipient);
    auto unsigned_event =
      make_rumor(my_pubkey_, recipient, std::move(content), protocol::kind::chat_message, reply_to);
    co_return co_await dispatch(std::move(recipient), std::move(unsigned_event));
  }

  /**
   * @brief Reacts to message @p target_id.
   *
   * @param emoji Emoji, or a :shortcode: described by @p emoji_tags
   * @param emoji_tags ["emoji", shortcode, image url] tags
   */
  auto send_reaction(std::string recipient,
    std::string emoji,
    std::string target_id,
    protocol::tag_list emoji_tags = {}) -> boost::asio::awaitable<std::shared_ptr<send_tracking>>
  {
    check_can_send(recipient);

    protocol::tag_list extra_tags{ { "e", target_id } };
    extra_tags.insert(extra_tags.end(), emoji_tags.begin(), emoji_tags.end());
    auto unsigned_event =
      make_rumor(my_pubkey_, recipient, std::move(emoji), protocol::kind::reaction, std::nullopt, extra_tags);
    co_return co_await dispatch(std::move(recipient), std::move(unsigned_event));
  }

  /// Republishes the stored wraps to relays that failed or timed out
  auto retry(const std::shared_ptr<send_tracking> &record,
    const std::optional<std::vector<std::string>> &subset = std::nullopt) -> std::vector<std::string>
  {
    return tracker_->retry(record, subset);
  }

  auto mark_as_read(std::string conversation_id) -> void
  {
    enqueue(events::mark_read{ .conversation_id = std::move(conversation_id) });
  }

  auto mark_all_as_read() -> void { enqueue(events::mark_all_read{}); }

  /**
   * @brief Publishes the local user's inbox relay list (kind 10050) to the default relays.
   *
   * @return Signed list event
   */
  auto publish_inbox_relays(const std::vector<std::string> &relays) -> protocol::event_data
  {
    protocol::event_template list{
      .created_at = platform::unix_now(), .kind = protocol::kind::inbox_relays, .tags = {}, .content = ""
    };
    for (const auto &relay : relays) { list.tags.push_back({ "relay", relay }); }

    auto signed_list = sign_event(backend_, list);
    pool_->publish(config_.default_relays,
      signed_list,
      [event_id = signed_list.id](const std::string &relay, const protocol::ok &result) {
        if (not result.accepted) {
          spdlog::warn("[dm_session] {} rejected inbox relay list {}: {}", relay, event_id, result.message);
        }
      });

    resolver_->seed(my_pubkey_, cached_relay_list{ .relays = relays, .created_at = signed_list.created_at }, true);
    spdlog::info("[dm_session] Published {} inbox relays", relays.size());
    return signed_list;
  }

  /**
   * @brief Ends the subscription and drops in-memory conversations once processed.
   */
  auto stop() -> void
  {
    if (not subscription_id_.empty()) {
      pool_->unsubscribe(subscription_id_);
      spdlog::info("[dm_session] Unsubscribed {}", subscription_id_);
      subscription_id_.clear();
    }
    enqueue(events::teardown{});
  }

  [[nodiscard]] auto my_pubkey() const -> const std::string & { return my_pubkey_; }

  [[nodiscard]] auto subscription_id() const -> const std::string & { return subscription_id_; }

  /// Conversation state; read only from the thread running run()
  [[nodiscard]] auto conversations() const -> const conversation_store & { return store_; }

  [[nodiscard]] auto resolver() const -> const std::shared_ptr<inbox_relay_resolver<Pool>> & { return resolver_; }

  [[nodiscard]] auto tracker() const -> const std::shared_ptr<publish_tracker<Pool>> & { return tracker_; }

private:
  dm_config config_;
  signing_backend backend_;
  std::string my_pubkey_;
  std::shared_ptr<Pool> pool_;
  std::shared_ptr<dm_cache> cache_;
  std::shared_ptr<boost::asio::io_context> io_context_;
  std::shared_ptr<async::async_queue<events::session_in_t>> in_queue_;
  std::shared_ptr<inbox_relay_resolver<Pool>> resolver_;
  std::shared_ptr<publish_tracker<Pool>> tracker_;
  conversation_store store_;
  std::shared_ptr<presentation_queue_t> presentation_out_;
  std::string subscription_id_;

  auto enqueue(events::session_in_t evt) -> void
  {
    if (not in_queue_->push(std::move(evt))) { spdlog::warn("[dm_session] Mailbox closed, dropping event"); }
  }

  auto emit_presentation_event(core::events::presentation_event_variant_t evt) -> void
  {
    if (presentation_out_ and not presentation_out_->push(std::move(evt))) {
      spdlog::warn("[dm_session] Presentation queue closed, dropping event");
    }
  }

  auto check_can_send(const std::string &recipient) const -> void
  {
    require_nip44(backend_);
    if (not crypto::is_valid_public_key(recipient)) {
      throw crypto::crypto_error(fmt::format("Invalid recipient public key: {}", recipient));
    }
  }

  auto dispatch(std::string recipient, rumor unsigned_event) -> boost::asio::awaitable<std::shared_ptr<send_tracking>>
  {
    const auto recipient_inbox = co_await resolver_->resolve(recipient);
    const auto own_inbox = co_await resolver_->resolve(my_pubkey_, true);

    std::vector<wrap_destination> wraps;
    wraps.push_back(wrap_destination{ .event = wrap(unsigned_event, recipient, backend_),
      .relays = merge_relays(recipient_inbox, config_.default_relays) });
    wraps.push_back(wrap_destination{ .event = wrap(unsigned_event, my_pubkey_, backend_),
      .relays = merge_relays(own_inbox, config_.default_relays) });

    enqueue(events::local_echo{ .unsigned_event = unsigned_event });
    co_return tracker_->send(unsigned_event.id, std::move(wraps));
  }

  auto apply(const rumor &unsigned_event, const std::string &cache_key, bool local_echo) -> void
  {
    const auto outcome = store_.fold(unsigned_event, cache_key);

    switch (outcome.result) {
    case fold_result::message_added:
      emit_presentation_event(core::events::message_added{ .conversation_id = outcome.conversation_id,
        .message_id = unsigned_event.id,
        .sender = unsigned_event.pubkey,
        .content = unsigned_event.content,
        .created_at = unsigned_event.created_at,
        .local_echo = local_echo });
      if (outcome.unread_changed) { emit_unread(outcome.conversation_id); }
      break;
    case fold_result::reaction_added:
      emit_presentation_event(core::events::reaction_added{ .conversation_id = outcome.conversation_id,
        .message_id = outcome.message_id,
        .sender = unsigned_event.pubkey,
        .emoji = unsigned_event.content });
      break;
    case fold_result::duplicate:
    case fold_result::reaction_deferred:
    case fold_result::reaction_ignored:
      break;
    }
  }

  auto emit_unread(const std::string &conversation_id) -> void
  {
    const auto *conv = store_.find(conversation_id);
    emit_presentation_event(core::events::unread_count_changed{ .conversation_id = conversation_id,
      .unread = conv != nullptr ? conv->unread_count : 0,
      .total = store_.unread_total() });
  }

  auto handle(const events::incoming::gift_wrap &evt) -> void
  {
    auto unwrapped = cache_->get_rumor(evt.id);
    if (not unwrapped) {
      try {
        unwrapped = unwrap(evt, backend_);
      } catch (const capability_error &e) {
        spdlog::error("[dm_session] Cannot open {}: {}", evt.id, e.what());
        return;
      }
      if (not unwrapped) {
        spdlog::debug("[dm_session] Dropping undecryptable wrap {}", evt.id);
        return;
      }
      cache_->put_rumor(evt.id, *unwrapped);
    }

    apply(*unwrapped, evt.id, false);
  }

  auto handle(const events::incoming::eose &evt) -> void
  {
    spdlog::debug("[dm_session] History loaded for {}", evt.subscription_id);
    emit_presentation_event(core::events::history_loaded{ .subscription_id = evt.subscription_id });
  }

  auto handle(const events::local_echo &evt) -> void
  {
    apply(evt.unsigned_event, "local_" + evt.unsigned_event.id, true);
  }

  auto handle(const events::mark_read &evt) -> void
  {
    if (store_.mark_as_read(evt.conversation_id, platform::unix_now())) { emit_unread(evt.conversation_id); }
  }

  auto handle(const events::mark_all_read & /*evt*/) -> void
  {
    for (const auto &conversation_id : store_.mark_all_as_read(platform::unix_now())) { emit_unread(conversation_id); }
  }

  auto handle(const events::teardown & /*evt*/) -> void
  {
    store_.clear();
    spdlog::info("[dm_session] Cleared conversation state for {}", my_pubkey_);
  }
};

}// namespace gift_relay::nostr
