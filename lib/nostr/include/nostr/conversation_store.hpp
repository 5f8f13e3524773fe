#pragma once

#include <nostr/conversation.hpp>
#include <nostr/dm_cache.hpp>
#include <nostr/gift_wrap.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace gift_relay::nostr {

enum class fold_result : std::uint8_t {
  duplicate,///< Rumor id already folded
  message_added,
  reaction_added,
  reaction_deferred,///< Persisted for a conversation that is not loaded yet
  reaction_ignored,///< No target, or the same reaction is already present
};

struct fold_outcome
{
  fold_result result{ fold_result::duplicate };
  std::string conversation_id;
  std::string message_id;///< Folded message, or the reaction's target
  bool unread_changed{};
};

/**
 * @brief Per-conversation message, reaction and unread state of one local user.
 *
 * Not thread-safe; owned by a single writer.
 */
class conversation_store
{
public:
  conversation_store(std::string my_pubkey, std::shared_ptr<dm_cache> cache);

  /**
   * @brief Folds a decrypted rumor into its conversation.
   *
   * Kind 7 attaches a reaction to the message named by its "e" tag; every other kind
   * is a message, ordered by created_at with ties kept in arrival order.
   *
   * @param unsigned_event Decrypted rumor
   * @param cache_key Wire event id, or local_<id> for an optimistic echo
   */
  auto fold(const rumor &unsigned_event, const std::string &cache_key) -> fold_outcome;

  /**
   * @brief Sets last-seen to @p now and zeroes the unread counter.
   *
   * @return true if the unread counter changed
   */
  auto mark_as_read(const std::string &conversation_id, std::uint64_t now) -> bool;

  /// @return Conversations whose unread counter was zeroed
  auto mark_all_as_read(std::uint64_t now) -> std::vector<std::string>;

  [[nodiscard]] auto find(const std::string &conversation_id) const -> const conversation *;

  [[nodiscard]] auto conversations() const -> const std::map<std::string, conversation> & { return conversations_; }

  [[nodiscard]] auto unread_total() const -> std::size_t;

  [[nodiscard]] auto has_seen(const std::string &rumor_id) const -> bool { return seen_.contains(rumor_id); }

  /// Drops in-memory state; persisted caches stay
  auto clear() -> void;

private:
  auto fold_reaction(const rumor &unsigned_event) -> fold_outcome;
  auto fold_message(const rumor &unsigned_event, const std::string &cache_key) -> fold_outcome;

  std::string my_pubkey_;
  std::shared_ptr<dm_cache> cache_;
  std::map<std::string, conversation> conversations_;
  std::unordered_set<std::string> seen_;
};

}// namespace gift_relay::nostr
