#pragma once

#include <nostr/conversation.hpp>
#include <nostr/gift_wrap.hpp>
#include <storage/kv_store.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gift_relay::nostr {

/// Relay list of a pubkey and the created_at of the event it came from (0 for the fallback)
struct cached_relay_list
{
  std::vector<std::string> relays;
  std::uint64_t created_at{};

  auto operator==(const cached_relay_list &) const -> bool = default;
};

/**
 * @brief Typed access to the persisted direct-message state.
 *
 * Every cache kind lives in its own kv_store namespace. Storage failures and
 * unparsable entries never escape: reads degrade to a miss and writes to a warning.
 */
class dm_cache
{
public:
  static constexpr std::string_view rumor_namespace = "dm_cache";
  static constexpr std::string_view last_seen_namespace = "dm_lastseen";
  static constexpr std::string_view reactions_namespace = "dm_reactions";
  static constexpr std::string_view relays_namespace = "inbox_relays";

  explicit dm_cache(std::shared_ptr<storage::kv_store> store);

  /// Decrypted rumor previously stored under a wire event id
  [[nodiscard]] auto get_rumor(const std::string &wrap_id) const -> std::optional<rumor>;
  auto put_rumor(const std::string &wrap_id, const rumor &unsigned_event) -> void;

  /// Unix seconds the conversation was last read, 0 if never
  [[nodiscard]] auto get_last_seen(const std::string &conversation_id) const -> std::uint64_t;
  auto set_last_seen(const std::string &conversation_id, std::uint64_t timestamp) -> void;

  [[nodiscard]] auto get_reactions(const std::string &conversation_id) const -> reaction_map;

  /**
   * @brief Persists a reaction unless the pubkey already reacted with the same emoji.
   *
   * @return true if the reaction was new
   */
  auto add_reaction(const std::string &conversation_id, const std::string &message_id, const reaction &entry)
    -> bool;

  [[nodiscard]] auto get_relay_list(const std::string &pubkey) const -> std::optional<cached_relay_list>;
  auto put_relay_list(const std::string &pubkey, const cached_relay_list &entry) -> void;

private:
  [[nodiscard]] auto read(std::string_view name_space, const std::string &key) const -> std::optional<std::string>;
  auto write(std::string_view name_space, const std::string &key, const std::string &value) -> void;

  std::shared_ptr<storage::kv_store> store_;
};

}// namespace gift_relay::nostr
