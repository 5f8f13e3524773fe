#include <nostr/dm_cache.hpp>

#include <algorithm>
#include <charconv>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace gift_relay::nostr {

namespace {

  auto reaction_to_json(const reaction &entry) -> nlohmann::json
  {
    return { { "emoji", entry.emoji }, { "pubkey", entry.pubkey }, { "tags", entry.tags } };
  }

  auto reaction_from_json(const nlohmann::json &json_obj) -> std::optional<reaction>
  {
    if (not json_obj.is_object()) { return std::nullopt; }
    if (not json_obj.contains("emoji") or not json_obj["emoji"].is_string()) { return std::nullopt; }
    if (not json_obj.contains("pubkey") or not json_obj["pubkey"].is_string()) { return std::nullopt; }

    reaction entry{ .emoji = json_obj["emoji"].get<std::string>(),
      .pubkey = json_obj["pubkey"].get<std::string>(),
      .tags = {} };
    if (json_obj.contains("tags")) {
      auto tags = protocol::parse_tags(json_obj["tags"]);
      if (not tags) { return std::nullopt; }
      entry.tags = std::move(*tags);
    }
    return entry;
  }

  auto reactions_from_json(const std::string &json) -> std::optional<reaction_map>
  {
    const auto json_obj = nlohmann::json::parse(json, nullptr, false);
    if (json_obj.is_discarded() or not json_obj.is_object()) { return std::nullopt; }

    reaction_map reactions;
    for (const auto &[message_id, entries] : json_obj.items()) {
      if (not entries.is_array()) { return std::nullopt; }
      auto &target = reactions[message_id];
      for (const auto &entry_json : entries) {
        auto entry = reaction_from_json(entry_json);
        if (not entry) { return std::nullopt; }
        target.push_back(std::move(*entry));
      }
    }
    return reactions;
  }

  auto reactions_to_json(const reaction_map &reactions) -> std::string
  {
    nlohmann::json json_obj = nlohmann::json::object();
    for (const auto &[message_id, entries] : reactions) {
      auto &target = json_obj[message_id];
      target = nlohmann::json::array();
      for (const auto &entry : entries) { target.push_back(reaction_to_json(entry)); }
    }
    return json_obj.dump();
  }

}// namespace

dm_cache::dm_cache(std::shared_ptr<storage::kv_store> store) : store_(std::move(store)) {}

auto dm_cache::read(std::string_view name_space, const std::string &key) const -> std::optional<std::string>
{
  try {
    return store_->get(name_space, key);
  } catch (const storage::storage_error &e) {
    spdlog::warn("[dm_cache] Read of {}/{} failed: {}", name_space, key, e.what());
    return std::nullopt;
  }
}

auto dm_cache::write(std::string_view name_space, const std::string &key, const std::string &value) -> void
{
  try {
    store_->put(name_space, key, value);
  } catch (const storage::storage_error &e) {
    spdlog::warn("[dm_cache] Write of {}/{} failed: {}", name_space, key, e.what());
  }
}

auto dm_cache::get_rumor(const std::string &wrap_id) const -> std::optional<rumor>
{
  const auto raw = read(rumor_namespace, wrap_id);
  if (not raw) { return std::nullopt; }

  auto cached = rumor::deserialize(*raw);
  if (not cached) { spdlog::debug("[dm_cache] Discarding unreadable rumor cached for {}", wrap_id); }
  return cached;
}

auto dm_cache::put_rumor(const std::string &wrap_id, const rumor &unsigned_event) -> void
{
  write(rumor_namespace, wrap_id, unsigned_event.serialize());
}

auto dm_cache::get_last_seen(const std::string &conversation_id) const -> std::uint64_t
{
  const auto raw = read(last_seen_namespace, conversation_id);
  if (not raw) { return 0; }

  std::uint64_t timestamp = 0;
  const auto *const end = raw->data() + raw->size();
  const auto [ptr, error] = std::from_chars(raw->data(), end, timestamp);
  if (error != std::errc{} or ptr != end) {
    spdlog::debug("[dm_cache] Discarding unreadable last-seen for {}", conversation_id);
    return 0;
  }
  return timestamp;
}

auto dm_cache::set_last_seen(const std::string &conversation_id, std::uint64_t timestamp) -> void
{
  write(last_seen_namespace, conversation_id, std::to_string(timestamp));
}

auto dm_cache::get_reactions(const std::string &conversation_id) const -> reaction_map
{
  const auto raw = read(reactions_namespace, conversation_id);
  if (not raw) { return {}; }

  auto reactions = reactions_from_json(*raw);
  if (not reactions) {
    spdlog::debug("[dm_cache] Discarding unreadable reactions for {}", conversation_id);
    return {};
  }
  return std::move(*reactions);
}

auto dm_cache::add_reaction(const std::string &conversation_id, const std::string &message_id, const reaction &entry)
  -> bool
{
  auto reactions = get_reactions(conversation_id);
  auto &target = reactions[message_id];

  const auto duplicate = std::ranges::any_of(
    target, [&entry](const reaction &existing) { return existing.pubkey == entry.pubkey and existing.emoji == entry.emoji; });
  if (duplicate) { return false; }

  target.push_back(entry);
  write(reactions_namespace, conversation_id, reactions_to_json(reactions));
  return true;
}

auto dm_cache::get_relay_list(const std::string &pubkey) const -> std::optional<cached_relay_list>
{
  const auto raw = read(relays_namespace, pubkey);
  if (not raw) { return std::nullopt; }

  const auto json_obj = nlohmann::json::parse(*raw, nullptr, false);
  if (json_obj.is_discarded() or not json_obj.is_object() or not json_obj.contains("relays")
      or not json_obj["relays"].is_array() or not json_obj.contains("created_at")
      or not json_obj["created_at"].is_number_unsigned()) {
    spdlog::debug("[dm_cache] Discarding unreadable relay list for {}", pubkey);
    return std::nullopt;
  }

  cached_relay_list entry{ .relays = {}, .created_at = json_obj["created_at"].get<std::uint64_t>() };
  for (const auto &relay : json_obj["relays"]) {
    if (not relay.is_string()) { return std::nullopt; }
    entry.relays.push_back(relay.get<std::string>());
  }
  return entry;
}

auto dm_cache::put_relay_list(const std::string &pubkey, const cached_relay_list &entry) -> void
{
  const nlohmann::json json_obj = { { "relays", entry.relays }, { "created_at", entry.created_at } };
  write(relays_namespace, pubkey, json_obj.dump());
}

}// namespace gift_relay::nostr
