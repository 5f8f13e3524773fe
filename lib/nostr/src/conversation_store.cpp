#include <nostr/conversation_store.hpp>

#include <algorithm>
#include <iterator>
#include <numeric>
#include <spdlog/spdlog.h>

namespace gift_relay::nostr {

namespace {

  auto split_participants(const std::string &conversation_id) -> std::vector<std::string>
  {
    std::vector<std::string> participants;
    std::size_t start = 0;
    while (start <= conversation_id.size()) {
      const auto end = std::min(conversation_id.find('+', start), conversation_id.size());
      participants.push_back(conversation_id.substr(start, end - start));
      start = end + 1;
    }
    return participants;
  }

  auto emoji_tags(const protocol::tag_list &tags) -> protocol::tag_list
  {
    protocol::tag_list result;
    std::ranges::copy_if(
      tags, std::back_inserter(result), [](const auto &tag) { return not tag.empty() and tag.front() == "emoji"; });
    return result;
  }

}// namespace

conversation_store::conversation_store(std::string my_pubkey, std::shared_ptr<dm_cache> cache)
  : my_pubkey_(std::move(my_pubkey)), cache_(std::move(cache))
{}

auto conversation_store::fold(const rumor &unsigned_event, const std::string &cache_key) -> fold_outcome
{
  if (not seen_.insert(unsigned_event.id).second) {
    spdlog::debug("[conversation_store] Already folded {}", unsigned_event.id);
    return { .result = fold_result::duplicate,
      .conversation_id = get_conversation_id(unsigned_event),
      .message_id = unsigned_event.id,
      .unread_changed = false };
  }

  if (unsigned_event.kind == protocol::kind::reaction) { return fold_reaction(unsigned_event); }
  return fold_message(unsigned_event, cache_key);
}

auto conversation_store::fold_reaction(const rumor &unsigned_event) -> fold_outcome
{
  fold_outcome outcome{ .result = fold_result::reaction_ignored,
    .conversation_id = get_conversation_id(unsigned_event),
    .message_id = "",
    .unread_changed = false };

  const auto target = protocol::first_tag_value(unsigned_event.tags, "e");
  if (not target) {
    spdlog::debug("[conversation_store] Reaction {} has no target", unsigned_event.id);
    return outcome;
  }
  outcome.message_id = *target;

  const reaction entry{ .emoji = unsigned_event.content,
    .pubkey = unsigned_event.pubkey,
    .tags = emoji_tags(unsigned_event.tags) };
  const auto stored = cache_->add_reaction(outcome.conversation_id, *target, entry);

  auto found = conversations_.find(outcome.conversation_id);
  if (found == conversations_.end()) {
    if (stored) { outcome.result = fold_result::reaction_deferred; }
    return outcome;
  }

  auto &reactions = found->second.reactions[*target];
  const auto duplicate = std::ranges::any_of(
    reactions, [&entry](const reaction &existing) { return existing.pubkey == entry.pubkey and existing.emoji == entry.emoji; });
  if (duplicate) { return outcome; }

  reactions.push_back(entry);
  outcome.result = fold_result::reaction_added;
  return outcome;
}

auto conversation_store::fold_message(const rumor &unsigned_event, const std::string &cache_key) -> fold_outcome
{
  const auto conversation_id = get_conversation_id(unsigned_event);
  const auto unread =
    unsigned_event.pubkey != my_pubkey_ and unsigned_event.created_at > cache_->get_last_seen(conversation_id);

  auto [found, created] = conversations_.try_emplace(conversation_id);
  auto &conv = found->second;
  if (created) {
    conv.id = conversation_id;
    conv.participants = split_participants(conversation_id);
    conv.reactions = cache_->get_reactions(conversation_id);
    conv.last_message_at = unsigned_event.created_at;
  } else if (std::ranges::any_of(conv.messages, [&](const dm_message &msg) { return msg.id == unsigned_event.id; })) {
    return { .result = fold_result::duplicate,
      .conversation_id = conversation_id,
      .message_id = unsigned_event.id,
      .unread_changed = false };
  }

  dm_message msg{ .id = unsigned_event.id,
    .wrap_id = cache_key,
    .pubkey = unsigned_event.pubkey,
    .content = unsigned_event.content,
    .created_at = unsigned_event.created_at,
    .tags = unsigned_event.tags };

  const auto position = std::ranges::upper_bound(
    conv.messages, msg.created_at, std::ranges::less{}, [](const dm_message &existing) { return existing.created_at; });
  conv.messages.insert(position, std::move(msg));
  conv.last_message_at = std::max(conv.last_message_at, unsigned_event.created_at);
  if (unread) { ++conv.unread_count; }

  return { .result = fold_result::message_added,
    .conversation_id = conversation_id,
    .message_id = unsigned_event.id,
    .unread_changed = unread };
}

auto conversation_store::mark_as_read(const std::string &conversation_id, std::uint64_t now) -> bool
{
  cache_->set_last_seen(conversation_id, now);

  auto found = conversations_.find(conversation_id);
  if (found == conversations_.end() or found->second.unread_count == 0) { return false; }
  found->second.unread_count = 0;
  return true;
}

auto conversation_store::mark_all_as_read(std::uint64_t now) -> std::vector<std::string>
{
  std::vector<std::string> changed;
  for (auto &[conversation_id, conv] : conversations_) {
    if (conv.unread_count == 0) { continue; }
    cache_->set_last_seen(conversation_id, now);
    conv.unread_count = 0;
    changed.push_back(conversation_id);
  }
  return changed;
}

auto conversation_store::find(const std::string &conversation_id) const -> const conversation *
{
  auto found = conversations_.find(conversation_id);
  return found == conversations_.end() ? nullptr : &found->second;
}

auto conversation_store::unread_total() const -> std::size_t
{
  return std::accumulate(conversations_.begin(), conversations_.end(), std::size_t{ 0 }, [](std::size_t sum, const auto &entry) {
    return sum + entry.second.unread_count;
  });
}

auto conversation_store::clear() -> void
{
  conversations_.clear();
  seen_.clear();
}

}// namespace gift_relay::nostr
