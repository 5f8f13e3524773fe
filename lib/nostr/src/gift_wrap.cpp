#include <nostr/gift_wrap.hpp>

#include <crypto/crypto_error.hpp>
#include <crypto/keys.hpp>
#include <platform/time_utils.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <set>
#include <spdlog/spdlog.h>

namespace gift_relay::nostr {

auto rumor::from_json(const nlohmann::json &json_obj) -> std::optional<rumor>
{
  try {
    if (not json_obj.is_object()) { return std::nullopt; }

    rumor result;

    if (not json_obj.contains("id") or not json_obj["id"].is_string()) { return std::nullopt; }
    result.id = json_obj["id"].get<std::string>();

    if (not json_obj.contains("pubkey") or not json_obj["pubkey"].is_string()) { return std::nullopt; }
    result.pubkey = json_obj["pubkey"].get<std::string>();

    if (not json_obj.contains("created_at") or not json_obj["created_at"].is_number_unsigned()) {
      return std::nullopt;
    }
    result.created_at = json_obj["created_at"].get<std::uint64_t>();

    if (not json_obj.contains("kind")) { return std::nullopt; }
    const auto rumor_kind = protocol::parse_kind(json_obj["kind"]);
    if (not rumor_kind) { return std::nullopt; }
    result.kind = *rumor_kind;

    if (not json_obj.contains("content") or not json_obj["content"].is_string()) { return std::nullopt; }
    result.content = json_obj["content"].get<std::string>();

    if (not json_obj.contains("tags")) { return std::nullopt; }
    auto tags = protocol::parse_tags(json_obj["tags"]);
    if (not tags) { return std::nullopt; }
    result.tags = std::move(*tags);

    return result;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

auto rumor::deserialize(const std::string &json) -> std::optional<rumor>
{
  try {
    return from_json(nlohmann::json::parse(json));
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

auto rumor::to_json() const -> nlohmann::json
{
  return { { "id", id },
    { "pubkey", pubkey },
    { "created_at", created_at },
    { "kind", kind },
    { "tags", tags },
    { "content", content } };
}

auto rumor::serialize() const -> std::string { return to_json().dump(); }

auto rumor::recipients() const -> std::vector<std::string> { return protocol::tag_values(tags, "p"); }

auto compute_rumor_id(const rumor &unsigned_event) -> std::string
{
  return protocol::compute_event_id(
    unsigned_event.pubkey, unsigned_event.created_at, unsigned_event.kind, unsigned_event.tags, unsigned_event.content);
}

auto make_rumor(const std::string &sender,
  const std::string &recipient,
  std::string content,
  protocol::kind kind,
  const std::optional<std::string> &reply_to,
  const protocol::tag_list &extra_tags) -> rumor
{
  rumor result{ .id = "",
    .pubkey = sender,
    .created_at = platform::unix_now(),
    .kind = kind,
    .tags = { { "p", recipient } },
    .content = std::move(content) };

  if (reply_to) { result.tags.push_back({ "e", *reply_to, "", "reply" }); }
  result.tags.insert(result.tags.end(), extra_tags.begin(), extra_tags.end());

  result.id = compute_rumor_id(result);
  return result;
}

auto wrap(const rumor &unsigned_event, const std::string &recipient_pubkey, const signing_backend &backend)
  -> protocol::event_data
{
  require_nip44(backend);
  if (not crypto::is_valid_public_key(recipient_pubkey)) {
    throw crypto::crypto_error(fmt::format("Invalid recipient public key: {}", recipient_pubkey));
  }

  const auto sealed_rumor = nip44_encrypt(backend, recipient_pubkey, unsigned_event.serialize());
  const auto seal = sign_event(backend,
    protocol::event_template{ .created_at = platform::random_past_timestamp(),
      .kind = protocol::kind::seal,
      .tags = {},
      .content = sealed_rumor });

  // One key per wrap so wraps cannot be linked to each other or to the sender.
  const auto ephemeral = local_signer::generate();
  const auto sealed_seal = ephemeral.nip44_encrypt(recipient_pubkey, seal.serialize());
  return ephemeral.sign_event(protocol::event_template{ .created_at = platform::random_past_timestamp(),
    .kind = protocol::kind::gift_wrap,
    .tags = { { "p", recipient_pubkey } },
    .content = sealed_seal });
}

auto unwrap(const protocol::event_data &wrap_event, const signing_backend &backend) -> std::optional<rumor>
{
  if (wrap_event.kind != protocol::kind::gift_wrap) {
    spdlog::debug("[gift_wrap] Ignoring kind {} event {}", static_cast<std::uint16_t>(wrap_event.kind), wrap_event.id);
    return std::nullopt;
  }

  require_nip44(backend);

  try {
    const auto seal = protocol::event_data::deserialize(nip44_decrypt(backend, wrap_event.pubkey, wrap_event.content));
    if (not seal or seal->kind != protocol::kind::seal) {
      spdlog::debug("[gift_wrap] Wrap {} does not contain a seal", wrap_event.id);
      return std::nullopt;
    }
    if (not seal->verify()) {
      spdlog::debug("[gift_wrap] Seal {} in wrap {} failed signature verification", seal->id, wrap_event.id);
      return std::nullopt;
    }

    auto inner = rumor::deserialize(nip44_decrypt(backend, seal->pubkey, seal->content));
    if (not inner) {
      spdlog::debug("[gift_wrap] Seal {} does not contain a rumor", seal->id);
      return std::nullopt;
    }
    if (compute_rumor_id(*inner) != inner->id) {
      spdlog::debug("[gift_wrap] Rumor {} id does not match its content", inner->id);
      return std::nullopt;
    }
    if (inner->pubkey != seal->pubkey) {
      spdlog::debug("[gift_wrap] Rumor author {} does not match sealer {}", inner->pubkey, seal->pubkey);
      return std::nullopt;
    }

    return inner;
  } catch (const capability_error &) {
    throw;
  } catch (const std::exception &e) {
    spdlog::debug("[gift_wrap] Failed to unwrap {}: {}", wrap_event.id, e.what());
    return std::nullopt;
  }
}

auto get_conversation_id(const std::string &my_pubkey, const std::vector<std::string> &p_tags) -> std::string
{
  std::set<std::string> participants(p_tags.begin(), p_tags.end());
  participants.insert(my_pubkey);
  return fmt::format("{}", fmt::join(participants, "+"));
}

auto get_conversation_id(const rumor &unsigned_event) -> std::string
{
  return get_conversation_id(unsigned_event.pubkey, unsigned_event.recipients());
}

}// namespace gift_relay::nostr
