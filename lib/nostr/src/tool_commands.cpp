#include <nostr/tool_commands.hpp>

#include <crypto/crypto_error.hpp>
#include <crypto/encoding.hpp>
#include <crypto/keys.hpp>
#include <nostr/gift_wrap.hpp>
#include <nostr/protocol.hpp>
#include <nostr/signer.hpp>
#include <platform/time_utils.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace gift_relay::nostr::tool_commands {

auto keygen() -> std::string
{
  const auto key = crypto::generate_secret_key();
  const nlohmann::json result = { { "secret", crypto::to_hex(key) }, { "pubkey", crypto::derive_public_key(key) } };
  return result.dump(2);
}

auto pubkey(const std::string &secret_hex) -> std::string
{
  return local_signer::from_hex(secret_hex).get_public_key();
}

auto conversation_id(const std::vector<std::string> &pubkeys) -> std::string
{
  for (const auto &key : pubkeys) {
    if (not crypto::is_valid_public_key(key)) { throw crypto::crypto_error(fmt::format("Invalid public key: {}", key)); }
  }
  if (pubkeys.empty()) { return {}; }
  return get_conversation_id(pubkeys.front(), std::vector<std::string>(pubkeys.begin() + 1, pubkeys.end()));
}

auto wrap_message(const std::string &secret_hex,
  const std::string &recipient,
  const std::string &message,
  const std::optional<std::string> &reply_to) -> std::string
{
  const auto signer = local_signer::from_hex(secret_hex);
  const auto unsigned_event =
    make_rumor(signer.get_public_key(), recipient, message, protocol::kind::chat_message, reply_to);
  spdlog::debug("[tool] Wrapping rumor {} for {}", unsigned_event.id, recipient);
  return wrap(unsigned_event, recipient, signer).serialize();
}

auto unwrap_event(const std::string &secret_hex, const std::string &event_json) -> std::optional<std::string>
{
  const auto signer = local_signer::from_hex(secret_hex);

  const auto event = protocol::event_data::deserialize(event_json);
  if (not event) {
    spdlog::error("[tool] Input is not a Nostr event");
    return std::nullopt;
  }
  if (not event->verify()) {
    spdlog::error("[tool] Gift wrap {} has an invalid id or signature", event->id);
    return std::nullopt;
  }

  const auto opened = unwrap(*event, signer);
  if (not opened) { return std::nullopt; }
  return opened->to_json().dump(2);
}

auto relay_list(const std::string &secret_hex, const std::vector<std::string> &relays) -> std::string
{
  const auto signer = local_signer::from_hex(secret_hex);

  protocol::event_template list{
    .created_at = platform::unix_now(), .kind = protocol::kind::inbox_relays, .tags = {}, .content = ""
  };
  for (const auto &relay : relays) { list.tags.push_back({ "relay", relay }); }
  return signer.sign_event(list).serialize();
}

}// namespace gift_relay::nostr::tool_commands
