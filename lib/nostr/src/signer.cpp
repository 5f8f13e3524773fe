#include <nostr/signer.hpp>

#include <core/overload.hpp>
#include <crypto/digest.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace gift_relay::nostr {

local_signer::local_signer(const crypto::secret_key &key)
  : key_(key), pubkey_(crypto::derive_public_key(key)), cache_(std::make_shared<key_cache>())
{}

auto local_signer::from_hex(std::string_view secret_hex) -> local_signer
{
  return local_signer(crypto::secret_key_from_hex(secret_hex));
}

auto local_signer::generate() -> local_signer { return local_signer(crypto::generate_secret_key()); }

auto local_signer::sign_event(const protocol::event_template &event_template) const -> protocol::event_data
{
  protocol::event_data event{ .id = "",
    .pubkey = pubkey_,
    .created_at = event_template.created_at,
    .kind = event_template.kind,
    .tags = event_template.tags,
    .content = event_template.content,
    .sig = "" };

  const auto digest = crypto::sha256(protocol::canonical_serialization(
    event.pubkey, event.created_at, event.kind, event.tags, event.content));
  event.id = crypto::to_hex(digest);
  event.sig = crypto::sign_schnorr(key_, digest);
  return event;
}

auto local_signer::conversation_key(const std::string &pubkey) const -> crypto::nip44::conversation_key
{
  const std::lock_guard<std::mutex> lock(cache_->mutex);

  if (auto found = cache_->keys.find(pubkey); found != cache_->keys.end()) { return found->second; }

  auto key = crypto::nip44::get_conversation_key(key_, pubkey);
  cache_->keys.emplace(pubkey, key);
  return key;
}

auto local_signer::nip44_encrypt(const std::string &pubkey, const std::string &plaintext) const -> std::string
{
  return crypto::nip44::encrypt(plaintext, conversation_key(pubkey));
}

auto local_signer::nip44_decrypt(const std::string &pubkey, const std::string &payload) const -> std::string
{
  return crypto::nip44::decrypt(payload, conversation_key(pubkey));
}

delegated_signer::delegated_signer(std::string pubkey, sign_fn sign, cipher_fn encrypt, cipher_fn decrypt)
  : pubkey_(std::move(pubkey)), sign_(std::move(sign)), encrypt_(std::move(encrypt)), decrypt_(std::move(decrypt))
{}

auto delegated_signer::supports_nip44() const -> bool
{
  return static_cast<bool>(encrypt_) and static_cast<bool>(decrypt_);
}

auto delegated_signer::sign_event(const protocol::event_template &event_template) const -> protocol::event_data
{
  if (not sign_) { throw capability_error("Signer cannot sign events"); }

  auto event = sign_(event_template);
  if (event.pubkey != pubkey_) {
    throw capability_error(fmt::format("Signer returned an event for {} instead of {}", event.pubkey, pubkey_));
  }
  return event;
}

auto delegated_signer::nip44_encrypt(const std::string &pubkey, const std::string &plaintext) const -> std::string
{
  if (not encrypt_) { throw capability_error("Signer does not support NIP-44 encryption"); }
  return encrypt_(pubkey, plaintext);
}

auto delegated_signer::nip44_decrypt(const std::string &pubkey, const std::string &payload) const -> std::string
{
  if (not decrypt_) { throw capability_error("Signer does not support NIP-44 decryption"); }
  return decrypt_(pubkey, payload);
}

auto get_public_key(const signing_backend &backend) -> std::string
{
  return std::visit([](const auto &signer) { return signer.get_public_key(); }, backend);
}

auto sign_event(const signing_backend &backend, const protocol::event_template &event_template)
  -> protocol::event_data
{
  return std::visit([&event_template](const auto &signer) { return signer.sign_event(event_template); }, backend);
}

auto nip44_encrypt(const signing_backend &backend, const std::string &pubkey, const std::string &text) -> std::string
{
  return std::visit([&](const auto &signer) { return signer.nip44_encrypt(pubkey, text); }, backend);
}

auto nip44_decrypt(const signing_backend &backend, const std::string &pubkey, const std::string &text) -> std::string
{
  return std::visit([&](const auto &signer) { return signer.nip44_decrypt(pubkey, text); }, backend);
}

auto require_nip44(const signing_backend &backend) -> void
{
  std::visit(core::overload{ [](const local_signer &) {},
               [](const delegated_signer &signer) {
                 if (not signer.supports_nip44()) {
                   spdlog::error("[signer] Delegated signer {} lacks NIP-44, direct messages are unavailable",
                     signer.get_public_key());
                   throw capability_error("Signer does not support NIP-44 encryption");
                 }
               } },
    backend);
}

}// namespace gift_relay::nostr
