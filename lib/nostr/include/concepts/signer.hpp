#pragma once

#include <concepts>
#include <nostr/protocol.hpp>
#include <string>

namespace gift_relay::concepts {

/**
 * @brief Concept defining a signing provider for private direct messages.
 *
 * A signer owns one Nostr identity. It signs event templates with that identity and
 * performs NIP-44 encryption between the identity and a remote public key.
 */
template<typename T>
concept signer = requires(const T provider,
  const nostr::protocol::event_template &event_template,
  const std::string &pubkey,
  const std::string &text) {
  { provider.get_public_key() } -> std::convertible_to<std::string>;
  { provider.supports_nip44() } -> std::convertible_to<bool>;
  { provider.sign_event(event_template) } -> std::same_as<nostr::protocol::event_data>;
  { provider.nip44_encrypt(pubkey, text) } -> std::convertible_to<std::string>;
  { provider.nip44_decrypt(pubkey, text) } -> std::convertible_to<std::string>;
};

}// namespace gift_relay::concepts
