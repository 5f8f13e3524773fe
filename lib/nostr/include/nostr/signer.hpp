#pragma once

#include <concepts/signer.hpp>
#include <crypto/keys.hpp>
#include <crypto/nip44.hpp>
#include <nostr/protocol.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>

namespace gift_relay::nostr {

/// The active signer lacks an operation a direct-message flow requires
class capability_error : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief Signs and encrypts with a secret key held in process.
 *
 * Copies share one conversation-key cache.
 */
class local_signer
{
public:
  explicit local_signer(const crypto::secret_key &key);

  /// @throws crypto::crypto_error for malformed or out-of-range hex
  [[nodiscard]] static auto from_hex(std::string_view secret_hex) -> local_signer;

  /// Fresh random key, used for one-shot gift wrap identities
  [[nodiscard]] static auto generate() -> local_signer;

  [[nodiscard]] auto get_public_key() const -> std::string { return pubkey_; }

  [[nodiscard]] static constexpr auto supports_nip44() -> bool { return true; }

  /**
   * @brief Fills in pubkey, id and signature.
   */
  [[nodiscard]] auto sign_event(const protocol::event_template &event_template) const -> protocol::event_data;

  [[nodiscard]] auto nip44_encrypt(const std::string &pubkey, const std::string &plaintext) const -> std::string;

  [[nodiscard]] auto nip44_decrypt(const std::string &pubkey, const std::string &payload) const -> std::string;

  /**
   * @brief Conversation key with @p pubkey, derived on first use.
   *
   * @throws crypto::crypto_error if the remote key is malformed
   */
  [[nodiscard]] auto conversation_key(const std::string &pubkey) const -> crypto::nip44::conversation_key;

private:
  struct key_cache
  {
    std::mutex mutex;
    std::unordered_map<std::string, crypto::nip44::conversation_key> keys;
  };

  crypto::secret_key key_;
  std::string pubkey_;
  std::shared_ptr<key_cache> cache_;
};

/**
 * @brief Forwards signing and encryption to an external signer (NIP-07/NIP-46 style).
 *
 * Encryption callbacks are optional; a signer without them cannot take part in
 * direct messages.
 */
class delegated_signer
{
public:
  using sign_fn = std::function<protocol::event_data(const protocol::event_template &)>;
  using cipher_fn = std::function<std::string(const std::string &pubkey, const std::string &text)>;

  delegated_signer(std::string pubkey, sign_fn sign, cipher_fn encrypt = {}, cipher_fn decrypt = {});

  [[nodiscard]] auto get_public_key() const -> std::string { return pubkey_; }

  /// Both nip44_encrypt and nip44_decrypt are available
  [[nodiscard]] auto supports_nip44() const -> bool;

  /// @throws capability_error if the signer returned an event for another key
  [[nodiscard]] auto sign_event(const protocol::event_template &event_template) const -> protocol::event_data;

  /// @throws capability_error without an encrypt callback
  [[nodiscard]] auto nip44_encrypt(const std::string &pubkey, const std::string &plaintext) const -> std::string;

  /// @throws capability_error without a decrypt callback
  [[nodiscard]] auto nip44_decrypt(const std::string &pubkey, const std::string &payload) const -> std::string;

private:
  std::string pubkey_;
  sign_fn sign_;
  cipher_fn encrypt_;
  cipher_fn decrypt_;
};

static_assert(concepts::signer<local_signer>);
static_assert(concepts::signer<delegated_signer>);

/// Signing provider chosen once per session and threaded through wrap/unwrap
using signing_backend = std::variant<local_signer, delegated_signer>;

[[nodiscard]] auto get_public_key(const signing_backend &backend) -> std::string;

[[nodiscard]] auto sign_event(const signing_backend &backend, const protocol::event_template &event_template)
  -> protocol::event_data;

[[nodiscard]] auto nip44_encrypt(const signing_backend &backend, const std::string &pubkey, const std::string &text)
  -> std::string;

[[nodiscard]] auto nip44_decrypt(const signing_backend &backend, const std::string &pubkey, const std::string &text)
  -> std::string;

/**
 * @brief Fails fast when the backend cannot encrypt and decrypt direct messages.
 *
 * @throws capability_error for a delegated signer missing either NIP-44 operation
 */
auto require_nip44(const signing_backend &backend) -> void;

}// namespace gift_relay::nostr
