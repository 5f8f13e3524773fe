#pragma once

#include <crypto/keys.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

/**
 * NIP-44 version 2 payload encryption.
 *
 * secp256k1 ECDH -> HKDF-SHA256 -> ChaCha20 with HMAC-SHA256, length-hiding padding
 * and a base64 envelope: base64(0x02 || nonce || ciphertext || mac).
 */
namespace gift_relay::crypto::nip44 {

inline constexpr std::uint8_t version = 2;
inline constexpr std::size_t min_plaintext_size = 1;
inline constexpr std::size_t max_plaintext_size = 65535;

using conversation_key = std::array<std::uint8_t, 32>;
using nonce = std::array<std::uint8_t, 32>;

/**
 * @brief Derives the symmetric key shared by a key pair and a remote public key.
 *
 * Symmetric: get_conversation_key(a, B) == get_conversation_key(b, A).
 *
 * @throws crypto_error if either key is malformed
 */
[[nodiscard]] auto get_conversation_key(const secret_key &key, std::string_view pubkey_hex) -> conversation_key;

/**
 * @brief Size of the padded plaintext block for a message length.
 */
[[nodiscard]] auto calc_padded_len(std::size_t unpadded_len) -> std::size_t;

/**
 * @brief Encrypts with a random nonce.
 *
 * @throws crypto_error if the plaintext is empty or longer than 65535 bytes
 */
[[nodiscard]] auto encrypt(std::string_view plaintext, const conversation_key &key) -> std::string;

/**
 * @brief Encrypts with a caller-provided nonce. Only for test vectors.
 */
[[nodiscard]] auto encrypt(std::string_view plaintext, const conversation_key &key, const nonce &salt)
  -> std::string;

/**
 * @brief Authenticates and decrypts a payload.
 *
 * @throws crypto_error on unknown version, bad length, bad MAC or bad padding
 */
[[nodiscard]] auto decrypt(std::string_view payload, const conversation_key &key) -> std::string;

}// namespace gift_relay::crypto::nip44
