#pragma once

#include <crypto/digest.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace gift_relay::crypto {

/// Raw secp256k1 secret key
using secret_key = std::array<std::uint8_t, 32>;

/// Length of a secret key in hex
inline constexpr std::size_t secret_key_hex_length = 64;

/// Length of an x-only public key in hex
inline constexpr std::size_t public_key_hex_length = 64;

/// Length of a BIP-340 signature in hex
inline constexpr std::size_t signature_hex_length = 128;

/**
 * @brief Generates a fresh secret key from the OpenSSL CSPRNG.
 *
 * @return A key valid on secp256k1
 * @throws crypto_error if randomness is unavailable
 */
[[nodiscard]] auto generate_secret_key() -> secret_key;

/**
 * @brief Parses a 64-character hex secret key.
 *
 * @throws crypto_error if malformed or out of range
 */
[[nodiscard]] auto secret_key_from_hex(std::string_view hex) -> secret_key;

/**
 * @brief Derives the BIP-340 x-only public key.
 *
 * @param key Secret key
 * @return 64-character lowercase hex public key
 * @throws crypto_error if the key is invalid
 */
[[nodiscard]] auto derive_public_key(const secret_key &key) -> std::string;

/**
 * @brief Checks that a hex string names a point on secp256k1.
 */
[[nodiscard]] auto is_valid_public_key(std::string_view pubkey_hex) -> bool;

/**
 * @brief Produces a BIP-340 Schnorr signature over a 32-byte message.
 *
 * @return 128-character hex signature
 * @throws crypto_error if the key is invalid
 */
[[nodiscard]] auto sign_schnorr(const secret_key &key, const digest32 &message) -> std::string;

/**
 * @brief Verifies a BIP-340 Schnorr signature.
 *
 * Malformed keys or signatures verify as false.
 */
[[nodiscard]] auto verify_schnorr(std::string_view pubkey_hex, const digest32 &message, std::string_view signature_hex)
  -> bool;

/**
 * @brief Computes the unhashed x-coordinate of the ECDH point key * pubkey.
 *
 * The public key is lifted with even y, as x-only keys are.
 *
 * @throws crypto_error if either key is malformed
 */
[[nodiscard]] auto shared_secret(const secret_key &key, std::string_view pubkey_hex) -> std::array<std::uint8_t, 32>;

}// namespace gift_relay::crypto
