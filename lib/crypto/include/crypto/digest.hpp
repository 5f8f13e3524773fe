#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string_view>

namespace gift_relay::crypto {

/// 32-byte SHA-256 output
using digest32 = std::array<std::uint8_t, 32>;

[[nodiscard]] auto sha256(std::span<const std::uint8_t> data) -> digest32;

[[nodiscard]] auto sha256(std::string_view text) -> digest32;

/**
 * @brief Computes HMAC-SHA256.
 *
 * @param key MAC key
 * @param data Authenticated data
 * @return 32-byte tag
 * @throws crypto_error if the primitive fails
 */
[[nodiscard]] auto hmac_sha256(std::span<const std::uint8_t> key, std::span<const std::uint8_t> data) -> digest32;

}// namespace gift_relay::crypto
