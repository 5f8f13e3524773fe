#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gift_relay::crypto {

/**
 * @brief Encodes bytes as lowercase hex.
 *
 * @param bytes Input bytes
 * @return Hex string, two characters per byte
 */
[[nodiscard]] auto to_hex(std::span<const std::uint8_t> bytes) -> std::string;

/**
 * @brief Decodes a hex string (either case).
 *
 * @param hex Hex string of even length
 * @return Decoded bytes
 * @throws crypto_error on odd length or non-hex characters
 */
[[nodiscard]] auto from_hex(std::string_view hex) -> std::vector<std::uint8_t>;

/**
 * @brief Encodes bytes as padded standard base64.
 */
[[nodiscard]] auto base64_encode(std::span<const std::uint8_t> bytes) -> std::string;

/**
 * @brief Decodes padded standard base64.
 *
 * @throws crypto_error on malformed input
 */
[[nodiscard]] auto base64_decode(std::string_view text) -> std::vector<std::uint8_t>;

}// namespace gift_relay::crypto
