#include <crypto/crypto_error.hpp>
#include <crypto/encoding.hpp>

#include <fmt/format.h>
#include <openssl/evp.h>

#include <algorithm>
#include <optional>

namespace gift_relay::crypto {

namespace {

  auto hex_value(char character) -> std::optional<std::uint8_t>
  {
    constexpr std::uint8_t alpha_offset = 10;
    if (character >= '0' and character <= '9') { return static_cast<std::uint8_t>(character - '0'); }
    if (character >= 'a' and character <= 'f') { return static_cast<std::uint8_t>(character - 'a' + alpha_offset); }
    if (character >= 'A' and character <= 'F') { return static_cast<std::uint8_t>(character - 'A' + alpha_offset); }
    return std::nullopt;
  }

}// namespace

auto to_hex(std::span<const std::uint8_t> bytes) -> std::string
{
  std::string hex;
  hex.reserve(bytes.size() * 2);
  for (const auto byte : bytes) { hex += fmt::format("{:02x}", byte); }
  return hex;
}

auto from_hex(std::string_view hex) -> std::vector<std::uint8_t>
{
  if (hex.size() % 2 != 0) { throw crypto_error("Hex string has odd length"); }

  constexpr int nibble_bits = 4;
  std::vector<std::uint8_t> bytes;
  bytes.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_value(hex[i]);
    auto low = hex_value(hex[i + 1]);
    if (not high or not low) { throw crypto_error("Hex string contains invalid characters"); }
    bytes.push_back(static_cast<std::uint8_t>((*high << nibble_bits) | *low));
  }
  return bytes;
}

auto base64_encode(std::span<const std::uint8_t> bytes) -> std::string
{
  constexpr std::size_t group_in = 3;
  constexpr std::size_t group_out = 4;

  std::string encoded(((bytes.size() + group_in - 1) / group_in) * group_out + 1, '\0');
  const auto written = EVP_EncodeBlock(
    reinterpret_cast<unsigned char *>(encoded.data()),// NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
    bytes.data(),
    static_cast<int>(bytes.size()));
  encoded.resize(static_cast<std::size_t>(written));
  return encoded;
}

auto base64_decode(std::string_view text) -> std::vector<std::uint8_t>
{
  constexpr std::size_t group_in = 4;
  constexpr std::size_t group_out = 3;

  if (text.empty()) { return {}; }
  if (text.size() % group_in != 0) { throw crypto_error("Base64 input length is not a multiple of 4"); }

  std::vector<std::uint8_t> decoded((text.size() / group_in) * group_out);
  const auto written = EVP_DecodeBlock(decoded.data(),
    reinterpret_cast<const unsigned char *>(text.data()),// NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
    static_cast<int>(text.size()));
  if (written < 0) { throw crypto_error("Malformed base64 input"); }

  const auto padding = static_cast<std::size_t>(std::count(text.end() - 2, text.end(), '='));
  decoded.resize(static_cast<std::size_t>(written) - padding);
  return decoded;
}

}// namespace gift_relay::crypto
