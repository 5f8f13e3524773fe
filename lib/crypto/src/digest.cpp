#include <crypto/crypto_error.hpp>
#include <crypto/digest.hpp>

#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace gift_relay::crypto {

auto sha256(std::span<const std::uint8_t> data) -> digest32
{
  digest32 out{};
  unsigned int out_len = 0;
  if (EVP_Digest(data.data(), data.size(), out.data(), &out_len, EVP_sha256(), nullptr) != 1
      or out_len != out.size()) {
    throw crypto_error("SHA-256 digest failed");
  }
  return out;
}

auto sha256(std::string_view text) -> digest32
{
  return sha256(std::span<const std::uint8_t>(
    reinterpret_cast<const std::uint8_t *>(text.data()),// NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
    text.size()));
}

auto hmac_sha256(std::span<const std::uint8_t> key, std::span<const std::uint8_t> data) -> digest32
{
  digest32 out{};
  unsigned int out_len = 0;
  if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), data.data(), data.size(), out.data(), &out_len)
        == nullptr
      or out_len != out.size()) {
    throw crypto_error("HMAC-SHA256 failed");
  }
  return out;
}

}// namespace gift_relay::crypto
