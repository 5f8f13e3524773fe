#include <crypto/crypto_error.hpp>
#include <crypto/digest.hpp>
#include <crypto/encoding.hpp>
#include <crypto/nip44.hpp>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/rand.h>

#include <algorithm>
#include <bit>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

namespace gift_relay::crypto::nip44 {

namespace {

  constexpr std::string_view salt_label = "nip44-v2";

  constexpr std::size_t chacha_key_size = 32;
  constexpr std::size_t chacha_nonce_size = 12;
  constexpr std::size_t hmac_key_size = 32;
  constexpr std::size_t message_keys_size = chacha_key_size + chacha_nonce_size + hmac_key_size;
  constexpr std::size_t mac_size = 32;
  constexpr std::size_t length_prefix_size = 2;
  constexpr std::size_t min_padded_size = 32;

  constexpr std::size_t min_payload_size = 132;
  constexpr std::size_t max_payload_size = 87472;
  constexpr std::size_t min_decoded_size = 99;
  constexpr std::size_t max_decoded_size = 65603;

  struct message_keys
  {
    std::array<std::uint8_t, chacha_key_size> chacha_key{};
    std::array<std::uint8_t, chacha_nonce_size> chacha_nonce{};
    std::array<std::uint8_t, hmac_key_size> hmac_key{};
  };

  using pkey_ctx_ptr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
  using cipher_ctx_ptr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

  auto as_bytes(std::string_view text) -> std::span<const std::uint8_t>
  {
    return { reinterpret_cast<const std::uint8_t *>(text.data()),// NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
      text.size() };
  }

  auto hkdf(int mode,
    std::span<const std::uint8_t> salt,
    std::span<const std::uint8_t> key,
    std::span<const std::uint8_t> info,
    std::span<std::uint8_t> out) -> void
  {
    const pkey_ctx_ptr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr), &EVP_PKEY_CTX_free);
    if (not ctx or EVP_PKEY_derive_init(ctx.get()) <= 0 or EVP_PKEY_CTX_hkdf_mode(ctx.get(), mode) <= 0
        or EVP_PKEY_CTX_set_hkdf_md(ctx.get(), EVP_sha256()) <= 0) {
      throw crypto_error("HKDF initialisation failed");
    }
    if (not salt.empty()
        and EVP_PKEY_CTX_set1_hkdf_salt(ctx.get(), salt.data(), static_cast<int>(salt.size())) <= 0) {
      throw crypto_error("HKDF salt rejected");
    }
    if (EVP_PKEY_CTX_set1_hkdf_key(ctx.get(), key.data(), static_cast<int>(key.size())) <= 0) {
      throw crypto_error("HKDF key rejected");
    }
    if (not info.empty() and EVP_PKEY_CTX_add1_hkdf_info(ctx.get(), info.data(), static_cast<int>(info.size())) <= 0) {
      throw crypto_error("HKDF info rejected");
    }

    auto out_len = out.size();
    if (EVP_PKEY_derive(ctx.get(), out.data(), &out_len) <= 0 or out_len != out.size()) {
      throw crypto_error("HKDF derivation failed");
    }
  }

  auto get_message_keys(const conversation_key &key, const nonce &salt) -> message_keys
  {
    std::array<std::uint8_t, message_keys_size> okm{};
    hkdf(EVP_PKEY_HKDEF_MODE_EXPAND_ONLY, {}, key, salt, okm);

    message_keys keys;
    auto cursor = okm.begin();
    std::copy_n(cursor, chacha_key_size, keys.chacha_key.begin());
    cursor += chacha_key_size;
    std::copy_n(cursor, chacha_nonce_size, keys.chacha_nonce.begin());
    cursor += chacha_nonce_size;
    std::copy_n(cursor, hmac_key_size, keys.hmac_key.begin());
    OPENSSL_cleanse(okm.data(), okm.size());
    return keys;
  }

  // ChaCha20 is its own inverse; OpenSSL takes a 16-byte IV of LE counter || nonce.
  auto chacha20(const message_keys &keys, std::span<const std::uint8_t> input) -> std::vector<std::uint8_t>
  {
    std::array<std::uint8_t, 16> iv{};
    std::ranges::copy(keys.chacha_nonce, iv.begin() + 4);

    const cipher_ctx_ptr ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (not ctx or EVP_EncryptInit_ex(ctx.get(), EVP_chacha20(), nullptr, keys.chacha_key.data(), iv.data()) != 1) {
      throw crypto_error("ChaCha20 initialisation failed");
    }

    std::vector<std::uint8_t> output(input.size());
    int written = 0;
    if (EVP_EncryptUpdate(ctx.get(), output.data(), &written, input.data(), static_cast<int>(input.size())) != 1) {
      throw crypto_error("ChaCha20 failed");
    }
    int final_written = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), output.data() + written, &final_written) != 1) {
      throw crypto_error("ChaCha20 finalisation failed");
    }
    return output;
  }

  auto authenticate(const message_keys &keys, const nonce &salt, std::span<const std::uint8_t> ciphertext) -> digest32
  {
    std::vector<std::uint8_t> aad;
    aad.reserve(salt.size() + ciphertext.size());
    aad.insert(aad.end(), salt.begin(), salt.end());
    aad.insert(aad.end(), ciphertext.begin(), ciphertext.end());
    return hmac_sha256(keys.hmac_key, aad);
  }

  auto pad(std::string_view plaintext) -> std::vector<std::uint8_t>
  {
    const auto length = plaintext.size();
    if (length < min_plaintext_size or length > max_plaintext_size) {
      throw crypto_error("Plaintext length must be between 1 and 65535 bytes");
    }

    constexpr unsigned byte_bits = 8;
    constexpr unsigned byte_mask = 0xff;
    std::vector<std::uint8_t> padded(length_prefix_size + calc_padded_len(length), 0);
    padded[0] = static_cast<std::uint8_t>((length >> byte_bits) & byte_mask);
    padded[1] = static_cast<std::uint8_t>(length & byte_mask);
    std::ranges::copy(as_bytes(plaintext), padded.begin() + length_prefix_size);
    return padded;
  }

  auto unpad(std::span<const std::uint8_t> padded) -> std::string
  {
    if (padded.size() < length_prefix_size) { throw crypto_error("Invalid padding"); }

    constexpr unsigned byte_bits = 8;
    const std::size_t length = (static_cast<std::size_t>(padded[0]) << byte_bits) | padded[1];
    if (length < min_plaintext_size or length_prefix_size + length > padded.size()
        or padded.size() != length_prefix_size + calc_padded_len(length)) {
      throw crypto_error("Invalid padding");
    }

    const auto body = padded.subspan(length_prefix_size, length);
    return { body.begin(), body.end() };
  }

}// namespace

auto get_conversation_key(const secret_key &key, std::string_view pubkey_hex) -> conversation_key
{
  auto shared_x = shared_secret(key, pubkey_hex);

  conversation_key out{};
  hkdf(EVP_PKEY_HKDEF_MODE_EXTRACT_ONLY, as_bytes(salt_label), shared_x, {}, out);
  OPENSSL_cleanse(shared_x.data(), shared_x.size());
  return out;
}

auto calc_padded_len(std::size_t unpadded_len) -> std::size_t
{
  if (unpadded_len <= min_padded_size) { return min_padded_size; }

  constexpr std::size_t small_chunk_limit = 256;
  constexpr std::size_t large_chunk_divisor = 8;

  const auto next_power = std::size_t{ 1 } << std::bit_width(unpadded_len - 1);
  const auto chunk = next_power <= small_chunk_limit ? min_padded_size : next_power / large_chunk_divisor;
  return chunk * (((unpadded_len - 1) / chunk) + 1);
}

auto encrypt(std::string_view plaintext, const conversation_key &key) -> std::string
{
  nonce salt{};
  if (RAND_bytes(salt.data(), static_cast<int>(salt.size())) != 1) { throw crypto_error("OpenSSL RAND_bytes failed"); }
  return encrypt(plaintext, key, salt);
}

auto encrypt(std::string_view plaintext, const conversation_key &key, const nonce &salt) -> std::string
{
  const auto keys = get_message_keys(key, salt);
  const auto padded = pad(plaintext);
  const auto ciphertext = chacha20(keys, padded);
  const auto mac = authenticate(keys, salt, ciphertext);

  std::vector<std::uint8_t> payload;
  payload.reserve(1 + salt.size() + ciphertext.size() + mac.size());
  payload.push_back(version);
  payload.insert(payload.end(), salt.begin(), salt.end());
  payload.insert(payload.end(), ciphertext.begin(), ciphertext.end());
  payload.insert(payload.end(), mac.begin(), mac.end());
  return base64_encode(payload);
}

auto decrypt(std::string_view payload, const conversation_key &key) -> std::string
{
  if (payload.empty() or payload.front() == '#') { throw crypto_error("Unknown NIP-44 encryption version"); }
  if (payload.size() < min_payload_size or payload.size() > max_payload_size) {
    throw crypto_error("Invalid NIP-44 payload size");
  }

  const auto data = base64_decode(payload);
  if (data.size() < min_decoded_size or data.size() > max_decoded_size) {
    throw crypto_error("Invalid NIP-44 data size");
  }
  if (data.front() != version) { throw crypto_error("Unknown NIP-44 encryption version"); }

  const std::span<const std::uint8_t> view(data);
  nonce salt{};
  std::ranges::copy(view.subspan(1, salt.size()), salt.begin());
  const auto ciphertext = view.subspan(1 + salt.size(), view.size() - 1 - salt.size() - mac_size);
  const auto mac = view.last(mac_size);

  const auto keys = get_message_keys(key, salt);
  const auto expected = authenticate(keys, salt, ciphertext);
  if (CRYPTO_memcmp(expected.data(), mac.data(), mac_size) != 0) { throw crypto_error("Invalid NIP-44 MAC"); }

  const auto padded = chacha20(keys, ciphertext);
  return unpad(padded);
}

}// namespace gift_relay::crypto::nip44
