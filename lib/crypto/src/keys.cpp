#include <crypto/crypto_error.hpp>
#include <crypto/encoding.hpp>
#include <crypto/keys.hpp>

#include <openssl/crypto.h>
#include <openssl/rand.h>
#include <secp256k1.h>
#include <secp256k1_ecdh.h>
#include <secp256k1_extrakeys.h>
#include <secp256k1_schnorrsig.h>

#include <algorithm>
#include <memory>
#include <tuple>

namespace gift_relay::crypto {

namespace {

  struct context_deleter
  {
    auto operator()(secp256k1_context *ctx) const -> void { secp256k1_context_destroy(ctx); }
  };

  using context_ptr = std::unique_ptr<secp256k1_context, context_deleter>;

  auto make_context() -> context_ptr
  {
    context_ptr ctx{ secp256k1_context_create(SECP256K1_CONTEXT_NONE) };
    if (not ctx) { throw crypto_error("Failed to create secp256k1 context"); }

    // Randomization failure leaves blinding off.
    std::array<unsigned char, 32> seed{};
    if (RAND_bytes(seed.data(), static_cast<int>(seed.size())) == 1) {
      std::ignore = secp256k1_context_randomize(ctx.get(), seed.data());
    }
    OPENSSL_cleanse(seed.data(), seed.size());
    return ctx;
  }

  auto context() -> const secp256k1_context *
  {
    static const context_ptr ctx = make_context();
    return ctx.get();
  }

  auto fill_random(std::span<unsigned char> out) -> void
  {
    if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
      throw crypto_error("OpenSSL RAND_bytes failed");
    }
  }

  struct keypair_guard
  {
    secp256k1_keypair keypair{};

    explicit keypair_guard(const secret_key &key)
    {
      if (secp256k1_keypair_create(context(), &keypair, key.data()) != 1) {
        throw crypto_error("Invalid secp256k1 secret key");
      }
    }

    keypair_guard(const keypair_guard &) = delete;
    auto operator=(const keypair_guard &) -> keypair_guard & = delete;
    keypair_guard(keypair_guard &&) = delete;
    auto operator=(keypair_guard &&) -> keypair_guard & = delete;

    ~keypair_guard() { OPENSSL_cleanse(&keypair, sizeof(keypair)); }
  };

  auto parse_xonly(std::string_view pubkey_hex) -> std::array<unsigned char, 32>
  {
    if (pubkey_hex.size() != public_key_hex_length) { throw crypto_error("Public key must be 64 hex characters"); }
    auto bytes = from_hex(pubkey_hex);
    std::array<unsigned char, 32> out{};
    std::ranges::copy(bytes, out.begin());
    return out;
  }

  auto copy_x_coordinate(unsigned char *output,
    const unsigned char *x32,
    const unsigned char * /*y32*/,
    void * /*data*/) -> int
  {
    std::copy_n(x32, 32, output);
    return 1;
  }

}// namespace

auto generate_secret_key() -> secret_key
{
  secret_key key{};
  do { fill_random(key); } while (secp256k1_ec_seckey_verify(context(), key.data()) != 1);
  return key;
}

auto secret_key_from_hex(std::string_view hex) -> secret_key
{
  if (hex.size() != secret_key_hex_length) { throw crypto_error("Secret key must be 64 hex characters"); }

  auto bytes = from_hex(hex);
  secret_key key{};
  std::ranges::copy(bytes, key.begin());
  OPENSSL_cleanse(bytes.data(), bytes.size());

  if (secp256k1_ec_seckey_verify(context(), key.data()) != 1) { throw crypto_error("Secret key out of range"); }
  return key;
}

auto derive_public_key(const secret_key &key) -> std::string
{
  const keypair_guard guard(key);

  secp256k1_xonly_pubkey xonly{};
  if (secp256k1_keypair_xonly_pub(context(), &xonly, nullptr, &guard.keypair) != 1) {
    throw crypto_error("Failed to derive x-only public key");
  }

  std::array<std::uint8_t, 32> serialized{};
  if (secp256k1_xonly_pubkey_serialize(context(), serialized.data(), &xonly) != 1) {
    throw crypto_error("Failed to serialize public key");
  }
  return to_hex(serialized);
}

auto is_valid_public_key(std::string_view pubkey_hex) -> bool
{
  try {
    const auto bytes = parse_xonly(pubkey_hex);
    secp256k1_xonly_pubkey xonly{};
    return secp256k1_xonly_pubkey_parse(context(), &xonly, bytes.data()) == 1;
  } catch (const crypto_error &) {
    return false;
  }
}

auto sign_schnorr(const secret_key &key, const digest32 &message) -> std::string
{
  const keypair_guard guard(key);

  std::array<unsigned char, 32> aux_rand{};
  fill_random(aux_rand);

  std::array<std::uint8_t, 64> signature{};
  if (secp256k1_schnorrsig_sign32(context(), signature.data(), message.data(), &guard.keypair, aux_rand.data())
      != 1) {
    throw crypto_error("Schnorr signing failed");
  }
  return to_hex(signature);
}

auto verify_schnorr(std::string_view pubkey_hex, const digest32 &message, std::string_view signature_hex) -> bool
{
  if (signature_hex.size() != signature_hex_length) { return false; }

  try {
    const auto pubkey_bytes = parse_xonly(pubkey_hex);
    const auto signature = from_hex(signature_hex);

    secp256k1_xonly_pubkey xonly{};
    if (secp256k1_xonly_pubkey_parse(context(), &xonly, pubkey_bytes.data()) != 1) { return false; }

    return secp256k1_schnorrsig_verify(context(), signature.data(), message.data(), message.size(), &xonly) == 1;
  } catch (const crypto_error &) {
    return false;
  }
}

auto shared_secret(const secret_key &key, std::string_view pubkey_hex) -> std::array<std::uint8_t, 32>
{
  const auto xonly = parse_xonly(pubkey_hex);

  constexpr unsigned char even_y_prefix = 0x02;
  std::array<unsigned char, 33> compressed{};
  compressed[0] = even_y_prefix;
  std::ranges::copy(xonly, compressed.begin() + 1);

  secp256k1_pubkey point{};
  if (secp256k1_ec_pubkey_parse(context(), &point, compressed.data(), compressed.size()) != 1) {
    throw crypto_error("Public key is not on secp256k1");
  }
  if (secp256k1_ec_seckey_verify(context(), key.data()) != 1) { throw crypto_error("Invalid secp256k1 secret key"); }

  std::array<std::uint8_t, 32> shared_x{};
  if (secp256k1_ecdh(context(), shared_x.data(), &point, key.data(), copy_x_coordinate, nullptr) != 1) {
    throw crypto_error("ECDH failed");
  }
  return shared_x;
}

}// namespace gift_relay::crypto
