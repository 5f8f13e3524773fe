#include <crypto/crypto_error.hpp>
#include <crypto/nip44.hpp>
#include <cstddef>
#include <cstdint>
#include <nostr/gift_wrap.hpp>
#include <nostr/protocol.hpp>
#include <nostr/signer.hpp>
#include <string>
#include <tuple>

namespace {

constexpr auto recipient_secret = "0000000000000000000000000000000000000000000000000000000000000001";
constexpr auto sender_pubkey = "c6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee5";

}// namespace

// Fuzzer that tries to open arbitrary payloads as NIP-44 ciphertext and as gift wraps
// cppcheck-suppress unusedFunction symbolName=LLVMFuzzerTestOneInput
// NOLINTNEXTLINE(readability-identifier-naming)
extern "C" auto LLVMFuzzerTestOneInput(const uint8_t *Data, size_t Size) -> int
{
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  const std::string input(reinterpret_cast<const char *>(Data), Size);

  static const gift_relay::nostr::signing_backend backend{ gift_relay::nostr::local_signer::from_hex(
    recipient_secret) };
  static const auto key = std::get<gift_relay::nostr::local_signer>(backend).conversation_key(sender_pubkey);

  try {
    std::ignore = gift_relay::crypto::nip44::decrypt(input, key);
  } catch (const gift_relay::crypto::crypto_error &) {
    // rejected payloads are the expected outcome
  }

  if (auto evt = gift_relay::nostr::protocol::event_data::deserialize(input)) {
    std::ignore = gift_relay::nostr::unwrap(*evt, backend);
  }

  return 0;
}
