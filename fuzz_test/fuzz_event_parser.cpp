#include <cstddef>
#include <cstdint>
#include <nostr/gift_wrap.hpp>
#include <nostr/protocol.hpp>
#include <string>
#include <tuple>

// Fuzzer that feeds arbitrary text to the event and rumor parsers
// cppcheck-suppress unusedFunction symbolName=LLVMFuzzerTestOneInput
// NOLINTNEXTLINE(readability-identifier-naming)
extern "C" auto LLVMFuzzerTestOneInput(const uint8_t *Data, size_t Size) -> int
{
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  const std::string input(reinterpret_cast<const char *>(Data), Size);

  if (auto evt = gift_relay::nostr::protocol::event_data::deserialize(input)) {
    std::ignore = evt->verify();
  }
  std::ignore = gift_relay::nostr::rumor::deserialize(input);
  std::ignore = gift_relay::nostr::protocol::ok::deserialize(input);

  return 0;
}
