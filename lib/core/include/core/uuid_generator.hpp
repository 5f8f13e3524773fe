#pragma once

#include <string>
#include <string_view>

namespace gift_relay::core {

/**
 * @brief Generates random RFC 4122 identifiers.
 *
 * Used for relay subscription ids, which must be unique per connection and at
 * most 64 characters long.
 */
class uuid_generator
{
public:
  /**
   * @brief Generates a new UUID string.
   *
   * @return UUID in canonical 36-character form
   */
  [[nodiscard]] static auto generate() -> std::string;

  /// "<prefix>-<uuid>", cut to the 64 characters a relay accepts
  [[nodiscard]] static auto subscription_id(std::string_view prefix) -> std::string;
};

}// namespace gift_relay::core
