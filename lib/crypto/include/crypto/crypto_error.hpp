#pragma once

#include <stdexcept>

namespace gift_relay::crypto {

/**
 * @brief Raised for malformed keys, ciphertexts or failed primitive calls.
 *
 * Senders treat it as fatal for the current operation. Receivers catch it and
 * treat the event as undecryptable.
 */
class crypto_error : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

}// namespace gift_relay::crypto
