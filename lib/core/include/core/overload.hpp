#pragma once

namespace gift_relay::core {

/**
 * @brief Builds a visitor from a set of lambdas for std::visit.
 *
 * @code
 * std::visit(overload{
 *   [](const nostr::local_signer &local) { ... },
 *   [](const nostr::delegated_signer &remote) { ... }
 * }, backend);
 * @endcode
 */
template<class... Ts> struct overload : Ts...
{
  using Ts::operator()...;
};

template<class... Ts> overload(Ts...) -> overload<Ts...>;

}// namespace gift_relay::core
