#pragma once

#include <chrono>
#include <cstdint>

namespace gift_relay::platform {

/// Width of the window used for randomized seal and wrap timestamps (NIP-59).
inline constexpr std::chrono::seconds timestamp_jitter_window{ std::chrono::hours(48) };

/**
 * @brief Returns the current wall-clock time in Unix seconds.
 *
 * @return Seconds since the Unix epoch
 */
[[nodiscard]] auto unix_now() -> std::uint64_t;

/**
 * @brief Returns a timestamp drawn uniformly from the past window.
 *
 * @param window How far into the past the timestamp may fall
 * @return Unix seconds in (now - window, now]
 */
[[nodiscard]] auto random_past_timestamp(std::chrono::seconds window = timestamp_jitter_window) -> std::uint64_t;

}// namespace gift_relay::platform
