#include <platform/time_utils.hpp>

#include <random>

namespace gift_relay::platform {

auto unix_now() -> std::uint64_t
{
  using namespace std::chrono;

  return static_cast<std::uint64_t>(duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
}

auto random_past_timestamp(std::chrono::seconds window) -> std::uint64_t
{
  static thread_local std::mt19937_64 engine{ std::random_device{}() };

  const auto now = unix_now();
  const auto span = static_cast<std::uint64_t>(window.count());
  if (span == 0) { return now; }

  std::uniform_int_distribution<std::uint64_t> offset(0, span - 1);
  const auto delta = offset(engine);
  return delta > now ? 0 : now - delta;
}

}// namespace gift_relay::platform
