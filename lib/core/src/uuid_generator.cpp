#include <core/uuid_generator.hpp>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cstddef>
#include <fmt/format.h>

namespace gift_relay::core {

auto uuid_generator::generate() -> std::string
{
  static thread_local boost::uuids::random_generator generator;
  return boost::uuids::to_string(generator());
}

auto uuid_generator::subscription_id(std::string_view prefix) -> std::string
{
  constexpr std::size_t max_subscription_id_length = 64;
  auto id = fmt::format("{}-{}", prefix, generate());
  if (id.size() > max_subscription_id_length) { id.resize(max_subscription_id_length); }
  return id;
}

}// namespace gift_relay::core
