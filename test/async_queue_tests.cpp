#include <async/async_queue.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <catch2/catch_test_macros.hpp>
#include <core/events.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <tuple>
#include <variant>
#include <vector>

using int_queue_t = gift_relay::async::async_queue<int>;

SCENARIO("async_queue keeps accepting past its buffer capacity", "[async_queue][capacity]")
{
  GIVEN("A queue filled beyond its buffer")
  {
    auto io_context = std::make_shared<boost::asio::io_context>();
    int_queue_t queue(io_context);

    constexpr auto overflow = int_queue_t::capacity + 16;
    bool accepted = true;
    for (std::size_t index = 0; index < overflow; ++index) { accepted = queue.push(static_cast<int>(index)) and accepted; }

    THEN("nothing was refused") { CHECK(accepted); }

    THEN("every message comes back in push order")
    {
      CHECK(queue.size() == overflow);
      std::size_t expected = 0;
      while (auto value = queue.try_pop()) {
        if (*value != static_cast<int>(expected)) { break; }
        ++expected;
      }
      CHECK(expected == overflow);
      CHECK(queue.empty());
    }
  }
}

SCENARIO("async_queue pop can be cancelled through its slot", "[async_queue][cancel]")
{
  GIVEN("A consumer waiting on an empty queue")
  {
    auto io_context = std::make_shared<boost::asio::io_context>();
    int_queue_t queue(io_context);
    auto signal = std::make_shared<boost::asio::cancellation_signal>();
    auto slot = std::make_shared<boost::asio::cancellation_slot>(signal->slot());
    auto outcome = std::make_shared<std::string>("waiting");

    boost::asio::co_spawn(
      *io_context,
      [](std::reference_wrapper<int_queue_t> queue_ref,
        std::shared_ptr<boost::asio::cancellation_slot> cancel_slot,
        std::shared_ptr<std::string> outcome_ptr) -> boost::asio::awaitable<void> {
        try {
          std::ignore = co_await queue_ref.get().pop(cancel_slot);
          *outcome_ptr = "received";
        } catch (const boost::system::system_error &) {
          *outcome_ptr = "cancelled";
        }
      }(std::ref(queue), slot, outcome),
      boost::asio::detached);
    io_context->poll();
    REQUIRE(*outcome == "waiting");

    WHEN("the signal fires")
    {
      signal->emit(boost::asio::cancellation_type::terminal);
      io_context->restart();
      io_context->poll();

      THEN("the wait ends with an error and the queue stays usable")
      {
        CHECK(*outcome == "cancelled");
        CHECK(queue.is_open());
        CHECK(queue.push(7));
        auto value = queue.try_pop();
        REQUIRE(value.has_value());
        CHECK(*value == 7);
      }
    }
  }
}

SCENARIO("async_queue preserves each producer's order under a burst", "[async_queue][concurrent]")
{
  GIVEN("Two producer threads pushing more than the buffer holds")
  {
    auto io_context = std::make_shared<boost::asio::io_context>();
    gift_relay::async::async_queue<gift_relay::core::events::presentation_event_variant_t> queue(io_context);
    constexpr auto per_producer = gift_relay::async::async_queue<int>::capacity;

    std::vector<std::thread> producers;
    for (const std::string relay : { "wss://a/", "wss://b/" }) {
      producers.emplace_back([&queue, relay]() {
        for (std::size_t index = 0; index < per_producer; ++index) {
          std::ignore = queue.push(gift_relay::core::events::delivery_status_changed{
            .rumor_id = std::to_string(index), .relay = relay, .status = gift_relay::core::events::delivery_status::sent });
        }
      });
    }
    for (auto &thread : producers) { thread.join(); }

    THEN("the consumer sees every update and each relay's updates in sequence")
    {
      std::map<std::string, std::size_t> next;
      bool ordered = true;
      std::size_t received = 0;
      while (auto event = queue.try_pop()) {
        const auto &update = std::get<gift_relay::core::events::delivery_status_changed>(*event);
        ordered = ordered and update.rumor_id == std::to_string(next[update.relay]);
        ++next[update.relay];
        ++received;
      }
      CHECK(ordered);
      CHECK(received == 2 * per_producer);
    }
  }
}

SCENARIO("async_queue refuses messages once closed", "[async_queue][close]")
{
  GIVEN("A queue of presentation events")
  {
    auto io_context = std::make_shared<boost::asio::io_context>();
    gift_relay::async::async_queue<gift_relay::core::events::presentation_event_variant_t> queue(io_context);

    REQUIRE(queue.push(gift_relay::core::events::history_loaded{ .subscription_id = "inbox" }));

    WHEN("the queue is closed")
    {
      queue.close();

      THEN("further pushes are dropped")
      {
        CHECK_FALSE(queue.is_open());
        CHECK_FALSE(queue.push(gift_relay::core::events::history_loaded{ .subscription_id = "late" }));
      }

      THEN("a waiting consumer is woken with an error")
      {
        auto failed = std::make_shared<bool>(false);
        boost::asio::co_spawn(
          *io_context,
          [](std::reference_wrapper<gift_relay::async::async_queue<gift_relay::core::events::presentation_event_variant_t>>
               queue_ref,
            std::shared_ptr<bool> failed_ptr) -> boost::asio::awaitable<void> {
            try {
              while (true) { co_await queue_ref.get().pop(); }
            } catch (const boost::system::system_error &) {
              *failed_ptr = true;
            }
          }(std::ref(queue), failed),
          boost::asio::detached);

        io_context->run();
        CHECK(*failed);
      }
    }
  }
}

SCENARIO("async_queue keeps event order", "[async_queue][order]")
{
  GIVEN("Two delivery updates pushed in order")
  {
    auto io_context = std::make_shared<boost::asio::io_context>();
    gift_relay::async::async_queue<gift_relay::core::events::presentation_event_variant_t> queue(io_context);

    using gift_relay::core::events::delivery_status;
    REQUIRE(queue.push(gift_relay::core::events::delivery_status_changed{
      .rumor_id = "r", .relay = "wss://a/", .status = delivery_status::pending }));
    REQUIRE(queue.push(gift_relay::core::events::delivery_status_changed{
      .rumor_id = "r", .relay = "wss://a/", .status = delivery_status::sent }));

    THEN("try_pop returns them in order and then nothing")
    {
      auto first = queue.try_pop();
      auto second = queue.try_pop();
      REQUIRE(first.has_value());
      REQUIRE(second.has_value());
      CHECK(std::get<gift_relay::core::events::delivery_status_changed>(*first).status == delivery_status::pending);
      CHECK(std::get<gift_relay::core::events::delivery_status_changed>(*second).status == delivery_status::sent);
      CHECK_FALSE(queue.try_pop().has_value());
      CHECK(queue.empty());
    }
  }
}
