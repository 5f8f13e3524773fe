#pragma once

#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <cstddef>
#include <memory>
#include <optional>

namespace gift_relay::async {

/**
 * @brief Mailbox for a single-consumer actor loop.
 *
 * @tparam T Message type, usually a std::variant of events
 *
 * Producers may push from any thread; one coroutine pops. Backed by a Boost.Asio
 * concurrent channel so pops suspend instead of blocking the io_context.
 */
template<typename T> class async_queue
{
public:
  /// Messages held in the channel buffer; later pushes wait as pending sends
  static constexpr std::size_t capacity{ 4096 };

  explicit async_queue(const std::shared_ptr<boost::asio::io_context> &io_context)
    : io_context_(io_context), channel_(*io_context_, capacity)
  {}

  async_queue(const async_queue &) = delete;
  auto operator=(const async_queue &) -> async_queue & = delete;
  async_queue(async_queue &&) = delete;
  auto operator=(async_queue &&) -> async_queue & = delete;
  ~async_queue() = default;

  /**
   * @brief Enqueues a message without blocking.
   *
   * Once the buffer holds @ref capacity messages, further messages are parked as
   * pending sends and reach the consumer in push order.
   *
   * @param value Message to enqueue
   * @return false if the queue is closed and the message was dropped
   */
  auto push(T value) -> bool
  {
    if (not channel_.is_open()) { return false; }
    ++size_;
    channel_.async_send(boost::system::error_code{}, std::move(value), [](const boost::system::error_code & /*ec*/) {});
    return true;
  }

  /**
   * @brief Waits for the next message.
   *
   * @param cancel_slot Optional slot used to abort the wait
   * @return Awaitable yielding the next message
   * @throws boost::system::system_error when cancelled or closed
   */
  auto pop(std::shared_ptr<boost::asio::cancellation_slot> cancel_slot = nullptr) -> boost::asio::awaitable<T>
  {
    boost::system::error_code err;
    auto token = boost::asio::redirect_error(boost::asio::use_awaitable, err);

    std::optional<T> val;
    if (cancel_slot) {
      val.emplace(co_await channel_.async_receive(boost::asio::bind_cancellation_slot(*cancel_slot, token)));
    } else {
      val.emplace(co_await channel_.async_receive(token));
    }
    if (err) { throw boost::system::system_error(err); }

    --size_;
    co_return std::move(*val);
  }

  /**
   * @brief Takes a message if one is ready.
   *
   * @return The message, or std::nullopt when empty
   */
  auto try_pop() -> std::optional<T>
  {
    std::optional<T> value;
    const bool received = channel_.try_receive(
      [&value](boost::system::error_code /*ec*/, T rx_value) { value.emplace(std::move(rx_value)); });

    if (received) { --size_; }
    return value;
  }

  [[nodiscard]] auto empty() const -> bool { return size_.load() == 0; }

  [[nodiscard]] auto size() const -> std::size_t { return size_.load(); }

  [[nodiscard]] auto is_open() const -> bool { return channel_.is_open(); }

  /// Stops accepting messages and wakes the consumer with channel_closed.
  auto close() -> void { channel_.close(); }

private:
  std::shared_ptr<boost::asio::io_context> io_context_;
  boost::asio::experimental::concurrent_channel<void(boost::system::error_code, T)> channel_;
  std::atomic<std::size_t> size_{ 0 };
};

}// namespace gift_relay::async
