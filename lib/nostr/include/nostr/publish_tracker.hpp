#pragma once

#include <async/async_queue.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <concepts/relay_pool.hpp>
#include <core/events.hpp>
#include <nostr/protocol.hpp>
#include <nostr/send_tracking.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>
#include <vector>

namespace gift_relay::nostr {

/**
 * @brief Publishes gift wraps and tracks per-relay delivery with a timeout.
 *
 * Each relay of a send is one operation racing a timer: the relay accepting every
 * wrap destined for it makes it sent, any rejection makes it failed, and the timer
 * firing first makes it timeout. Outcomes are processed on a strand and reported as
 * delivery_status_changed events.
 *
 * @tparam Pool Relay pool satisfying concepts::relay_pool
 */
template<concepts::relay_pool Pool>
class publish_tracker : public std::enable_shared_from_this<publish_tracker<Pool>>
{
public:
  using delivery_status = core::events::delivery_status;
  using presentation_queue_t = async::async_queue<core::events::presentation_event_variant_t>;

  /**
   * @brief Constructs a publish tracker.
   *
   * @param io_context Context running timers and result handlers
   * @param pool Relay pool to publish through
   * @param timeout Per-relay deadline
   * @param presentation_out Optional queue receiving status changes
   */
  publish_tracker(const std::shared_ptr<boost::asio::io_context> &io_context,
    std::shared_ptr<Pool> pool,
    std::chrono::milliseconds timeout,
    std::shared_ptr<presentation_queue_t> presentation_out = nullptr)
    : io_context_(io_context), strand_(boost::asio::make_strand(*io_context)), pool_(std::move(pool)),
      timeout_(timeout), presentation_out_(std::move(presentation_out))
  {}

  /**
   * @brief Publishes every wrap to its relays.
   *
   * Returns at once with every relay pending. A relay shared by several wraps is
   * tracked once.
   *
   * @param rumor_id Id of the rumor the wraps carry
   * @param wraps Signed wraps and their relay sets
   * @return Record observed for delivery outcomes and passed to retry()
   */
  auto send(std::string rumor_id, std::vector<wrap_destination> wraps) -> std::shared_ptr<send_tracking>
  {
    auto record = std::make_shared<send_tracking>(std::move(rumor_id), std::move(wraps));

    spdlog::debug("[publish_tracker] Sending {} to {} relays", record->rumor_id(), record->relays().size());
    for (const auto &relay : record->relays()) { emit(*record, relay, delivery_status::pending); }

    start(record, record->relays());
    return record;
  }

  /**
   * @brief Republishes the original wraps to relays that failed or timed out.
   *
   * Relays that are sent or still pending are left alone, as are relays that are
   * not part of the record.
   *
   * @param record Record returned by send()
   * @param subset Restrict the retry to these relays
   * @return Relays being retried
   */
  auto retry(const std::shared_ptr<send_tracking> &record,
    const std::optional<std::vector<std::string>> &subset = std::nullopt) -> std::vector<std::string>
  {
    std::vector<std::string> retried;
    for (const auto &[relay, status] : record->statuses()) {
      if (status != delivery_status::failed and status != delivery_status::timeout) { continue; }
      if (subset and std::ranges::find(*subset, relay) == subset->end()) { continue; }
      if (record->update(relay, delivery_status::pending)) {
        emit(*record, relay, delivery_status::pending);
        retried.push_back(relay);
      }
    }

    if (retried.empty()) { return retried; }

    spdlog::info("[publish_tracker] Retrying {} on {} relays", record->rumor_id(), retried.size());
    start(record, retried);
    return retried;
  }

  /**
   * @brief Stops every in-flight race and settles its relay as timeout.
   *
   * The records stay valid and can be passed to retry() later.
   */
  auto cancel_all_pending() -> void
  {
    boost::asio::dispatch(strand_, [self = this->shared_from_this()]() {
      while (not self->operations_.empty()) { self->settle(self->operations_.begin(), delivery_status::timeout); }
    });
  }

private:
  using operation_key = std::pair<std::string, std::string>;///< (rumor id, relay)

  struct operation
  {
    std::shared_ptr<send_tracking> record;
    std::uint64_t attempt{};
    std::set<std::string> awaiting;///< Wrap ids the relay has not accepted yet
    std::shared_ptr<boost::asio::steady_timer> timer;
  };

  auto start(const std::shared_ptr<send_tracking> &record, std::vector<std::string> relays) -> void
  {
    boost::asio::dispatch(strand_, [self = this->shared_from_this(), record, relays = std::move(relays)]() {
      self->start_on_strand(record, relays);
    });
  }

  auto start_on_strand(const std::shared_ptr<send_tracking> &record, const std::vector<std::string> &relays) -> void
  {
    std::map<std::string, std::uint64_t> attempts;

    for (const auto &relay : relays) {
      operation op{ .record = record, .attempt = ++next_attempt_, .awaiting = {}, .timer = nullptr };
      for (const auto &destination : record->wraps()) {
        if (std::ranges::find(destination.relays, relay) != destination.relays.end()) {
          op.awaiting.insert(destination.event.id);
        }
      }

      op.timer = std::make_shared<boost::asio::steady_timer>(strand_, timeout_);
      op.timer->async_wait([self = this->shared_from_this(), key = operation_key{ record->rumor_id(), relay },
                             attempt = op.attempt](const boost::system::error_code &error) {
        if (not error) { self->handle_timeout(key, attempt); }
      });

      attempts[relay] = op.attempt;
      auto key = operation_key{ record->rumor_id(), relay };
      if (auto existing = operations_.find(key); existing != operations_.end()) { existing->second.timer->cancel(); }
      operations_.insert_or_assign(std::move(key), std::move(op));
    }

    for (const auto &destination : record->wraps()) {
      std::vector<std::string> targets;
      std::ranges::copy_if(destination.relays, std::back_inserter(targets), [&relays](const std::string &relay) {
        return std::ranges::find(relays, relay) != relays.end();
      });
      if (targets.empty()) { continue; }

      pool_->publish(targets,
        destination.event,
        [self = this->shared_from_this(), rumor_id = record->rumor_id(), event_id = destination.event.id, attempts](
          const std::string &relay, const protocol::ok &result) {
          auto attempt = attempts.find(relay);
          if (attempt == attempts.end()) { return; }
          boost::asio::post(
            self->strand_, [self, key = operation_key{ rumor_id, relay }, number = attempt->second, event_id, result]() {
              self->handle_result(key, number, event_id, result);
            });
        });
    }
  }

  auto handle_result(const operation_key &key,
    std::uint64_t attempt,
    const std::string &event_id,
    const protocol::ok &result) -> void
  {
    auto found = operations_.find(key);
    if (found == operations_.end() or found->second.attempt != attempt) {
      spdlog::debug("[publish_tracker] Ignoring late result from {} for {}", key.second, key.first);
      return;
    }

    if (not result.accepted) {
      spdlog::warn("[publish_tracker] {} rejected {}: {}", key.second, event_id, result.message);
      settle(found, delivery_status::failed);
      return;
    }

    found->second.awaiting.erase(event_id);
    if (found->second.awaiting.empty()) { settle(found, delivery_status::sent); }
  }

  auto handle_timeout(const operation_key &key, std::uint64_t attempt) -> void
  {
    auto found = operations_.find(key);
    if (found == operations_.end() or found->second.attempt != attempt) { return; }

    spdlog::warn("[publish_tracker] {} timed out for {}", key.second, key.first);
    settle(found, delivery_status::timeout);
  }

  auto settle(typename std::map<operation_key, operation>::iterator found, delivery_status status) -> void
  {
    found->second.timer->cancel();
    const auto record = found->second.record;
    const auto relay = found->first.second;
    operations_.erase(found);

    if (record->update(relay, status)) { emit(*record, relay, status); }
  }

  auto emit(const send_tracking &record, const std::string &relay, delivery_status status) -> void
  {
    if (presentation_out_
        and not presentation_out_->push(
          core::events::delivery_status_changed{ .rumor_id = record.rumor_id(), .relay = relay, .status = status })) {
      spdlog::warn("[publish_tracker] Dropped status update for {} on {}", record.rumor_id(), relay);
    }
  }

  std::shared_ptr<boost::asio::io_context> io_context_;
  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  std::shared_ptr<Pool> pool_;
  std::chrono::milliseconds timeout_;
  std::shared_ptr<presentation_queue_t> presentation_out_;

  // Strand only
  std::map<operation_key, operation> operations_;
  std::uint64_t next_attempt_{ 0 };
};

}// namespace gift_relay::nostr
