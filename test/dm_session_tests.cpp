#include "test_doubles/test_double_relay_pool.hpp"
#include "test_doubles/test_io_helpers.hpp"

#include <async/async_queue.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <catch2/catch_test_macros.hpp>
#include <core/events.hpp>
#include <crypto/crypto_error.hpp>
#include <fmt/format.h>
#include <nostr/dm_session.hpp>
#include <nostr/gift_wrap.hpp>
#include <nostr/signer.hpp>
#include <storage/kv_store.hpp>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

namespace {

using session_t = gift_relay::nostr::dm_session<gift_relay_test::test_double_relay_pool>;
using presentation_queue_t = gift_relay::async::async_queue<gift_relay::core::events::presentation_event_variant_t>;

const std::string default_relay = "wss://default.example/";

auto test_config() -> gift_relay::nostr::dm_config
{
  return { .default_relays = { default_relay },
    .fallback_relay = default_relay,
    .send_timeout = std::chrono::seconds(10) };
}

/// One user's running session with its own store and presentation queue
struct participant
{
  participant(const std::shared_ptr<boost::asio::io_context> &io,
    const std::shared_ptr<gift_relay_test::test_double_relay_pool> &pool,
    gift_relay::nostr::signing_backend backend,
    std::shared_ptr<gift_relay::storage::kv_store> store =
      std::make_shared<gift_relay::storage::kv_store>(":memory:"))
    : io_context(io), kv(std::move(store)), presentation(std::make_shared<presentation_queue_t>(io)),
      session(std::make_shared<session_t>(test_config(), std::move(backend), pool, kv, io, presentation))
  {
    gift_relay_test::complete(*io_context, session->start());

    boost::asio::co_spawn(
      *io_context,
      [](std::shared_ptr<session_t> running,
        std::shared_ptr<boost::asio::cancellation_slot> slot) -> boost::asio::awaitable<void> {
        co_await running->run(slot);
      }(session, cancel_slot),
      boost::asio::detached);
    gift_relay_test::drain(*io_context);
  }

  participant(const participant &) = delete;
  auto operator=(const participant &) -> participant & = delete;
  participant(participant &&) = delete;
  auto operator=(participant &&) -> participant & = delete;

  ~participant()
  {
    cancel_signal->emit(boost::asio::cancellation_type::terminal);
    gift_relay_test::drain(*io_context);
  }

  [[nodiscard]] auto pubkey() const -> const std::string & { return session->my_pubkey(); }

  [[nodiscard]] auto events() -> std::vector<gift_relay::core::events::presentation_event_variant_t>
  {
    std::vector<gift_relay::core::events::presentation_event_variant_t> drained;
    while (auto event = presentation->try_pop()) { drained.push_back(std::move(*event)); }
    return drained;
  }

  std::shared_ptr<boost::asio::io_context> io_context;
  std::shared_ptr<gift_relay::storage::kv_store> kv;
  std::shared_ptr<presentation_queue_t> presentation;
  std::shared_ptr<boost::asio::cancellation_signal> cancel_signal = std::make_shared<boost::asio::cancellation_signal>();
  std::shared_ptr<boost::asio::cancellation_slot> cancel_slot =
    std::make_shared<boost::asio::cancellation_slot>(cancel_signal->slot());
  std::shared_ptr<session_t> session;
};

template<typename Event>
auto count_of(const std::vector<gift_relay::core::events::presentation_event_variant_t> &events) -> std::size_t
{
  return static_cast<std::size_t>(
    std::ranges::count_if(events, [](const auto &event) { return std::holds_alternative<Event>(event); }));
}

auto counting_delegate(const gift_relay::nostr::local_signer &inner, const std::shared_ptr<int> &decrypt_calls)
  -> gift_relay::nostr::delegated_signer
{
  return gift_relay::nostr::delegated_signer(
    inner.get_public_key(),
    [inner](const auto &event_template) { return inner.sign_event(event_template); },
    [inner](const std::string &pubkey, const std::string &text) { return inner.nip44_encrypt(pubkey, text); },
    [inner, decrypt_calls](const std::string &pubkey, const std::string &text) {
      ++*decrypt_calls;
      return inner.nip44_decrypt(pubkey, text);
    });
}

}// namespace

SCENARIO("alice sends bob a private message", "[nostr][dm_session]")
{
  GIVEN("alice and bob without inbox relay lists")
  {
    auto io_context = std::make_shared<boost::asio::io_context>();
    auto pool = std::make_shared<gift_relay_test::test_double_relay_pool>();
    const auto alice_key = gift_relay::nostr::local_signer::generate();
    const auto bob_key = gift_relay::nostr::local_signer::generate();
    participant alice(io_context, pool, alice_key);
    participant bob(io_context, pool, bob_key);
    const auto conversation_id = gift_relay::nostr::get_conversation_id(alice.pubkey(), { bob.pubkey() });

    THEN("both subscribe to wraps addressed to them on the default relay")
    {
      REQUIRE(pool->subscriptions.size() == 2);
      const auto &sub = pool->subscriptions.at(bob.session->subscription_id());
      CHECK(sub.relays == std::vector<std::string>{ default_relay });
      CHECK(sub.filter["kinds"][0] == 1059);
      CHECK(sub.filter["#p"][0] == bob.pubkey());
    }

    WHEN("alice sends \"hi\"")
    {
      const auto record = gift_relay_test::complete(*io_context, alice.session->send_message(bob.pubkey(), "hi"));
      gift_relay_test::drain(*io_context);

      THEN("two wraps are published to the default relay")
      {
        REQUIRE(pool->published.size() == 2);
        for (const auto &call : pool->published) {
          CHECK(call.relays == std::vector<std::string>{ default_relay });
          CHECK(call.event.kind == gift_relay::nostr::protocol::kind::gift_wrap);
        }
        CHECK(record->relays() == std::vector<std::string>{ default_relay });
        CHECK(record->status(default_relay) == gift_relay::core::events::delivery_status::pending);
      }

      THEN("one wrap opens for bob and the other for alice, both carrying the same rumor")
      {
        REQUIRE(pool->published.size() == 2);
        const auto for_bob = gift_relay::nostr::unwrap(pool->published[0].event, bob_key);
        const auto for_alice = gift_relay::nostr::unwrap(pool->published[1].event, alice_key);
        REQUIRE(for_bob.has_value());
        REQUIRE(for_alice.has_value());
        CHECK(for_bob->content == "hi");
        CHECK(for_bob->kind == gift_relay::nostr::protocol::kind::chat_message);
        CHECK(for_bob->pubkey == alice.pubkey());
        CHECK(*for_bob == *for_alice);
        CHECK(for_bob->id == record->rumor_id());
      }

      THEN("alice sees her message at once without an unread count")
      {
        const auto *conv = alice.session->conversations().find(conversation_id);
        REQUIRE(conv != nullptr);
        REQUIRE(conv->messages.size() == 1);
        CHECK(conv->messages[0].content == "hi");
        CHECK(conv->messages[0].wrap_id == "local_" + record->rumor_id());
        CHECK(conv->unread_count == 0);

        const auto events = alice.events();
        REQUIRE(count_of<gift_relay::core::events::message_added>(events) == 1);
        CHECK(count_of<gift_relay::core::events::unread_count_changed>(events) == 0);
      }

      AND_WHEN("the relay accepts both wraps")
      {
        pool->acknowledge_all(true);
        gift_relay_test::drain(*io_context);

        THEN("the message is sent") { CHECK(record->status(default_relay) == gift_relay::core::events::delivery_status::sent); }
      }

      AND_WHEN("the relay delivers both wraps to the subscriptions")
      {
        pool->deliver(pool->published[0].event);
        pool->deliver(pool->published[1].event);
        gift_relay_test::drain(*io_context);

        THEN("bob has one unread message from alice")
        {
          const auto *conv = bob.session->conversations().find(conversation_id);
          REQUIRE(conv != nullptr);
          REQUIRE(conv->messages.size() == 1);
          CHECK(conv->messages[0].pubkey == alice.pubkey());
          CHECK(conv->messages[0].wrap_id == pool->published[0].event.id);
          CHECK(conv->unread_count == 1);

          const auto events = bob.events();
          CHECK(count_of<gift_relay::core::events::message_added>(events) == 1);
          CHECK(count_of<gift_relay::core::events::unread_count_changed>(events) == 1);
        }

        THEN("alice's own copy does not duplicate the echo")
        {
          CHECK(alice.session->conversations().find(conversation_id)->messages.size() == 1);
        }

        AND_WHEN("bob marks the conversation read")
        {
          std::ignore = bob.events();
          bob.session->mark_as_read(conversation_id);
          gift_relay_test::drain(*io_context);

          THEN("the counter drops to zero and is reported")
          {
            CHECK(bob.session->conversations().find(conversation_id)->unread_count == 0);
            const auto events = bob.events();
            REQUIRE(events.size() == 1);
            const auto &changed = std::get<gift_relay::core::events::unread_count_changed>(events.front());
            CHECK(changed.unread == 0);
            CHECK(changed.total == 0);
          }
        }

        AND_WHEN("bob reacts to the message")
        {
          const auto message_id = record->rumor_id();
          const auto reaction_record =
            gift_relay_test::complete(*io_context, bob.session->send_reaction(alice.pubkey(), "👍", message_id));
          gift_relay_test::drain(*io_context);
          pool->deliver(pool->published[2].event);
          gift_relay_test::drain(*io_context);

          THEN("alice sees the reaction on her message")
          {
            const auto *conv = alice.session->conversations().find(conversation_id);
            REQUIRE(conv != nullptr);
            REQUIRE(conv->reactions.contains(message_id));
            CHECK(conv->reactions.at(message_id).front().emoji == "👍");
            CHECK(conv->reactions.at(message_id).front().pubkey == bob.pubkey());
            CHECK(conv->messages.size() == 1);
            CHECK(count_of<gift_relay::core::events::reaction_added>(alice.events()) == 1);
            CHECK(reaction_record->rumor_id() != message_id);
          }
        }
      }
    }
  }
}

TEST_CASE("the same wrap delivered twice is folded once", "[nostr][dm_session]")
{
  auto io_context = std::make_shared<boost::asio::io_context>();
  auto pool = std::make_shared<gift_relay_test::test_double_relay_pool>();
  const auto alice_key = gift_relay::nostr::local_signer::generate();
  participant bob(io_context, pool, gift_relay::nostr::local_signer::generate());

  const auto message = gift_relay::nostr::make_rumor(alice_key.get_public_key(), bob.pubkey(), "once");
  const auto wrapped = gift_relay::nostr::wrap(message, bob.pubkey(), alice_key);

  pool->deliver(wrapped);
  pool->deliver(wrapped);
  gift_relay_test::drain(*io_context);

  const auto conversation_id = gift_relay::nostr::get_conversation_id(message);
  REQUIRE(bob.session->conversations().find(conversation_id) != nullptr);
  CHECK(bob.session->conversations().find(conversation_id)->messages.size() == 1);
  CHECK(bob.session->conversations().unread_total() == 1);
  CHECK(count_of<gift_relay::core::events::message_added>(bob.events()) == 1);
}

TEST_CASE("a history burst larger than the mailbox buffer is folded completely", "[nostr][dm_session]")
{
  auto io_context = std::make_shared<boost::asio::io_context>();
  auto pool = std::make_shared<gift_relay_test::test_double_relay_pool>();
  const auto alice_key = gift_relay::nostr::local_signer::generate();
  participant bob(io_context, pool, gift_relay::nostr::local_signer::generate());

  constexpr std::size_t burst = gift_relay::async::async_queue<int>::capacity + 8;
  for (std::size_t index = 0; index < burst; ++index) {
    pool->deliver(gift_relay::nostr::protocol::event_data{ .id = fmt::format("noise-{}", index),
      .pubkey = alice_key.get_public_key(),
      .created_at = 1,
      .kind = gift_relay::nostr::protocol::kind::gift_wrap,
      .tags = { { "p", bob.pubkey() } },
      .content = "not a payload",
      .sig = "" });
  }

  const auto first = gift_relay::nostr::make_rumor(alice_key.get_public_key(), bob.pubkey(), "after the burst");
  const auto second = gift_relay::nostr::make_rumor(alice_key.get_public_key(), bob.pubkey(), "and one more");
  pool->deliver(gift_relay::nostr::wrap(first, bob.pubkey(), alice_key));
  pool->deliver(gift_relay::nostr::wrap(second, bob.pubkey(), alice_key));
  pool->end_of_stored_events();
  gift_relay_test::drain(*io_context);

  const auto *conv = bob.session->conversations().find(gift_relay::nostr::get_conversation_id(first));
  REQUIRE(conv != nullptr);
  CHECK(conv->messages.size() == 2);

  const auto events = bob.events();
  CHECK(count_of<gift_relay::core::events::message_added>(events) == 2);
  CHECK(count_of<gift_relay::core::events::history_loaded>(events) == 1);
}

TEST_CASE("undecryptable wraps are dropped", "[nostr][dm_session]")
{
  auto io_context = std::make_shared<boost::asio::io_context>();
  auto pool = std::make_shared<gift_relay_test::test_double_relay_pool>();
  const auto alice_key = gift_relay::nostr::local_signer::generate();
  const auto carol_key = gift_relay::nostr::local_signer::generate();
  participant bob(io_context, pool, gift_relay::nostr::local_signer::generate());

  pool->deliver(gift_relay::nostr::wrap(gift_relay::nostr::make_rumor(alice_key.get_public_key(),
                                          carol_key.get_public_key(), "not for bob"),
    carol_key.get_public_key(),
    alice_key));
  gift_relay_test::drain(*io_context);

  CHECK(bob.session->conversations().conversations().empty());
  CHECK(bob.events().empty());
}

TEST_CASE("decrypted wraps are cached across sessions", "[nostr][dm_session]")
{
  auto io_context = std::make_shared<boost::asio::io_context>();
  auto pool = std::make_shared<gift_relay_test::test_double_relay_pool>();
  auto store = std::make_shared<gift_relay::storage::kv_store>(":memory:");
  const auto alice_key = gift_relay::nostr::local_signer::generate();
  const auto bob_key = gift_relay::nostr::local_signer::generate();
  auto decrypt_calls = std::make_shared<int>(0);

  const auto message = gift_relay::nostr::make_rumor(alice_key.get_public_key(), bob_key.get_public_key(), "cached");
  const auto wrapped = gift_relay::nostr::wrap(message, bob_key.get_public_key(), alice_key);

  {
    participant bob(io_context, pool, counting_delegate(bob_key, decrypt_calls), store);
    pool->deliver(wrapped);
    gift_relay_test::drain(*io_context);
    REQUIRE(bob.session->conversations().has_seen(message.id));
    bob.session->stop();
    gift_relay_test::drain(*io_context);
    CHECK(bob.session->conversations().conversations().empty());
  }
  const auto calls_after_first_session = *decrypt_calls;
  CHECK(calls_after_first_session == 2);

  participant bob(io_context, pool, counting_delegate(bob_key, decrypt_calls), store);
  pool->deliver(wrapped);
  gift_relay_test::drain(*io_context);

  CHECK(*decrypt_calls == calls_after_first_session);
  REQUIRE(bob.session->conversations().has_seen(message.id));
  CHECK(bob.session->conversations().find(gift_relay::nostr::get_conversation_id(message))->messages.front().content
        == "cached");
}

TEST_CASE("stop unsubscribes and clears conversations", "[nostr][dm_session]")
{
  auto io_context = std::make_shared<boost::asio::io_context>();
  auto pool = std::make_shared<gift_relay_test::test_double_relay_pool>();
  participant alice(io_context, pool, gift_relay::nostr::local_signer::generate());
  const auto bob_pubkey = gift_relay::nostr::local_signer::generate().get_public_key();

  std::ignore = gift_relay_test::complete(*io_context, alice.session->send_message(bob_pubkey, "before stop"));
  gift_relay_test::drain(*io_context);
  REQUIRE_FALSE(alice.session->conversations().conversations().empty());

  const auto subscription_id = alice.session->subscription_id();
  alice.session->stop();
  gift_relay_test::drain(*io_context);

  CHECK(pool->unsubscribed == std::vector<std::string>{ subscription_id });
  CHECK(pool->subscriptions.empty());
  CHECK(alice.session->subscription_id().empty());
  CHECK(alice.session->conversations().conversations().empty());
}

TEST_CASE("mark_all_as_read zeroes every conversation", "[nostr][dm_session]")
{
  auto io_context = std::make_shared<boost::asio::io_context>();
  auto pool = std::make_shared<gift_relay_test::test_double_relay_pool>();
  participant bob(io_context, pool, gift_relay::nostr::local_signer::generate());

  for (const auto *text : { "one", "two" }) {
    const auto sender = gift_relay::nostr::local_signer::generate();
    pool->deliver(gift_relay::nostr::wrap(
      gift_relay::nostr::make_rumor(sender.get_public_key(), bob.pubkey(), text), bob.pubkey(), sender));
  }
  gift_relay_test::drain(*io_context);
  REQUIRE(bob.session->conversations().unread_total() == 2);
  std::ignore = bob.events();

  bob.session->mark_all_as_read();
  gift_relay_test::drain(*io_context);

  CHECK(bob.session->conversations().unread_total() == 0);
  CHECK(count_of<gift_relay::core::events::unread_count_changed>(bob.events()) == 2);
}

TEST_CASE("sending requires a NIP-44 capable signer and a valid recipient", "[nostr][dm_session]")
{
  auto io_context = std::make_shared<boost::asio::io_context>();
  auto pool = std::make_shared<gift_relay_test::test_double_relay_pool>();
  auto store = std::make_shared<gift_relay::storage::kv_store>(":memory:");
  const auto alice_key = gift_relay::nostr::local_signer::generate();

  SECTION("a signer without encryption cannot start")
  {
    const gift_relay::nostr::delegated_signer sign_only(
      alice_key.get_public_key(), [alice_key](const auto &event_template) { return alice_key.sign_event(event_template); });
    auto session = std::make_shared<session_t>(test_config(), sign_only, pool, store, io_context);

    CHECK_THROWS_AS(gift_relay_test::complete(*io_context, session->start()), gift_relay::nostr::capability_error);
    CHECK_THROWS_AS(gift_relay_test::complete(*io_context, session->send_message(std::string(64, 'a'), "hi")),
      gift_relay::nostr::capability_error);
    CHECK(pool->subscriptions.empty());
  }

  SECTION("a malformed recipient is rejected before anything is published")
  {
    auto session = std::make_shared<session_t>(test_config(), alice_key, pool, store, io_context);

    CHECK_THROWS_AS(gift_relay_test::complete(*io_context, session->send_message("not-a-pubkey", "hi")),
      gift_relay::crypto::crypto_error);
    CHECK(pool->published.empty());
  }
}

TEST_CASE("publishing an inbox relay list routes later sends to it", "[nostr][dm_session]")
{
  auto io_context = std::make_shared<boost::asio::io_context>();
  auto pool = std::make_shared<gift_relay_test::test_double_relay_pool>();
  participant alice(io_context, pool, gift_relay::nostr::local_signer::generate());

  const auto list = alice.session->publish_inbox_relays({ "wss://alice-inbox.example/" });

  CHECK(list.kind == gift_relay::nostr::protocol::kind::inbox_relays);
  CHECK(list.verify());
  REQUIRE(pool->published.size() == 1);
  CHECK(pool->published[0].relays == std::vector<std::string>{ default_relay });
  CHECK(alice.kv->get(gift_relay::nostr::dm_cache::relays_namespace, alice.pubkey()).has_value());

  const auto bob_pubkey = gift_relay::nostr::local_signer::generate().get_public_key();
  const auto record = gift_relay_test::complete(*io_context, alice.session->send_message(bob_pubkey, "hello"));
  gift_relay_test::drain(*io_context);

  REQUIRE(pool->published.size() == 3);
  CHECK(pool->published[2].relays == std::vector<std::string>{ "wss://alice-inbox.example/", default_relay });
  CHECK(record->relays() == std::vector<std::string>{ default_relay, "wss://alice-inbox.example/" });
}

TEST_CASE("merge_relays keeps first-seen order without duplicates", "[nostr][dm_session]")
{
  CHECK(gift_relay::nostr::merge_relays({ "a", "b", "a" }, { "c", "b" }) == std::vector<std::string>{ "a", "b", "c" });
  CHECK(gift_relay::nostr::merge_relays({}, { "c" }) == std::vector<std::string>{ "c" });
}
