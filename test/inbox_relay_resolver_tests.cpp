#include "test_doubles/test_double_relay_pool.hpp"
#include "test_doubles/test_io_helpers.hpp"

#include <boost/asio/io_context.hpp>
#include <catch2/catch_test_macros.hpp>
#include <nostr/dm_cache.hpp>
#include <nostr/dm_config.hpp>
#include <nostr/inbox_relay_resolver.hpp>
#include <nostr/signer.hpp>
#include <storage/kv_store.hpp>

#include <memory>
#include <string>
#include <tuple>
#include <vector>

namespace {

using resolver_t = gift_relay::nostr::inbox_relay_resolver<gift_relay_test::test_double_relay_pool>;

auto relay_list(const gift_relay::nostr::local_signer &author,
  const std::vector<std::string> &relays,
  std::uint64_t created_at) -> gift_relay::nostr::protocol::event_data
{
  gift_relay::nostr::protocol::tag_list tags;
  for (const auto &relay : relays) { tags.push_back({ "relay", relay }); }
  return author.sign_event(
    { .created_at = created_at, .kind = gift_relay::nostr::protocol::kind::inbox_relays, .tags = tags, .content = "" });
}

struct resolver_fixture
{
  auto resolve(const std::string &pubkey, bool persist = false) -> std::vector<std::string>
  {
    return gift_relay_test::complete(*io_context, resolver->resolve(pubkey, persist));
  }

  std::shared_ptr<boost::asio::io_context> io_context = std::make_shared<boost::asio::io_context>();
  std::shared_ptr<gift_relay_test::test_double_relay_pool> pool =
    std::make_shared<gift_relay_test::test_double_relay_pool>();
  std::shared_ptr<gift_relay::storage::kv_store> kv = std::make_shared<gift_relay::storage::kv_store>(":memory:");
  std::shared_ptr<gift_relay::nostr::dm_cache> cache = std::make_shared<gift_relay::nostr::dm_cache>(kv);
  gift_relay::nostr::dm_config config{ .default_relays = { "wss://default.example/" },
    .fallback_relay = "wss://fallback.example/",
    .send_timeout = std::chrono::seconds(10) };
  std::shared_ptr<resolver_t> resolver = std::make_shared<resolver_t>(io_context, pool, cache, config);
  gift_relay::nostr::local_signer bob = gift_relay::nostr::local_signer::generate();
};

}// namespace

SCENARIO("a published relay list is fetched once and then served from memory", "[nostr][inbox_relay_resolver]")
{
  GIVEN("bob has published an inbox relay list")
  {
    resolver_fixture fixture;
    fixture.pool->fetch_results.insert_or_assign(
      fixture.bob.get_public_key(), relay_list(fixture.bob, { "wss://bob-1.example/", "wss://bob-2.example/" }, 100));

    WHEN("his relays are resolved twice")
    {
      const auto first = fixture.resolve(fixture.bob.get_public_key());
      const auto second = fixture.resolve(fixture.bob.get_public_key());

      THEN("the list is returned and the network is asked only once")
      {
        CHECK(first == std::vector<std::string>{ "wss://bob-1.example/", "wss://bob-2.example/" });
        CHECK(second == first);
        CHECK(fixture.pool->fetch_count == 1);
      }

      THEN("nothing is persisted for a remote user")
      {
        CHECK_FALSE(fixture.cache->get_relay_list(fixture.bob.get_public_key()).has_value());
      }
    }
  }
}

TEST_CASE("a pubkey without a relay list resolves to the cached fallback", "[nostr][inbox_relay_resolver]")
{
  resolver_fixture fixture;

  CHECK(fixture.resolve(fixture.bob.get_public_key()) == std::vector<std::string>{ "wss://fallback.example/" });
  CHECK(fixture.resolve(fixture.bob.get_public_key()) == std::vector<std::string>{ "wss://fallback.example/" });
  CHECK(fixture.pool->fetch_count == 1);

  const auto entry = fixture.resolver->cached(fixture.bob.get_public_key());
  REQUIRE(entry.has_value());
  CHECK(entry->created_at == 0);
}

TEST_CASE("lookup failures fall back instead of throwing", "[nostr][inbox_relay_resolver]")
{
  resolver_fixture fixture;
  fixture.pool->fetch_fails = true;

  CHECK(fixture.resolve(fixture.bob.get_public_key()) == std::vector<std::string>{ "wss://fallback.example/" });
}

TEST_CASE("relay lists that fail verification are rejected", "[nostr][inbox_relay_resolver]")
{
  resolver_fixture fixture;

  SECTION("altered after signing")
  {
    auto forged = relay_list(fixture.bob, { "wss://bob.example/" }, 100);
    forged.tags[0][1] = "wss://evil.example/";
    fixture.pool->fetch_results.insert_or_assign(fixture.bob.get_public_key(), forged);
  }

  SECTION("signed by someone else")
  {
    const auto mallory = gift_relay::nostr::local_signer::generate();
    fixture.pool->fetch_results.insert_or_assign(
      fixture.bob.get_public_key(), relay_list(mallory, { "wss://evil.example/" }, 100));
  }

  SECTION("without relay tags")
  {
    fixture.pool->fetch_results.insert_or_assign(fixture.bob.get_public_key(), relay_list(fixture.bob, {}, 100));
  }

  CHECK(fixture.resolve(fixture.bob.get_public_key()) == std::vector<std::string>{ "wss://fallback.example/" });
}

SCENARIO("the local user's persisted list is served stale and revalidated", "[nostr][inbox_relay_resolver]")
{
  GIVEN("a persisted list from t=100")
  {
    resolver_fixture fixture;
    const auto me = fixture.bob.get_public_key();
    fixture.cache->put_relay_list(me, { .relays = { "wss://stale.example/" }, .created_at = 100 });

    WHEN("the network has a newer list")
    {
      fixture.pool->fetch_results.insert_or_assign(me, relay_list(fixture.bob, { "wss://fresh.example/" }, 200));

      const auto first = fixture.resolve(me, true);
      gift_relay_test::drain(*fixture.io_context);

      THEN("the stale list is returned first and then replaced")
      {
        CHECK(first == std::vector<std::string>{ "wss://stale.example/" });
        CHECK(fixture.pool->fetch_count == 1);
        CHECK(fixture.resolve(me, true) == std::vector<std::string>{ "wss://fresh.example/" });

        const auto stored = fixture.cache->get_relay_list(me);
        REQUIRE(stored.has_value());
        CHECK(stored->created_at == 200);
      }
    }

    WHEN("the network has an older list")
    {
      fixture.pool->fetch_results.insert_or_assign(me, relay_list(fixture.bob, { "wss://older.example/" }, 50));

      std::ignore = fixture.resolve(me, true);
      gift_relay_test::drain(*fixture.io_context);

      THEN("the persisted list is kept")
      {
        CHECK(fixture.resolve(me, true) == std::vector<std::string>{ "wss://stale.example/" });
        CHECK(fixture.cache->get_relay_list(me)->created_at == 100);
      }
    }

    WHEN("the network has a list with the same timestamp")
    {
      fixture.pool->fetch_results.insert_or_assign(me, relay_list(fixture.bob, { "wss://same-age.example/" }, 100));

      std::ignore = fixture.resolve(me, true);
      gift_relay_test::drain(*fixture.io_context);

      THEN("the persisted list is kept")
      {
        CHECK(fixture.resolve(me, true) == std::vector<std::string>{ "wss://stale.example/" });
      }
    }
  }
}

TEST_CASE("the fallback is persisted only for the local user", "[nostr][inbox_relay_resolver]")
{
  resolver_fixture fixture;
  const auto carol = gift_relay::nostr::local_signer::generate().get_public_key();

  std::ignore = fixture.resolve(fixture.bob.get_public_key(), true);
  std::ignore = fixture.resolve(carol);

  const auto mine = fixture.cache->get_relay_list(fixture.bob.get_public_key());
  REQUIRE(mine.has_value());
  CHECK(mine->relays == std::vector<std::string>{ "wss://fallback.example/" });
  CHECK_FALSE(fixture.cache->get_relay_list(carol).has_value());
}

TEST_CASE("seeded lists win over lookups until cleared", "[nostr][inbox_relay_resolver]")
{
  resolver_fixture fixture;
  fixture.resolver->seed(
    fixture.bob.get_public_key(), { .relays = { "wss://seeded.example/" }, .created_at = 300 }, false);

  CHECK(fixture.resolve(fixture.bob.get_public_key()) == std::vector<std::string>{ "wss://seeded.example/" });
  CHECK(fixture.pool->fetch_count == 0);

  fixture.resolver->clear();
  CHECK(fixture.resolve(fixture.bob.get_public_key()) == std::vector<std::string>{ "wss://fallback.example/" });
  CHECK(fixture.pool->fetch_count == 1);
}
