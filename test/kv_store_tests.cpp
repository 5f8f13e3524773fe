#include <catch2/catch_test_macros.hpp>
#include <storage/kv_store.hpp>

#include <filesystem>
#include <memory>
#include <string>

TEST_CASE("kv_store stores values per namespace", "[storage][kv_store]")
{
  gift_relay::storage::kv_store store(":memory:");

  SECTION("missing keys read as empty")
  {
    CHECK_FALSE(store.get("dm_cache", "missing").has_value());
  }

  SECTION("put then get returns the value")
  {
    store.put("dm_cache", "key", "value");
    CHECK(store.get("dm_cache", "key") == "value");
  }

  SECTION("the same key is independent across namespaces")
  {
    store.put("dm_cache", "key", "rumor");
    store.put("dm_lastseen", "key", "42");

    CHECK(store.get("dm_cache", "key") == "rumor");
    CHECK(store.get("dm_lastseen", "key") == "42");
  }

  SECTION("put replaces an existing value")
  {
    store.put("inbox_relays", "pubkey", "old");
    store.put("inbox_relays", "pubkey", "new");
    CHECK(store.get("inbox_relays", "pubkey") == "new");
  }

  SECTION("erase reports whether anything was removed")
  {
    store.put("dm_reactions", "conversation", "{}");
    CHECK(store.erase("dm_reactions", "conversation"));
    CHECK_FALSE(store.erase("dm_reactions", "conversation"));
    CHECK_FALSE(store.get("dm_reactions", "conversation").has_value());
  }

  SECTION("values keep embedded quotes and UTF-8")
  {
    const std::string value = R"({"content":"it's \"fine\" ✓"})";
    store.put("dm_cache", "quoted", value);
    CHECK(store.get("dm_cache", "quoted") == value);
  }
}

TEST_CASE("kv_store persists across reopen", "[storage][kv_store]")
{
  const auto path = std::filesystem::temp_directory_path() / "gift_relay_kv_store_test.sqlite3";
  std::filesystem::remove(path);

  {
    gift_relay::storage::kv_store store(path.string());
    store.put("dm_lastseen", "conversation", "1700000000");
  }

  {
    gift_relay::storage::kv_store store(path.string());
    CHECK(store.get("dm_lastseen", "conversation") == "1700000000");
  }

  std::filesystem::remove(path);
}

TEST_CASE("kv_store reports unopenable databases", "[storage][kv_store]")
{
  CHECK_THROWS_AS(gift_relay::storage::kv_store("/nonexistent-directory/for/gift_relay/db.sqlite3"),
    gift_relay::storage::storage_error);
}
