#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

struct sqlite3;

namespace gift_relay::storage {

/// Raised when the underlying database cannot be opened, read or written
class storage_error : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief Namespaced string key-value store backed by SQLite.
 *
 * Every cache kind owns a namespace, so the same key can be stored independently by
 * different caches. Safe to share between threads.
 */
class kv_store
{
public:
  /**
   * @brief Opens (or creates) the store.
   *
   * @param path Database file path, or ":memory:" for a process-local store
   * @throws storage_error if the database cannot be opened or initialised
   */
  explicit kv_store(const std::string &path);

  kv_store(const kv_store &) = delete;
  auto operator=(const kv_store &) -> kv_store & = delete;
  kv_store(kv_store &&) = delete;
  auto operator=(kv_store &&) -> kv_store & = delete;
  ~kv_store();

  [[nodiscard]] auto get(std::string_view name_space, std::string_view key) const -> std::optional<std::string>;

  /// Inserts or replaces the value stored under (name_space, key)
  auto put(std::string_view name_space, std::string_view key, std::string_view value) -> void;

  /// @return true if a value was removed
  auto erase(std::string_view name_space, std::string_view key) -> bool;

private:
  struct connection_deleter
  {
    auto operator()(sqlite3 *db) const -> void;
  };

  mutable std::mutex mutex_;
  std::unique_ptr<sqlite3, connection_deleter> db_;
};

}// namespace gift_relay::storage
