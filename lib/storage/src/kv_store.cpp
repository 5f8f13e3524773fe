#include <storage/kv_store.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <sqlite3.h>

#include <tuple>

namespace gift_relay::storage {

namespace {

  constexpr auto schema = R"sql(
    CREATE TABLE IF NOT EXISTS kv (
      namespace TEXT NOT NULL,
      key       TEXT NOT NULL,
      value     TEXT NOT NULL,
      PRIMARY KEY (namespace, key)
    ) WITHOUT ROWID;
  )sql";

  // Finalizes the statement on every exit path.
  class statement
  {
  public:
    statement(sqlite3 *db, std::string_view sql) : db_(db)
    {
      if (sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size()), &stmt_, nullptr) != SQLITE_OK) {
        throw storage_error(fmt::format("prepare failed: {}", sqlite3_errmsg(db)));
      }
    }

    statement(const statement &) = delete;
    auto operator=(const statement &) -> statement & = delete;
    statement(statement &&) = delete;
    auto operator=(statement &&) -> statement & = delete;
    ~statement() { sqlite3_finalize(stmt_); }

    auto bind(int index, std::string_view text) -> void
    {
      if (sqlite3_bind_text(stmt_, index, text.data(), static_cast<int>(text.size()), SQLITE_TRANSIENT)
          != SQLITE_OK) {
        throw storage_error(fmt::format("bind failed: {}", sqlite3_errmsg(db_)));
      }
    }

    /// @return true while a row is available
    auto step() -> bool
    {
      const auto result = sqlite3_step(stmt_);
      if (result == SQLITE_ROW) { return true; }
      if (result == SQLITE_DONE) { return false; }
      throw storage_error(fmt::format("step failed: {}", sqlite3_errmsg(db_)));
    }

    [[nodiscard]] auto column_text(int index) const -> std::string
    {
      const auto *text = sqlite3_column_text(stmt_, index);
      const auto size = sqlite3_column_bytes(stmt_, index);
      if (text == nullptr) { return {}; }
      return { reinterpret_cast<const char *>(text),// NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
        static_cast<std::size_t>(size) };
    }

  private:
    sqlite3 *db_;
    sqlite3_stmt *stmt_{ nullptr };
  };

}// namespace

auto kv_store::connection_deleter::operator()(sqlite3 *db) const -> void { sqlite3_close(db); }

kv_store::kv_store(const std::string &path)
{
  sqlite3 *raw = nullptr;
  const auto result = sqlite3_open(path.c_str(), &raw);
  db_.reset(raw);
  if (result != SQLITE_OK) {
    throw storage_error(
      fmt::format("Failed to open {}: {}", path, raw != nullptr ? sqlite3_errmsg(raw) : "out of memory"));
  }

  char *err_msg = nullptr;
  if (sqlite3_exec(db_.get(), schema, nullptr, nullptr, &err_msg) != SQLITE_OK) {
    const std::string message = err_msg != nullptr ? err_msg : "unknown error";
    sqlite3_free(err_msg);
    throw storage_error(fmt::format("Failed to initialise {}: {}", path, message));
  }

  spdlog::debug("[kv_store] Opened {}", path);
}

kv_store::~kv_store() = default;

auto kv_store::get(std::string_view name_space, std::string_view key) const -> std::optional<std::string>
{
  const std::lock_guard<std::mutex> lock(mutex_);

  statement stmt(db_.get(), "SELECT value FROM kv WHERE namespace = ?1 AND key = ?2");
  stmt.bind(1, name_space);
  stmt.bind(2, key);
  if (not stmt.step()) { return std::nullopt; }
  return stmt.column_text(0);
}

auto kv_store::put(std::string_view name_space, std::string_view key, std::string_view value) -> void
{
  const std::lock_guard<std::mutex> lock(mutex_);

  statement stmt(db_.get(), "INSERT OR REPLACE INTO kv (namespace, key, value) VALUES (?1, ?2, ?3)");
  stmt.bind(1, name_space);
  stmt.bind(2, key);
  stmt.bind(3, value);
  std::ignore = stmt.step();
}

auto kv_store::erase(std::string_view name_space, std::string_view key) -> bool
{
  const std::lock_guard<std::mutex> lock(mutex_);

  statement stmt(db_.get(), "DELETE FROM kv WHERE namespace = ?1 AND key = ?2");
  stmt.bind(1, name_space);
  stmt.bind(2, key);
  std::ignore = stmt.step();
  return sqlite3_changes(db_.get()) > 0;
}

}// namespace gift_relay::storage
