#include "pnn/storage/sqlite/sqlite_notice_store.h"

#include "pnn/record/record_json.h"

#include <sqlite3.h>

namespace pnn::storage::sqlite {

SqliteNoticeStore::SqliteNoticeStore(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

core::Result<std::int64_t, std::string> SqliteNoticeStore::append(
    const record::SourceFamily family, const record::NoticeRecord& record) {
  const char* sql = "INSERT INTO notices (family, record_json) VALUES (?, ?)";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return core::Result<std::int64_t, std::string>::err("Failed to prepare append: " +
                                                        stmt.error());
  }

  const std::string family_name = record::source_family_to_string(family);
  const std::string json_text = record::record_to_json_string(record);
  sqlite3_bind_text(stmt.get(), 1, family_name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 2, json_text.c_str(), -1, SQLITE_TRANSIENT);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return core::Result<std::int64_t, std::string>::err(
        std::string("Failed to append record: ") + sqlite3_errmsg(db_->connection()));
  }

  return core::Result<std::int64_t, std::string>::ok(
      sqlite3_last_insert_rowid(db_->connection()));
}

std::vector<record::NoticeRecord> SqliteNoticeStore::list(
    const record::SourceFamily family) const {
  const char* sql = "SELECT record_json FROM notices WHERE family = ? ORDER BY seq";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return {};
  }

  const std::string family_name = record::source_family_to_string(family);
  sqlite3_bind_text(stmt.get(), 1, family_name.c_str(), -1, SQLITE_TRANSIENT);

  std::vector<record::NoticeRecord> result;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 0));
    if (text == nullptr) {
      continue;
    }
    const auto parsed = nlohmann::ordered_json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
      continue;
    }
    result.push_back(record::record_from_json(parsed));
  }

  return result;
}

std::size_t SqliteNoticeStore::count(const record::SourceFamily family) const {
  const char* sql = "SELECT COUNT(*) FROM notices WHERE family = ?";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return 0;
  }

  const std::string family_name = record::source_family_to_string(family);
  sqlite3_bind_text(stmt.get(), 1, family_name.c_str(), -1, SQLITE_TRANSIENT);

  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
  }
  return 0;
}

}  // namespace pnn::storage::sqlite
