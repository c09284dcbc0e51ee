#include "store_setup.h"

pnn::core::Result<std::shared_ptr<pnn::storage::sqlite::SqliteDb>, std::string> open_notice_db(
    const std::string& path) {
  using DbResult = pnn::core::Result<std::shared_ptr<pnn::storage::sqlite::SqliteDb>, std::string>;

  auto db_result = pnn::storage::sqlite::SqliteDb::open(path);
  if (!db_result.has_value()) {
    return db_result;
  }

  auto db = db_result.value();
  auto schema_result = db->ensure_schema_v1();
  if (!schema_result.has_value()) {
    return DbResult::err("Failed to initialize schema: " + schema_result.error());
  }
  return DbResult::ok(db);
}
