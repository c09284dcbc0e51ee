#pragma once

#include "pnn/storage/notice_store.h"
#include "pnn/storage/sqlite/sqlite_db.h"

#include <memory>

namespace pnn::storage::sqlite {

// SqliteNoticeStore implements INoticeStore on the notices table.
// Records are stored as their JSON-lines text and listed in insertion order (ORDER BY seq).
// The schema must be applied (ensure_schema_v1) before use.
class SqliteNoticeStore final : public INoticeStore {
 public:
  explicit SqliteNoticeStore(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] core::Result<std::int64_t, std::string> append(
      record::SourceFamily family, const record::NoticeRecord& record) override;
  [[nodiscard]] std::vector<record::NoticeRecord> list(
      record::SourceFamily family) const override;
  [[nodiscard]] std::size_t count(record::SourceFamily family) const override;

 private:
  std::shared_ptr<SqliteDb> db_;
};

}  // namespace pnn::storage::sqlite
