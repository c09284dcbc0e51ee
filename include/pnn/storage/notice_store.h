#pragma once

#include "pnn/core/result.h"
#include "pnn/record/notice_record.h"

#include <cstdint>
#include <string>
#include <vector>

namespace pnn::storage {

/// Append-only collection of normalized records, one sequence per source family.
///
/// Records are kept exactly as appended; the store never merges or deduplicates them.
class INoticeStore {
 public:
  virtual ~INoticeStore() = default;

  /// Append a record; returns its sequence number within the store
  [[nodiscard]] virtual core::Result<std::int64_t, std::string> append(
      record::SourceFamily family, const record::NoticeRecord& record) = 0;

  /// All records of a family in append order
  [[nodiscard]] virtual std::vector<record::NoticeRecord> list(
      record::SourceFamily family) const = 0;

  [[nodiscard]] virtual std::size_t count(record::SourceFamily family) const = 0;
};

}  // namespace pnn::storage
