#pragma once

#include "pnn/adapters/ocds_release_adapter.h"
#include "pnn/core/result.h"
#include "pnn/record/notice_record.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace pnn::ingest {

using RecordResult = core::Result<record::NoticeRecord, std::string>;
using RecordListResult = core::Result<std::vector<record::NoticeRecord>, std::string>;

/// Interface for turning notice files on disk into records.
///
/// Errors cover only unreadable inputs; content problems are reported inside the records.
class INoticeIngestor {
 public:
  virtual ~INoticeIngestor() = default;

  /// Normalize a single XML notice file
  [[nodiscard]] virtual RecordResult ingest_xml_file(const std::string& file_path) = 0;

  /// Normalize every XML notice in a daily ZIP archive, in archive order
  [[nodiscard]] virtual RecordListResult ingest_archive_file(const std::string& file_path) = 0;

  /// Normalize one OCDS release package file; source.uri defaults to the file path
  [[nodiscard]] virtual RecordResult ingest_release_file(
      const std::string& file_path, const adapters::ReleaseSource& source) = 0;
};

/// Read a whole file into memory
[[nodiscard]] core::Result<std::vector<uint8_t>, std::string> read_file_bytes(
    const std::string& path);

/// Factory function to create the default notice ingestor
[[nodiscard]] std::unique_ptr<INoticeIngestor> create_notice_ingestor();

}  // namespace pnn::ingest
