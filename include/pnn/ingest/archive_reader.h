#pragma once

#include "pnn/core/result.h"

#include <cstdint>
#include <string>
#include <vector>

namespace pnn::ingest {

/// One member of a notice archive
struct ArchiveEntry {
  std::string name;
  std::vector<uint8_t> data;
};

struct ArchiveError {
  std::string message;
};

using ArchiveResult = core::Result<std::vector<ArchiveEntry>, ArchiveError>;

/// Read every member whose name ends in ".xml" (any case) from an in-memory ZIP archive,
/// in archive order. Other members are skipped.
[[nodiscard]] ArchiveResult read_xml_entries(const std::vector<uint8_t>& archive_bytes);

}  // namespace pnn::ingest
