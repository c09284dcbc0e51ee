#pragma once

#include "pnn/record/notice_record.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pnn::adapters {

/// Where a release package came from: the index row that referenced it
struct ReleaseSource {
  std::optional<std::string> csv_file;   // Index file the URI was listed in
  std::optional<std::int64_t> row_index;  // Row of the URI within that file
  std::string uri;                        // URI the package was fetched from
};

/// OcdsReleaseAdapter projects an OCDS release package onto the Contracts Finder columns.
///
/// Only the first release of the package and the first award of that release are projected.
/// Every nested lookup defaults an absent parent to "absent", so missing sub-structures only
/// ever produce empty fields.
class OcdsReleaseAdapter {
 public:
  /// Project a parsed release package.
  /// A package that is not a JSON object yields a failure record.
  [[nodiscard]] record::NoticeRecord extract(const nlohmann::json& package,
                                             const ReleaseSource& source) const;

  /// Parse and project raw JSON text; unparseable text yields a failure record.
  [[nodiscard]] record::NoticeRecord extract_text(std::string_view json_text,
                                                  const ReleaseSource& source) const;

  /// Bookkeeping-only record for a package that could not be projected
  /// (fetch failed, invalid JSON, or a duplicate URI the collaborator skipped).
  [[nodiscard]] static record::NoticeRecord failure_record(const ReleaseSource& source,
                                                           record::RecordStatus status);
};

}  // namespace pnn::adapters
