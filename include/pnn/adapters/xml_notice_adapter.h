#pragma once

#include "pnn/record/notice_record.h"

#include <pugixml.hpp>

#include <string>

namespace pnn::adapters {

/// Adapter interface for one XML notice dialect.
///
/// Implementations read a parsed document and return a Find a Tender record. Missing
/// elements yield empty fields; extract never reports an error for absent data.
class IXmlNoticeAdapter {
 public:
  virtual ~IXmlNoticeAdapter() = default;

  /// Extract one record from the document's root element
  [[nodiscard]] virtual record::NoticeRecord extract(const pugi::xml_node& root) const = 0;

  /// Identifier written to the schema_type column (e.g., "TED_R2.0.9", "UK7_2023")
  [[nodiscard]] virtual std::string schema_type() const = 0;
};

}  // namespace pnn::adapters
