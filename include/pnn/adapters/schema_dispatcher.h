#pragma once

#include "pnn/adapters/xml_notice_adapter.h"
#include "pnn/record/notice_record.h"

#include <pugixml.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace pnn::adapters {

/// Where an XML notice came from
struct XmlSource {
  std::string file_name;                    // Entry name (or file name) of the notice
  std::optional<std::string> archive_name;  // Daily archive the entry was read from
};

/// Form tag of the highest-priority UK form found below root, or std::nullopt for a
/// TED-style notice
[[nodiscard]] std::optional<std::string> detect_uk_form(const pugi::xml_node& root);

/// Adapter for a parsed document: the UK adapter for a detected form tag, TED otherwise
[[nodiscard]] std::unique_ptr<IXmlNoticeAdapter> create_adapter(const pugi::xml_node& root);

/// Normalize one XML notice.
///
/// Never throws. Text that does not parse, or a document an adapter fails on, yields a
/// record with doc_id none and the failure in parse_error. Every record ends with the
/// parse_error, source_xml_file and source_zip columns.
[[nodiscard]] record::NoticeRecord normalize_notice_xml(std::string_view xml_text,
                                                        const XmlSource& source);

}  // namespace pnn::adapters
