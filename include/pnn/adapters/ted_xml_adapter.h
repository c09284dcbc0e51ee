#pragma once

#include "pnn/adapters/xml_notice_adapter.h"

namespace pnn::adapters {

/// Legacy TED-derived notices (R2.0.9 forms F01-F21).
///
/// The root element's namespace is discovered per document; the 2021 and 2016 NUTS
/// namespaces are both probed, 2021 first. A document whose root carries no namespace
/// produces empty values for every namespaced field.
class TedXmlAdapter final : public IXmlNoticeAdapter {
 public:
  [[nodiscard]] record::NoticeRecord extract(const pugi::xml_node& root) const override;
  [[nodiscard]] std::string schema_type() const override { return "TED_R2.0.9"; }
};

}  // namespace pnn::adapters
