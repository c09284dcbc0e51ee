#pragma once

#include "pnn/adapters/xml_notice_adapter.h"

#include <array>
#include <string>
#include <string_view>

namespace pnn::adapters {

/// UK form tags in detection priority order: UK16_2023 down to UK1_2023, then the legacy
/// UK1_2022 form. The first tag found among the root's descendants selects the adapter.
inline constexpr std::array<std::string_view, 17> kUkFormTags = {
    "UK16_2023", "UK15_2023", "UK14_2023", "UK13_2023", "UK12_2023", "UK11_2023",
    "UK10_2023", "UK9_2023",  "UK8_2023",  "UK7_2023",  "UK6_2023",  "UK5_2023",
    "UK4_2023",  "UK3_2023",  "UK2_2023",  "UK1_2023",  "UK1_2022",
};

/// UK notices carrying an OCDS-shaped release inside a form element (UK1..UK16).
///
/// Fields the UK forms do not carry (dispatch date, values, CODIF codes) are emitted as
/// none so the record has the same columns as a TED record.
class UkOcdsXmlAdapter final : public IXmlNoticeAdapter {
 public:
  explicit UkOcdsXmlAdapter(std::string form_tag);

  [[nodiscard]] record::NoticeRecord extract(const pugi::xml_node& root) const override;
  [[nodiscard]] std::string schema_type() const override { return form_tag_; }

  /// Form tag without its "_2023" suffix (e.g., "UK7")
  [[nodiscard]] std::string short_form() const;

 private:
  std::string form_tag_;
};

}  // namespace pnn::adapters
