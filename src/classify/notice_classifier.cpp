#include "pnn/classify/notice_classifier.h"

#include "pnn/core/normalization.h"

#include <algorithm>
#include <array>

namespace pnn::classify {

namespace {

struct ContractTypeRule {
  std::string_view needle;
  std::string_view contract_type;
};

// Order matters: "work" is checked before the service/supply rules.
constexpr std::array<ContractTypeRule, 4> kContractTypeRules{{
    {"work", "WORKS"},
    {"service", "SERVICES"},
    {"supply", "SUPPLIES"},
    {"good", "SUPPLIES"},
}};

constexpr std::array<std::string_view, 2> kUkAwardForms{"UK6_2023", "UK7_2023"};

bool contains_tag(const std::vector<std::string>& tags, const std::string_view wanted) {
  return std::find(tags.begin(), tags.end(), wanted) != tags.end();
}

}  // namespace

std::string notice_type_group_to_string(const NoticeTypeGroup group) {
  switch (group) {
    case NoticeTypeGroup::kPriorInformation:
      return "PIN";
    case NoticeTypeGroup::kContractNotice:
      return "CONTRACT_NOTICE";
    case NoticeTypeGroup::kContractAward:
      return "CONTRACT_AWARD";
    case NoticeTypeGroup::kModification:
      return "MODIFICATION";
    case NoticeTypeGroup::kPlanning:
      return "PLANNING";
    case NoticeTypeGroup::kOther:
      return "OTHER";
  }
  return "OTHER";
}

NoticeTypeGroup classify_ted_document_type(const std::optional<std::string>& code) {
  if (!code.has_value()) {
    return NoticeTypeGroup::kOther;
  }

  const std::string normalized = core::normalize_ascii_upper(core::trim(code.value()));
  if (normalized == "0") {
    return NoticeTypeGroup::kPriorInformation;
  }
  if (normalized == "3" || normalized == "O" || normalized == "V") {
    return NoticeTypeGroup::kContractNotice;
  }
  if (normalized == "7") {
    return NoticeTypeGroup::kContractAward;
  }
  if (normalized == "K") {
    return NoticeTypeGroup::kModification;
  }
  return NoticeTypeGroup::kOther;
}

NoticeTypeGroup classify_uk_form(const std::string_view form_tag,
                                 const std::vector<std::string>& tags) {
  const bool award_form =
      std::find(kUkAwardForms.begin(), kUkAwardForms.end(), form_tag) != kUkAwardForms.end();
  if (award_form && contains_tag(tags, "award")) {
    return NoticeTypeGroup::kContractAward;
  }
  if (contains_tag(tags, "planning")) {
    return NoticeTypeGroup::kPlanning;
  }
  return NoticeTypeGroup::kOther;
}

std::optional<std::string> infer_contract_type(
    const std::optional<std::string>& main_procurement_category) {
  if (!main_procurement_category.has_value() || main_procurement_category->empty()) {
    return std::nullopt;
  }

  const std::string lowered = core::normalize_ascii_lower(main_procurement_category.value());
  for (const auto& rule : kContractTypeRules) {
    if (lowered.find(rule.needle) != std::string::npos) {
      return std::string(rule.contract_type);
    }
  }
  return std::nullopt;
}

}  // namespace pnn::classify
