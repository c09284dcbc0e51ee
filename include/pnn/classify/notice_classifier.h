#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pnn::classify {

/// Semantic notice category shared by every source format
enum class NoticeTypeGroup {
  kPriorInformation,  // "PIN"
  kContractNotice,    // "CONTRACT_NOTICE"
  kContractAward,     // "CONTRACT_AWARD"
  kModification,      // "MODIFICATION"
  kPlanning,          // "PLANNING"
  kOther,             // "OTHER"
};

[[nodiscard]] std::string notice_type_group_to_string(NoticeTypeGroup group);

/// Classify a TED TD_DOCUMENT_TYPE code.
/// 0 → PIN; 3, O, V → CONTRACT_NOTICE; 7 → CONTRACT_AWARD; K → MODIFICATION;
/// absent or anything else → OTHER. Codes are trimmed and compared case-insensitively.
[[nodiscard]] NoticeTypeGroup classify_ted_document_type(const std::optional<std::string>& code);

/// Classify a UK form notice from its form tag and its release tags.
/// UK6_2023/UK7_2023 tagged "award" → CONTRACT_AWARD; otherwise tagged "planning" → PLANNING;
/// otherwise OTHER.
[[nodiscard]] NoticeTypeGroup classify_uk_form(std::string_view form_tag,
                                               const std::vector<std::string>& tags);

/// Best-effort contract type from a free-text procurement category.
///
/// Rules are checked in order against the lowercased text and the first substring hit
/// wins: "work" → WORKS, "service" → SERVICES, "supply" or "good" → SUPPLIES.
/// The source vocabulary is not enumerated, so this is a heuristic, not a validation.
[[nodiscard]] std::optional<std::string> infer_contract_type(
    const std::optional<std::string>& main_procurement_category);

}  // namespace pnn::classify
