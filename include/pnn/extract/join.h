#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pnn::extract {

/// Delimiter for values joined from XML notices (Find a Tender columns)
inline constexpr std::string_view kXmlDelimiter = ";";
/// Delimiter for values joined from OCDS JSON releases (Contracts Finder columns)
inline constexpr std::string_view kJsonDelimiter = "|";

/// Order of the surviving values in a joined field
enum class JoinPolicy {
  kSorted,           // Lexicographic order
  kFirstOccurrence,  // Source order, duplicates dropped after their first occurrence
};

/// Join optional values into one field.
/// Values are trimmed; none and blank entries are dropped; duplicates (exact equality after
/// trimming) are removed. Returns std::nullopt when nothing survives.
[[nodiscard]] std::optional<std::string> join_unique(
    const std::vector<std::optional<std::string>>& values, std::string_view delimiter,
    JoinPolicy policy);

/// join_unique with the XML delimiter and sorted order
[[nodiscard]] std::optional<std::string> join_sorted_xml(
    const std::vector<std::optional<std::string>>& values);

/// join_unique with the JSON delimiter and first-occurrence order
[[nodiscard]] std::optional<std::string> join_ordered_json(
    const std::vector<std::optional<std::string>>& values);

}  // namespace pnn::extract
