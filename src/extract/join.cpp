#include "pnn/extract/join.h"

#include "pnn/core/normalization.h"

#include <algorithm>
#include <set>

namespace pnn::extract {

std::optional<std::string> join_unique(const std::vector<std::optional<std::string>>& values,
                                       const std::string_view delimiter,
                                       const JoinPolicy policy) {
  std::vector<std::string> survivors;
  std::set<std::string> seen;

  for (const auto& value : values) {
    if (!value.has_value()) {
      continue;
    }
    std::string cleaned = core::trim(value.value());
    if (cleaned.empty()) {
      continue;
    }
    if (seen.insert(cleaned).second) {
      survivors.push_back(std::move(cleaned));
    }
  }

  if (survivors.empty()) {
    return std::nullopt;
  }

  if (policy == JoinPolicy::kSorted) {
    std::sort(survivors.begin(), survivors.end());
  }

  std::string joined = survivors.front();
  for (std::size_t i = 1; i < survivors.size(); ++i) {
    joined.append(delimiter);
    joined += survivors[i];
  }
  return joined;
}

std::optional<std::string> join_sorted_xml(const std::vector<std::optional<std::string>>& values) {
  return join_unique(values, kXmlDelimiter, JoinPolicy::kSorted);
}

std::optional<std::string> join_ordered_json(
    const std::vector<std::optional<std::string>>& values) {
  return join_unique(values, kJsonDelimiter, JoinPolicy::kFirstOccurrence);
}

}  // namespace pnn::extract
