#include "pnn/record/notice_record.h"

#include <algorithm>

namespace pnn::record {

void NoticeRecord::set(const std::string_view name, FieldValue value) {
  auto it = std::find_if(fields_.begin(), fields_.end(),
                         [name](const Field& field) { return field.first == name; });
  if (it != fields_.end()) {
    it->second = std::move(value);
    return;
  }
  fields_.emplace_back(std::string(name), std::move(value));
}

FieldValue NoticeRecord::get(const std::string_view name) const {
  const Field* field = find(name);
  if (field == nullptr) {
    return std::nullopt;
  }
  return field->second;
}

bool NoticeRecord::contains(const std::string_view name) const {
  return find(name) != nullptr;
}

const NoticeRecord::Field* NoticeRecord::find(const std::string_view name) const {
  auto it = std::find_if(fields_.begin(), fields_.end(),
                         [name](const Field& field) { return field.first == name; });
  return it == fields_.end() ? nullptr : &*it;
}

std::string source_family_to_string(const SourceFamily family) {
  switch (family) {
    case SourceFamily::kContractsFinder:
      return "contracts_finder";
    case SourceFamily::kFindATender:
      return "find_a_tender";
  }
  return "unknown";
}

std::optional<SourceFamily> string_to_source_family(const std::string_view value) {
  if (value == "contracts_finder") {
    return SourceFamily::kContractsFinder;
  }
  if (value == "find_a_tender") {
    return SourceFamily::kFindATender;
  }
  return std::nullopt;
}

std::string record_status_to_string(const RecordStatus status) {
  switch (status) {
    case RecordStatus::kOk:
      return "ok";
    case RecordStatus::kFetchFailedOrInvalid:
      return "fetch_failed_or_invalid_json";
    case RecordStatus::kDuplicateSkipped:
      return "duplicate_uri_skipped_fetch";
  }
  return "unknown";
}

}  // namespace pnn::record
