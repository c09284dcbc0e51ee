#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pnn::record {

/// A single optional scalar; std::nullopt means the source did not carry the field.
using FieldValue = std::optional<std::string>;

/// NoticeRecord is the flat canonical record every adapter converges to.
///
/// Fields keep the order in which they were first assigned, so a record produced by an
/// adapter always lists its columns in that adapter's fixed order. Assigning an existing
/// field replaces its value without moving it.
class NoticeRecord {
 public:
  using Field = std::pair<std::string, FieldValue>;

  void set(std::string_view name, FieldValue value);

  /// Value of the field, or std::nullopt when the field is absent or empty.
  [[nodiscard]] FieldValue get(std::string_view name) const;

  [[nodiscard]] bool contains(std::string_view name) const;

  [[nodiscard]] const std::vector<Field>& fields() const { return fields_; }
  [[nodiscard]] std::size_t size() const { return fields_.size(); }
  [[nodiscard]] bool empty() const { return fields_.empty(); }

  bool operator==(const NoticeRecord&) const = default;

 private:
  [[nodiscard]] const Field* find(std::string_view name) const;

  std::vector<Field> fields_;
};

/// Source dataset a record belongs to; each family has its own column set.
enum class SourceFamily {
  kContractsFinder,  // OCDS JSON releases
  kFindATender,      // TED / UK XML notices
};

std::string source_family_to_string(SourceFamily family);
std::optional<SourceFamily> string_to_source_family(std::string_view value);

/// Processing status written to the release family's "status" column.
enum class RecordStatus {
  kOk,
  kFetchFailedOrInvalid,
  kDuplicateSkipped,
};

std::string record_status_to_string(RecordStatus status);

}  // namespace pnn::record
