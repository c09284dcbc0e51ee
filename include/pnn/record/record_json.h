#pragma once

#include "pnn/record/notice_record.h"

#include <nlohmann/json.hpp>

#include <string>

namespace pnn::record {

/// Serialize a record to a JSON object, keys in field order, absent values as null
[[nodiscard]] nlohmann::ordered_json record_to_json(const NoticeRecord& record);

/// Deserialize a record from a JSON object.
/// Non-string scalars are kept in their JSON lexical form; nested values are ignored.
[[nodiscard]] NoticeRecord record_from_json(const nlohmann::ordered_json& j);

/// Serialize to a compact single-line JSON string (one JSON-lines row)
[[nodiscard]] std::string record_to_json_string(const NoticeRecord& record);

}  // namespace pnn::record
