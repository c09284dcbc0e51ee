#include "pnn/record/record_json.h"

namespace pnn::record {

nlohmann::ordered_json record_to_json(const NoticeRecord& record) {
  nlohmann::ordered_json j = nlohmann::ordered_json::object();

  for (const auto& [name, value] : record.fields()) {
    if (value.has_value()) {
      j[name] = value.value();
    } else {
      j[name] = nullptr;
    }
  }

  return j;
}

NoticeRecord record_from_json(const nlohmann::ordered_json& j) {
  NoticeRecord record;
  if (!j.is_object()) {
    return record;
  }

  for (const auto& [name, value] : j.items()) {
    if (value.is_string()) {
      record.set(name, value.get<std::string>());
    } else if (value.is_number() || value.is_boolean()) {
      record.set(name, value.dump());
    } else if (value.is_null()) {
      record.set(name, std::nullopt);
    }
  }

  return record;
}

std::string record_to_json_string(const NoticeRecord& record) {
  return record_to_json(record).dump();  // Compact JSON
}

}  // namespace pnn::record
