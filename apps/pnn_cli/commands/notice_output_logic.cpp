#include "notice_output_logic.h"

#include "pnn/record/record_json.h"

#include <iostream>

int execute_emit_records(const std::vector<pnn::record::NoticeRecord>& records,
                         const pnn::record::SourceFamily family,
                         pnn::storage::INoticeStore* store, std::ostream& out) {
  int exit_code = 0;
  for (const auto& record : records) {
    out << pnn::record::record_to_json_string(record) << "\n";
    if (store == nullptr) {
      continue;
    }
    auto appended = store->append(family, record);
    if (!appended.has_value()) {
      std::cerr << "Failed to store record: " << appended.error() << "\n";
      exit_code = 1;
    }
  }
  return exit_code;
}

int execute_export(const pnn::storage::INoticeStore& store,
                   const pnn::record::SourceFamily family, std::ostream& out) {
  const auto records = store.list(family);
  for (const auto& record : records) {
    out << pnn::record::record_to_json_string(record) << "\n";
  }
  std::cerr << "Exported " << records.size() << " "
            << pnn::record::source_family_to_string(family) << " records\n";
  return 0;
}
