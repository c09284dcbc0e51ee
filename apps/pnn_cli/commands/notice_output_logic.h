#pragma once

#include "pnn/record/notice_record.h"
#include "pnn/storage/notice_store.h"

#include <ostream>
#include <vector>

// execute_emit_records: write each record to out as one JSON line and, when store is
// non-null, append it to the store under family. Returns 1 if any append fails.
// Takes only interface types so it can be driven by tests without a database.
int execute_emit_records(const std::vector<pnn::record::NoticeRecord>& records,
                         pnn::record::SourceFamily family, pnn::storage::INoticeStore* store,
                         std::ostream& out);

// execute_export: write every stored record of family to out as JSON lines, append order.
int execute_export(const pnn::storage::INoticeStore& store, pnn::record::SourceFamily family,
                   std::ostream& out);
