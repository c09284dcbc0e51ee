#pragma once

#include "pnn/core/result.h"
#include "pnn/storage/sqlite/sqlite_db.h"

#include <memory>
#include <string>

// open_notice_db: open (or create) the SQLite file at path and apply the notice schema.
pnn::core::Result<std::shared_ptr<pnn::storage::sqlite::SqliteDb>, std::string> open_notice_db(
    const std::string& path);
