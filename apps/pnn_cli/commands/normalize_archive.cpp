#include "normalize_archive.h"

#include "notice_output_logic.h"
#include "store_setup.h"

#include "pnn/ingest/notice_ingestor.h"
#include "pnn/storage/sqlite/sqlite_notice_store.h"

#include "shared/arg_parser.h"
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

struct NormalizeArchiveConfig {
  std::optional<std::string> db_path;
};

}  // namespace

int cmd_normalize_archive(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<pnn::apps::Option<NormalizeArchiveConfig>> options = {
      {"--db", true, "Append the records to this SQLite database",
       [](NormalizeArchiveConfig& c, const std::string& v) {
         c.db_path = v;
         return true;
       }},
  };

  if (argc < 3) {
    std::cerr << "Usage: pnn_cli normalize-archive <zip> [--db <db-path>]\n";
    pnn::apps::print_options(std::cerr, options);
    return 1;
  }

  const std::string zip_path = argv[2];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  const auto parsed = pnn::apps::parse_options(argc, argv, options, 3);
  if (!parsed.ok) {
    return 1;
  }

  std::unique_ptr<pnn::storage::sqlite::SqliteNoticeStore> store;
  if (parsed.config.db_path.has_value()) {
    auto db_result = open_notice_db(parsed.config.db_path.value());
    if (!db_result.has_value()) {
      std::cerr << db_result.error() << "\n";
      return 1;
    }
    store = std::make_unique<pnn::storage::sqlite::SqliteNoticeStore>(db_result.value());
  }

  auto ingestor = pnn::ingest::create_notice_ingestor();
  auto result = ingestor->ingest_archive_file(zip_path);
  if (!result.has_value()) {
    std::cerr << "Normalization failed: " << result.error() << "\n";
    return 1;
  }

  const auto& records = result.value();
  if (records.empty()) {
    std::cerr << "No XML files found in " << zip_path << "\n";
    return 0;
  }

  std::size_t failed = 0;
  for (const auto& record : records) {
    if (record.get("parse_error").has_value()) {
      ++failed;
    }
  }

  const int exit_code = execute_emit_records(records, pnn::record::SourceFamily::kFindATender,
                                             store.get(), std::cout);
  std::cerr << "Normalized " << records.size() << " notices from " << zip_path;
  if (failed > 0) {
    std::cerr << " (" << failed << " with parse errors)";
  }
  std::cerr << "\n";
  return exit_code;
}
