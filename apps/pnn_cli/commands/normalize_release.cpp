#include "normalize_release.h"

#include "notice_output_logic.h"
#include "store_setup.h"

#include "pnn/ingest/notice_ingestor.h"
#include "pnn/storage/sqlite/sqlite_notice_store.h"

#include "shared/arg_parser.h"
#include <charconv>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace {

struct NormalizeReleaseConfig {
  std::optional<std::string> db_path;
  pnn::adapters::ReleaseSource source;
};

}  // namespace

int cmd_normalize_release(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<pnn::apps::Option<NormalizeReleaseConfig>> options = {
      {"--uri", true, "URI the package was fetched from (default: the file path)",
       [](NormalizeReleaseConfig& c, const std::string& v) {
         c.source.uri = v;
         return true;
       }},
      {"--csv-file", true, "Index file that listed the URI",
       [](NormalizeReleaseConfig& c, const std::string& v) {
         c.source.csv_file = v;
         return true;
       }},
      {"--row-index", true, "Row of the URI within the index file",
       [](NormalizeReleaseConfig& c, const std::string& v) {
         std::int64_t row = 0;
         const auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), row);
         if (ec != std::errc() || ptr != v.data() + v.size()) {
           return false;
         }
         c.source.row_index = row;
         return true;
       }},
      {"--db", true, "Append the record to this SQLite database",
       [](NormalizeReleaseConfig& c, const std::string& v) {
         c.db_path = v;
         return true;
       }},
  };

  if (argc < 3) {
    std::cerr << "Usage: pnn_cli normalize-release <file> [options]\n";
    pnn::apps::print_options(std::cerr, options);
    return 1;
  }

  const std::string file_path = argv[2];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  const auto parsed = pnn::apps::parse_options(argc, argv, options, 3);
  if (!parsed.ok) {
    return 1;
  }

  auto ingestor = pnn::ingest::create_notice_ingestor();
  auto result = ingestor->ingest_release_file(file_path, parsed.config.source);
  if (!result.has_value()) {
    std::cerr << "Normalization failed: " << result.error() << "\n";
    return 1;
  }

  const auto status = result.value().get("status");
  if (status.has_value() && status.value() != "ok") {
    std::cerr << "Release not projected: " << status.value() << "\n";
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

  return execute_emit_records({result.value()}, pnn::record::SourceFamily::kContractsFinder,
                              store.get(), std::cout);
}
