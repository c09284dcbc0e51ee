#include "export_records.h"

#include "notice_output_logic.h"
#include "store_setup.h"

#include "pnn/storage/sqlite/sqlite_notice_store.h"

#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct ExportConfig {
  std::optional<std::string> db_path;
};

}  // namespace

int cmd_export(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<pnn::apps::Option<ExportConfig>> options = {
      {"--db", true, "SQLite database to read",
       [](ExportConfig& c, const std::string& v) {
         c.db_path = v;
         return true;
       }},
  };

  if (argc < 3) {
    std::cerr << "Usage: pnn_cli export <contracts_finder|find_a_tender> --db <db-path>\n";
    pnn::apps::print_options(std::cerr, options);
    return 1;
  }

  const auto family =
      pnn::record::string_to_source_family(argv[2]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  if (!family.has_value()) {
    std::cerr << "Unknown source family: " << argv[2]  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
              << " (valid: contracts_finder, find_a_tender)\n";
    return 1;
  }

  const auto parsed = pnn::apps::parse_options(argc, argv, options, 3);
  if (!parsed.ok) {
    return 1;
  }
  if (!parsed.config.db_path.has_value()) {
    std::cerr << "export requires --db <db-path>\n";
    return 1;
  }

  auto db_result = open_notice_db(parsed.config.db_path.value());
  if (!db_result.has_value()) {
    std::cerr << db_result.error() << "\n";
    return 1;
  }

  pnn::storage::sqlite::SqliteNoticeStore store(db_result.value());
  return execute_export(store, family.value(), std::cout);
}
