#include "normalize_xml.h"

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

struct NormalizeXmlConfig {
  std::optional<std::string> db_path;
};

}  // namespace

int cmd_normalize_xml(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<pnn::apps::Option<NormalizeXmlConfig>> options = {
      {"--db", true, "Append the record to this SQLite database",
       [](NormalizeXmlConfig& c, const std::string& v) {
         c.db_path = v;
         return true;
       }},
  };

  if (argc < 3) {
    std::cerr << "Usage: pnn_cli normalize-xml <file> [--db <db-path>]\n";
    pnn::apps::print_options(std::cerr, options);
    return 1;
  }

  const std::string file_path = argv[2];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  const auto parsed = pnn::apps::parse_options(argc, argv, options, 3);
  if (!parsed.ok) {
    return 1;
  }

  auto ingestor = pnn::ingest::create_notice_ingestor();
  auto result = ingestor->ingest_xml_file(file_path);
  if (!result.has_value()) {
    std::cerr << "Normalization failed: " << result.error() << "\n";
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

  return execute_emit_records({result.value()}, pnn::record::SourceFamily::kFindATender,
                              store.get(), std::cout);
}
