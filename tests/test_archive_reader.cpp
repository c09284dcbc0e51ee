#include "pnn/ingest/archive_reader.h"

#include <catch2/catch_test_macros.hpp>

#include <zip.h>

#include <cstdio>
#include <string>
#include <utility>
#include <vector>

using namespace pnn::ingest;

namespace {

// Build a ZIP archive in memory holding the given (name, content) entries
std::vector<uint8_t> build_zip(const std::vector<std::pair<std::string, std::string>>& files) {
  zip_error_t error;
  zip_error_init(&error);
  zip_source_t* buffer = zip_source_buffer_create(nullptr, 0, 0, &error);
  REQUIRE(buffer != nullptr);
  zip_source_keep(buffer);

  zip_t* archive = zip_open_from_source(buffer, ZIP_TRUNCATE, &error);
  REQUIRE(archive != nullptr);

  for (const auto& [name, content] : files) {
    zip_source_t* entry = zip_source_buffer(archive, content.data(), content.size(), 0);
    REQUIRE(entry != nullptr);
    REQUIRE(zip_file_add(archive, name.c_str(), entry, ZIP_FL_ENC_UTF_8) >= 0);
  }
  REQUIRE(zip_close(archive) == 0);

  REQUIRE(zip_source_open(buffer) == 0);
  REQUIRE(zip_source_seek(buffer, 0, SEEK_END) == 0);
  const zip_int64_t size = zip_source_tell(buffer);
  REQUIRE(zip_source_seek(buffer, 0, SEEK_SET) == 0);

  std::vector<uint8_t> bytes(static_cast<std::size_t>(size));
  REQUIRE(zip_source_read(buffer, bytes.data(), static_cast<zip_uint64_t>(size)) == size);
  zip_source_close(buffer);
  zip_source_free(buffer);
  zip_error_fini(&error);
  return bytes;
}

}  // namespace

TEST_CASE("read_xml_entries returns XML members in archive order", "[ingest][archive_reader]") {
  const auto zip_bytes = build_zip({
      {"notice-b.xml", "<NOTICE>b</NOTICE>"},
      {"readme.txt", "not a notice"},
      {"notice-a.XML", "<NOTICE>a</NOTICE>"},
  });

  const auto result = read_xml_entries(zip_bytes);

  REQUIRE(result.has_value());
  const auto& entries = result.value();
  REQUIRE(entries.size() == 2);
  REQUIRE(entries[0].name == "notice-b.xml");
  REQUIRE(std::string(entries[0].data.begin(), entries[0].data.end()) == "<NOTICE>b</NOTICE>");
  REQUIRE(entries[1].name == "notice-a.XML");
}

TEST_CASE("archive without XML members yields no entries", "[ingest][archive_reader]") {
  const auto zip_bytes = build_zip({{"index.csv", "a,b"}});

  const auto result = read_xml_entries(zip_bytes);

  REQUIRE(result.has_value());
  REQUIRE(result.value().empty());
}

TEST_CASE("bytes that are not a ZIP archive are rejected", "[ingest][archive_reader]") {
  const std::string junk = "this is not a zip archive";

  const auto result = read_xml_entries(std::vector<uint8_t>(junk.begin(), junk.end()));

  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.error().message.find("Failed to open ZIP archive") != std::string::npos);
}

TEST_CASE("empty archive data is rejected", "[ingest][archive_reader]") {
  const auto result = read_xml_entries({});

  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.error().message == "Empty archive data");
}
