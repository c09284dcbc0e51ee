#include "pnn/ingest/notice_ingestor.h"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>

using namespace pnn::ingest;

namespace {

// Writes content to a file under the temp directory and removes it on scope exit
class TempFile {
 public:
  TempFile(const std::string& name, const std::string& content)
      : path_(std::filesystem::temp_directory_path() / name) {
    std::ofstream out(path_, std::ios::binary);
    out << content;
  }
  ~TempFile() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }
  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;

  [[nodiscard]] std::string path() const { return path_.string(); }

 private:
  std::filesystem::path path_;
};

}  // namespace

TEST_CASE("ingest_xml_file normalizes a Latin-1 notice", "[ingest][notice_ingestor]") {
  const TempFile file("pnn_test_latin1_notice.xml",
                      "<NOTICE><UK2_2023><tag>planning</tag><buyer><name>Caf\xE9 Council</name>"
                      "</buyer></UK2_2023></NOTICE>");

  auto ingestor = create_notice_ingestor();
  const auto result = ingestor->ingest_xml_file(file.path());

  REQUIRE(result.has_value());
  const auto& rec = result.value();
  REQUIRE(rec.get("schema_type") == "UK2_2023");
  REQUIRE(rec.get("ca_name") == "Caf\xC3\xA9 Council");
  REQUIRE(rec.get("source_xml_file") == "pnn_test_latin1_notice.xml");
  REQUIRE_FALSE(rec.get("source_zip").has_value());
}

TEST_CASE("ingest_xml_file reports unreadable files", "[ingest][notice_ingestor]") {
  auto ingestor = create_notice_ingestor();

  const auto result = ingestor->ingest_xml_file("/nonexistent/pnn/notice.xml");

  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.error().find("Failed to open file") != std::string::npos);
}

TEST_CASE("read_file_bytes rejects a directory", "[ingest][notice_ingestor]") {
  const auto result = read_file_bytes(std::filesystem::temp_directory_path().string());

  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.error().find("Not a regular file") != std::string::npos);
}

TEST_CASE("ingest_archive_file reports invalid archives", "[ingest][notice_ingestor]") {
  const TempFile file("pnn_test_not_a_zip.zip", "plain text");
  auto ingestor = create_notice_ingestor();

  const auto result = ingestor->ingest_archive_file(file.path());

  REQUIRE_FALSE(result.has_value());
}

TEST_CASE("ingest_release_file defaults the uri to the path", "[ingest][notice_ingestor]") {
  const TempFile file("pnn_test_release.json",
                      R"({"releases": [{"ocid": "ocds-1", "buyer": {"id": "B1"}}]})");
  auto ingestor = create_notice_ingestor();

  const auto result = ingestor->ingest_release_file(file.path(), {});

  REQUIRE(result.has_value());
  REQUIRE(result.value().get("status") == "ok");
  REQUIRE(result.value().get("ocid") == "ocds-1");
  REQUIRE(result.value().get("uri") == file.path());
}

TEST_CASE("unreadable release files become failure records", "[ingest][notice_ingestor]") {
  auto ingestor = create_notice_ingestor();
  pnn::adapters::ReleaseSource source;
  source.uri = "https://example.org/missing.json";

  const auto result = ingestor->ingest_release_file("/nonexistent/pnn/release.json", source);

  REQUIRE(result.has_value());
  REQUIRE(result.value().get("status") == "fetch_failed_or_invalid_json");
  REQUIRE(result.value().get("uri") == "https://example.org/missing.json");
}
