#include "pnn/ingest/notice_ingestor.h"

#include "pnn/adapters/schema_dispatcher.h"
#include "pnn/ingest/archive_reader.h"
#include "pnn/ingest/text_decoding.h"

#include <filesystem>
#include <fstream>
#include <system_error>

namespace pnn::ingest {

core::Result<std::vector<uint8_t>, std::string> read_file_bytes(const std::string& path) {
  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    return core::Result<std::vector<uint8_t>, std::string>::err("Not a regular file: " + path);
  }

  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file.is_open()) {
    return core::Result<std::vector<uint8_t>, std::string>::err("Failed to open file: " + path);
  }

  const auto size = file.tellg();
  if (size < 0) {
    return core::Result<std::vector<uint8_t>, std::string>::err("Failed to size file: " + path);
  }
  file.seekg(0, std::ios::beg);

  std::vector<uint8_t> data(static_cast<std::size_t>(size));
  if (!file.read(reinterpret_cast<char*>(data.data()), size)) {
    return core::Result<std::vector<uint8_t>, std::string>::err("Failed to read file: " + path);
  }

  return core::Result<std::vector<uint8_t>, std::string>::ok(std::move(data));
}

/// Default implementation of notice ingestor
class NoticeIngestor : public INoticeIngestor {
 public:
  RecordResult ingest_xml_file(const std::string& file_path) override {
    auto bytes_result = read_file_bytes(file_path);
    if (!bytes_result.has_value()) {
      return RecordResult::err(bytes_result.error());
    }

    adapters::XmlSource source;
    source.file_name = std::filesystem::path(file_path).filename().string();
    const std::string text = decode_notice_bytes(bytes_result.value());
    return RecordResult::ok(adapters::normalize_notice_xml(text, source));
  }

  RecordListResult ingest_archive_file(const std::string& file_path) override {
    auto bytes_result = read_file_bytes(file_path);
    if (!bytes_result.has_value()) {
      return RecordListResult::err(bytes_result.error());
    }

    auto entries_result = read_xml_entries(bytes_result.value());
    if (!entries_result.has_value()) {
      return RecordListResult::err(entries_result.error().message + ": " + file_path);
    }

    const std::string archive_name = std::filesystem::path(file_path).filename().string();
    std::vector<record::NoticeRecord> records;
    records.reserve(entries_result.value().size());
    for (const auto& entry : entries_result.value()) {
      adapters::XmlSource source;
      source.file_name = entry.name;
      source.archive_name = archive_name;
      records.push_back(
          adapters::normalize_notice_xml(decode_notice_bytes(entry.data), source));
    }
    return RecordListResult::ok(std::move(records));
  }

  RecordResult ingest_release_file(const std::string& file_path,
                                   const adapters::ReleaseSource& source) override {
    adapters::ReleaseSource resolved = source;
    if (resolved.uri.empty()) {
      resolved.uri = file_path;
    }

    auto bytes_result = read_file_bytes(file_path);
    if (!bytes_result.has_value()) {
      // An unreadable package is recorded the same way an unreachable one is
      return RecordResult::ok(adapters::OcdsReleaseAdapter::failure_record(
          resolved, record::RecordStatus::kFetchFailedOrInvalid));
    }

    const std::string text = decode_notice_bytes(bytes_result.value());
    return RecordResult::ok(adapter_.extract_text(text, resolved));
  }

 private:
  adapters::OcdsReleaseAdapter adapter_;
};

std::unique_ptr<INoticeIngestor> create_notice_ingestor() {
  return std::make_unique<NoticeIngestor>();
}

}  // namespace pnn::ingest
