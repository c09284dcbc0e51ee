#include "pnn/ingest/archive_reader.h"

#include "pnn/core/normalization.h"

#include <zip.h>

#include <memory>

namespace pnn::ingest {

namespace {

struct ZipCloser {
  void operator()(zip_t* archive) const { zip_discard(archive); }
};

struct ZipFileCloser {
  void operator()(zip_file_t* file) const { zip_fclose(file); }
};

using ZipPtr = std::unique_ptr<zip_t, ZipCloser>;
using ZipFilePtr = std::unique_ptr<zip_file_t, ZipFileCloser>;

}  // namespace

ArchiveResult read_xml_entries(const std::vector<uint8_t>& archive_bytes) {
  if (archive_bytes.empty()) {
    return ArchiveResult::err(ArchiveError{"Empty archive data"});
  }

  zip_error_t error;
  zip_error_init(&error);
  zip_source_t* src =
      zip_source_buffer_create(archive_bytes.data(), archive_bytes.size(), 0, &error);
  if (!src) {
    zip_error_fini(&error);
    return ArchiveResult::err(ArchiveError{"Failed to create ZIP source"});
  }

  ZipPtr archive(zip_open_from_source(src, ZIP_RDONLY, &error));
  if (!archive) {
    std::string message = "Failed to open ZIP archive: ";
    message += zip_error_strerror(&error);
    zip_source_free(src);
    zip_error_fini(&error);
    return ArchiveResult::err(ArchiveError{message});
  }
  zip_error_fini(&error);

  std::vector<ArchiveEntry> entries;
  const zip_int64_t count = zip_get_num_entries(archive.get(), 0);
  for (zip_int64_t i = 0; i < count; ++i) {
    const auto index = static_cast<zip_uint64_t>(i);
    const char* name = zip_get_name(archive.get(), index, 0);
    if (name == nullptr || !core::ends_with_ascii_ci(name, ".xml")) {
      continue;
    }

    zip_stat_t st;
    zip_stat_init(&st);
    if (zip_stat_index(archive.get(), index, 0, &st) != 0) {
      return ArchiveResult::err(ArchiveError{std::string("Failed to stat entry: ") + name});
    }

    ZipFilePtr file(zip_fopen_index(archive.get(), index, 0));
    if (!file) {
      return ArchiveResult::err(ArchiveError{std::string("Failed to open entry: ") + name});
    }

    ArchiveEntry entry;
    entry.name = name;
    entry.data.resize(st.size);
    const zip_int64_t bytes_read = zip_fread(file.get(), entry.data.data(), st.size);
    if (bytes_read != static_cast<zip_int64_t>(st.size)) {
      return ArchiveResult::err(ArchiveError{std::string("Failed to read entry: ") + name});
    }
    entries.push_back(std::move(entry));
  }

  return ArchiveResult::ok(std::move(entries));
}

}  // namespace pnn::ingest
