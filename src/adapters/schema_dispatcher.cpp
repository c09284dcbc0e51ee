#include "pnn/adapters/schema_dispatcher.h"

#include "pnn/adapters/ted_xml_adapter.h"
#include "pnn/adapters/uk_ocds_xml_adapter.h"

#include <exception>

namespace pnn::adapters {

namespace {

record::NoticeRecord error_record(std::string message) {
  record::NoticeRecord rec;
  rec.set("doc_id", std::nullopt);
  rec.set("parse_error", std::move(message));
  return rec;
}

void stamp_source(record::NoticeRecord& rec, const XmlSource& source) {
  rec.set("source_xml_file", source.file_name);
  rec.set("source_zip", source.archive_name);
}

}  // namespace

std::optional<std::string> detect_uk_form(const pugi::xml_node& root) {
  for (const std::string_view tag : kUkFormTags) {
    const pugi::xml_node form =
        root.find_node([tag](const pugi::xml_node& n) { return tag == n.name(); });
    if (form) {
      return std::string(tag);
    }
  }
  return std::nullopt;
}

std::unique_ptr<IXmlNoticeAdapter> create_adapter(const pugi::xml_node& root) {
  if (auto form_tag = detect_uk_form(root)) {
    return std::make_unique<UkOcdsXmlAdapter>(std::move(*form_tag));
  }
  return std::make_unique<TedXmlAdapter>();
}

record::NoticeRecord normalize_notice_xml(const std::string_view xml_text,
                                          const XmlSource& source) {
  record::NoticeRecord rec;

  pugi::xml_document doc;
  const pugi::xml_parse_result parsed =
      doc.load_buffer(xml_text.data(), xml_text.size(), pugi::parse_default, pugi::encoding_utf8);
  if (!parsed) {
    rec = error_record(std::string(parsed.description()) + " at offset " +
                       std::to_string(parsed.offset));
  } else if (!doc.document_element()) {
    rec = error_record("No document element");
  } else {
    try {
      const pugi::xml_node root = doc.document_element();
      rec = create_adapter(root)->extract(root);
      rec.set("parse_error", std::nullopt);
    } catch (const std::exception& e) {
      rec = error_record(e.what());
    }
  }

  stamp_source(rec, source);
  return rec;
}

}  // namespace pnn::adapters
