#include "pnn/adapters/ocds_release_adapter.h"

#include "pnn/extract/join.h"
#include "pnn/extract/json_path.h"

#include <initializer_list>
#include <vector>

namespace pnn::adapters {

namespace {

using nlohmann::json;
using record::FieldValue;
using record::NoticeRecord;

// Pipe-join one key path across every element of an array
FieldValue join_column(const json& elements, const std::initializer_list<std::string_view> path) {
  std::vector<std::optional<std::string>> values;
  values.reserve(elements.size());
  for (const auto& element : elements) {
    values.push_back(extract::scalar_at(&element, path));
  }
  return extract::join_ordered_json(values);
}

// Pipe-join an array of scalars
FieldValue join_scalars(const json& elements) {
  std::vector<std::optional<std::string>> values;
  values.reserve(elements.size());
  for (const auto& element : elements) {
    values.push_back(extract::scalar(&element));
  }
  return extract::join_ordered_json(values);
}

// First document of the given documentType, or nullptr
const json* find_document(const json* documents, const std::string_view document_type) {
  for (const auto& document : extract::array_or_empty(documents)) {
    if (extract::scalar_at(&document, {"documentType"}) == document_type) {
      return &document;
    }
  }
  return nullptr;
}

// Party whose id equals release.buyer.id; nullptr when the buyer id is absent or unmatched
const json* find_buyer_party(const json* release) {
  const auto buyer_id = extract::scalar_at(release, {"buyer", "id"});
  if (!buyer_id.has_value() || buyer_id->empty()) {
    return nullptr;
  }
  for (const auto& party : extract::array_at(release, {"parties"})) {
    if (extract::scalar_at(&party, {"id"}) == buyer_id) {
      return &party;
    }
  }
  return nullptr;
}

// Parties whose role set contains "supplier", in document order
json find_supplier_parties(const json* release) {
  json suppliers = json::array();
  for (const auto& party : extract::array_at(release, {"parties"})) {
    if (extract::array_contains(extract::lookup(party, {"roles"}), "supplier")) {
      suppliers.push_back(party);
    }
  }
  return suppliers;
}

// Document sub-objects flatten into independently joined columns
void set_document_columns(NoticeRecord& rec, const std::string& prefix, const json& documents,
                          const bool with_date_modified) {
  rec.set(prefix + "_ids", join_column(documents, {"id"}));
  rec.set(prefix + "_types", join_column(documents, {"documentType"}));
  rec.set(prefix + "_descriptions", join_column(documents, {"description"}));
  rec.set(prefix + "_urls", join_column(documents, {"url"}));
  rec.set(prefix + "_datePublished", join_column(documents, {"datePublished"}));
  if (with_date_modified) {
    rec.set(prefix + "_dateModified", join_column(documents, {"dateModified"}));
  }
  rec.set(prefix + "_formats", join_column(documents, {"format"}));
  rec.set(prefix + "_languages", join_column(documents, {"language"}));
}

struct DeliveryLocation {
  FieldValue postal_code;
  FieldValue region;
  FieldValue country;
};

// First non-empty postal code / region / country among the first item's delivery addresses
DeliveryLocation first_item_delivery(const json* tender) {
  DeliveryLocation location;
  const json* first_item = extract::first_element(extract::lookup(tender, {"items"}));

  for (const auto& address : extract::array_at(first_item, {"deliveryAddresses"})) {
    if (!address.is_object()) {
      continue;
    }
    auto fill = [&address](FieldValue& slot, const std::string_view key) {
      if (slot.has_value()) {
        return;
      }
      auto value = extract::scalar_at(&address, {key});
      if (value.has_value() && !value->empty()) {
        slot = std::move(value);
      }
    };
    fill(location.postal_code, "postalCode");
    fill(location.region, "region");
    fill(location.country, "countryName");
  }

  return location;
}

// Join one address component across every item's delivery addresses
FieldValue join_delivery_component(const json& items, const std::string_view key) {
  std::vector<std::optional<std::string>> values;
  for (const auto& item : items) {
    for (const auto& address : extract::array_at(&item, {"deliveryAddresses"})) {
      values.push_back(extract::scalar_at(&address, {key}));
    }
  }
  return extract::join_ordered_json(values);
}

// Flattened, de-duplicated role list across parties
FieldValue join_roles(const json& parties) {
  std::vector<std::optional<std::string>> roles;
  for (const auto& party : parties) {
    for (const auto& role : extract::array_at(&party, {"roles"})) {
      roles.push_back(extract::scalar(&role));
    }
  }
  return extract::join_ordered_json(roles);
}

FieldValue row_index_value(const ReleaseSource& source) {
  if (!source.row_index.has_value()) {
    return std::nullopt;
  }
  return std::to_string(source.row_index.value());
}

}  // namespace

NoticeRecord OcdsReleaseAdapter::failure_record(const ReleaseSource& source,
                                                const record::RecordStatus status) {
  NoticeRecord rec;
  rec.set("csv_file", source.csv_file);
  rec.set("row_index", row_index_value(source));
  rec.set("uri", source.uri);
  rec.set("publishedDate", std::nullopt);
  rec.set("status", record::record_status_to_string(status));
  return rec;
}

NoticeRecord OcdsReleaseAdapter::extract_text(const std::string_view json_text,
                                              const ReleaseSource& source) const {
  const json package = json::parse(json_text, nullptr, /*allow_exceptions=*/false);
  if (package.is_discarded()) {
    return failure_record(source, record::RecordStatus::kFetchFailedOrInvalid);
  }
  return extract(package, source);
}

NoticeRecord OcdsReleaseAdapter::extract(const json& package, const ReleaseSource& source) const {
  if (!package.is_object()) {
    return failure_record(source, record::RecordStatus::kFetchFailedOrInvalid);
  }

  const json* root = &package;
  const json* release = extract::first_element(extract::lookup(root, {"releases"}));
  const json* planning = extract::lookup(release, {"planning"});
  const json* tender = extract::lookup(release, {"tender"});
  const json* award = extract::first_element(extract::lookup(release, {"awards"}));
  const json* buyer_party = find_buyer_party(release);
  const json suppliers = find_supplier_parties(release);
  const json* tender_notice = find_document(extract::lookup(tender, {"documents"}), "tenderNotice");
  const json* award_notice = find_document(extract::lookup(award, {"documents"}), "awardNotice");

  const json& tags = extract::array_at(release, {"tag"});
  const json& milestones = extract::array_at(planning, {"milestones"});
  const json& items = extract::array_at(tender, {"items"});
  const json& additional_classifications = extract::array_at(tender, {"additionalClassifications"});
  const DeliveryLocation delivery = first_item_delivery(tender);

  NoticeRecord rec;

  // bookkeeping
  rec.set("csv_file", source.csv_file);
  rec.set("row_index", row_index_value(source));
  rec.set("status", record::record_status_to_string(record::RecordStatus::kOk));

  // identification
  // An empty package uri counts as absent
  const record::FieldValue package_uri = extract::scalar_at(root, {"uri"});
  rec.set("uri", package_uri.has_value() && !package_uri->empty() ? *package_uri : source.uri);
  rec.set("publishedDate", extract::scalar_at(root, {"publishedDate"}));
  rec.set("ocid", extract::scalar_at(release, {"ocid"}));
  rec.set("release_id", extract::scalar_at(release, {"id"}));
  rec.set("release_title", extract::scalar_at(release, {"title"}));
  rec.set("release_date", extract::scalar_at(release, {"date"}));
  rec.set("release_language", extract::scalar_at(release, {"language"}));
  rec.set("release_tag", extract::scalar(extract::first_element(&tags)));
  rec.set("release_tags_all", join_scalars(tags));
  rec.set("initiationType", extract::scalar_at(release, {"initiationType"}));

  // planning
  rec.set("planning_milestone_ids", join_column(milestones, {"id"}));
  rec.set("planning_milestone_titles", join_column(milestones, {"title"}));
  rec.set("planning_milestone_types", join_column(milestones, {"type"}));
  rec.set("planning_milestone_dueDates", join_column(milestones, {"dueDate"}));
  set_document_columns(rec, "planning_document", extract::array_at(planning, {"documents"}),
                       /*with_date_modified=*/false);

  // publisher / meta
  rec.set("publisher_name", extract::scalar_at(root, {"publisher", "name"}));
  rec.set("publisher_scheme", extract::scalar_at(root, {"publisher", "scheme"}));
  rec.set("publisher_uid", extract::scalar_at(root, {"publisher", "uid"}));
  rec.set("publisher_uri", extract::scalar_at(root, {"publisher", "uri"}));
  rec.set("version", extract::scalar_at(root, {"version"}));
  rec.set("extensions", join_scalars(extract::array_at(root, {"extensions"})));
  rec.set("license", extract::scalar_at(root, {"license"}));
  rec.set("publicationPolicy", extract::scalar_at(root, {"publicationPolicy"}));

  // tender basics
  rec.set("tender_id", extract::scalar_at(tender, {"id"}));
  rec.set("tender_title", extract::scalar_at(tender, {"title"}));
  rec.set("tender_description", extract::scalar_at(tender, {"description"}));
  rec.set("tender_status", extract::scalar_at(tender, {"status"}));
  rec.set("mainProcurementCategory", extract::scalar_at(tender, {"mainProcurementCategory"}));

  // value
  rec.set("value_amount", extract::scalar_at(tender, {"value", "amount"}));
  rec.set("value_currency", extract::scalar_at(tender, {"value", "currency"}));
  rec.set("minValue_amount", extract::scalar_at(tender, {"minValue", "amount"}));
  rec.set("minValue_currency", extract::scalar_at(tender, {"minValue", "currency"}));

  // CPV
  rec.set("cpv_scheme", extract::scalar_at(tender, {"classification", "scheme"}));
  rec.set("cpv_id", extract::scalar_at(tender, {"classification", "id"}));
  rec.set("cpv_description", extract::scalar_at(tender, {"classification", "description"}));
  rec.set("additional_cpv_ids", join_column(additional_classifications, {"id"}));
  rec.set("additional_cpv_descriptions", join_column(additional_classifications, {"description"}));
  set_document_columns(rec, "tender_document", extract::array_at(tender, {"documents"}),
                       /*with_date_modified=*/true);

  // geography
  rec.set("tender_item_ids", join_column(items, {"id"}));
  rec.set("tender_delivery_postalCodes_all", join_delivery_component(items, "postalCode"));
  rec.set("tender_delivery_regions_all", join_delivery_component(items, "region"));
  rec.set("tender_delivery_countryNames_all", join_delivery_component(items, "countryName"));
  rec.set("delivery_postalCode", delivery.postal_code);
  rec.set("delivery_region", delivery.region);
  rec.set("delivery_country", delivery.country);

  // timing
  rec.set("tender_datePublished", extract::scalar_at(tender, {"datePublished"}));
  rec.set("tender_endDate", extract::scalar_at(tender, {"tenderPeriod", "endDate"}));
  rec.set("contract_startDate", extract::scalar_at(tender, {"contractPeriod", "startDate"}));
  rec.set("contract_endDate", extract::scalar_at(tender, {"contractPeriod", "endDate"}));

  // method / SME flags
  rec.set("procurementMethod", extract::scalar_at(tender, {"procurementMethod"}));
  rec.set("procurementMethodDetails", extract::scalar_at(tender, {"procurementMethodDetails"}));
  rec.set("suitability_sme", extract::scalar_at(tender, {"suitability", "sme"}));
  rec.set("suitability_vcse", extract::scalar_at(tender, {"suitability", "vcse"}));

  // buyer: pointer fields from release.buyer, projection fields from the matched party
  rec.set("buyer_id", extract::scalar_at(release, {"buyer", "id"}));
  rec.set("buyer_name", extract::scalar_at(release, {"buyer", "name"}));
  rec.set("buyer_legalName", extract::scalar_at(buyer_party, {"identifier", "legalName"}));
  rec.set("buyer_identifier_scheme", extract::scalar_at(buyer_party, {"identifier", "scheme"}));
  rec.set("buyer_identifier_id", extract::scalar_at(buyer_party, {"identifier", "id"}));
  rec.set("buyer_streetAddress", extract::scalar_at(buyer_party, {"address", "streetAddress"}));
  rec.set("buyer_locality", extract::scalar_at(buyer_party, {"address", "locality"}));
  rec.set("buyer_postalCode", extract::scalar_at(buyer_party, {"address", "postalCode"}));
  rec.set("buyer_countryName", extract::scalar_at(buyer_party, {"address", "countryName"}));
  rec.set("buyer_contact_name", extract::scalar_at(buyer_party, {"contactPoint", "name"}));
  rec.set("buyer_contact_email", extract::scalar_at(buyer_party, {"contactPoint", "email"}));
  rec.set("buyer_contact_telephone",
          extract::scalar_at(buyer_party, {"contactPoint", "telephone"}));
  rec.set("buyer_details_url", extract::scalar_at(buyer_party, {"details", "url"}));
  rec.set("buyer_roles", join_scalars(extract::array_at(buyer_party, {"roles"})));

  // supplier parties (document-global party list, role "supplier")
  rec.set("supplier_party_ids", join_column(suppliers, {"id"}));
  rec.set("supplier_party_names", join_column(suppliers, {"name"}));
  rec.set("supplier_legalNames", join_column(suppliers, {"identifier", "legalName"}));
  rec.set("supplier_identifier_schemes", join_column(suppliers, {"identifier", "scheme"}));
  rec.set("supplier_identifier_ids", join_column(suppliers, {"identifier", "id"}));
  rec.set("supplier_streetAddresses", join_column(suppliers, {"address", "streetAddress"}));
  rec.set("supplier_localities", join_column(suppliers, {"address", "locality"}));
  rec.set("supplier_postalCodes", join_column(suppliers, {"address", "postalCode"}));
  rec.set("supplier_countryNames", join_column(suppliers, {"address", "countryName"}));
  rec.set("supplier_scales", join_column(suppliers, {"details", "scale"}));
  rec.set("supplier_vcse_flags", join_column(suppliers, {"details", "vcse"}));
  rec.set("supplier_details_urls", join_column(suppliers, {"details", "url"}));
  rec.set("supplier_roles", join_roles(suppliers));

  // links
  rec.set("tender_notice_url", extract::scalar_at(tender_notice, {"url"}));
  rec.set("tender_notice_description", extract::scalar_at(tender_notice, {"description"}));

  // award-level fields (first award only)
  const json& award_suppliers = extract::array_at(award, {"suppliers"});
  rec.set("award_id", extract::scalar_at(award, {"id"}));
  rec.set("award_status", extract::scalar_at(award, {"status"}));
  rec.set("award_date", extract::scalar_at(award, {"date"}));
  rec.set("award_datePublished", extract::scalar_at(award, {"datePublished"}));
  rec.set("award_value_amount", extract::scalar_at(award, {"value", "amount"}));
  rec.set("award_value_currency", extract::scalar_at(award, {"value", "currency"}));
  rec.set("award_contract_startDate", extract::scalar_at(award, {"contractPeriod", "startDate"}));
  rec.set("award_contract_endDate", extract::scalar_at(award, {"contractPeriod", "endDate"}));
  rec.set("award_suppliers_ids", join_column(award_suppliers, {"id"}));
  rec.set("award_suppliers_names", join_column(award_suppliers, {"name"}));
  rec.set("award_notice_url", extract::scalar_at(award_notice, {"url"}));
  rec.set("award_notice_description", extract::scalar_at(award_notice, {"description"}));
  rec.set("award_notice_datePublished", extract::scalar_at(award_notice, {"datePublished"}));
  rec.set("award_notice_format", extract::scalar_at(award_notice, {"format"}));
  rec.set("award_notice_language", extract::scalar_at(award_notice, {"language"}));
  set_document_columns(rec, "award_document", extract::array_at(award, {"documents"}),
                       /*with_date_modified=*/true);

  return rec;
}

}  // namespace pnn::adapters
