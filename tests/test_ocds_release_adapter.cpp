#include "pnn/adapters/ocds_release_adapter.h"

#include <catch2/catch_test_macros.hpp>

using namespace pnn::adapters;
using nlohmann::json;

namespace {

ReleaseSource make_source() {
  ReleaseSource source;
  source.csv_file = "notices_2024_01.csv";
  source.row_index = 7;
  source.uri = "https://www.contractsfinder.service.gov.uk/Published/Notice/releases/abc.json";
  return source;
}

const char* kMinimalPackage = R"({
  "uri": "https://www.contractsfinder.service.gov.uk/Published/Notice/releases/abc.json",
  "publishedDate": "2024-01-15T09:00:00Z",
  "publisher": {"name": "Crown Commercial Service"},
  "releases": [{
    "ocid": "ocds-b5fd17-abc",
    "id": "release-1",
    "tag": ["award", "contract", "award"],
    "buyer": {"id": "B1", "name": "Example Council"},
    "parties": [
      {"id": "B1", "name": "Example Council", "roles": ["buyer"],
       "identifier": {"legalName": "Example Borough Council", "scheme": "GB-LAC"},
       "address": {"locality": "Leeds", "postalCode": "LS1 1AA"}},
      {"id": "S1", "name": "Supplier One", "roles": ["supplier"],
       "details": {"scale": "sme"}}
    ],
    "tender": {
      "title": "Grounds maintenance",
      "value": {"amount": 25000, "currency": "GBP"},
      "items": [
        {"id": "1", "deliveryAddresses": [{"region": ""}, {"region": "Yorkshire", "postalCode": "LS1"}]},
        {"id": "2", "deliveryAddresses": [{"region": "North East"}, {"region": "Yorkshire"}]}
      ],
      "documents": [
        {"id": "d1", "documentType": "tenderNotice", "url": "https://example.org/tn"}
      ]
    },
    "awards": [
      {"id": "A1", "suppliers": [{"id": "S1", "name": "Supplier One"}],
       "documents": [{"id": "ad1", "documentType": "awardNotice", "url": "https://example.org/an",
                      "dateModified": "2024-01-16"}]},
      {"id": "A2", "suppliers": [{"id": "S9", "name": "Ignored"}]}
    ]
  }, {
    "ocid": "ocds-b5fd17-abc", "id": "release-2"
  }]
})";

}  // namespace

TEST_CASE("minimal release resolves buyer, suppliers and award suppliers", "[adapters][ocds_release]") {
  const auto rec = OcdsReleaseAdapter().extract(json::parse(kMinimalPackage), make_source());

  REQUIRE(rec.get("status") == "ok");
  REQUIRE(rec.get("buyer_id") == "B1");
  REQUIRE(rec.get("buyer_legalName") == "Example Borough Council");
  REQUIRE(rec.get("buyer_locality") == "Leeds");
  REQUIRE(rec.get("supplier_party_ids") == "S1");
  REQUIRE(rec.get("supplier_scales") == "sme");
  REQUIRE(rec.get("award_suppliers_ids") == "S1");
  REQUIRE(rec.get("award_suppliers_names") == "Supplier One");
}

TEST_CASE("only the first release and first award are projected", "[adapters][ocds_release]") {
  const auto rec = OcdsReleaseAdapter().extract(json::parse(kMinimalPackage), make_source());

  REQUIRE(rec.get("release_id") == "release-1");
  REQUIRE(rec.get("award_id") == "A1");
  REQUIRE(rec.get("award_notice_url") == "https://example.org/an");
  REQUIRE(rec.get("award_document_dateModified") == "2024-01-16");
}

TEST_CASE("release bookkeeping and scalar rendering", "[adapters][ocds_release]") {
  const auto rec = OcdsReleaseAdapter().extract(json::parse(kMinimalPackage), make_source());

  REQUIRE(rec.fields().front().first == "csv_file");
  REQUIRE(rec.get("csv_file") == "notices_2024_01.csv");
  REQUIRE(rec.get("row_index") == "7");
  REQUIRE(rec.get("publishedDate") == "2024-01-15T09:00:00Z");
  REQUIRE(rec.get("publisher_name") == "Crown Commercial Service");
  REQUIRE(rec.get("value_amount") == "25000");
  REQUIRE(rec.get("release_tag") == "award");
  REQUIRE(rec.get("release_tags_all") == "award|contract");
  REQUIRE(rec.get("tender_notice_url") == "https://example.org/tn");
}

TEST_CASE("delivery locations keep first value and join all", "[adapters][ocds_release]") {
  const auto rec = OcdsReleaseAdapter().extract(json::parse(kMinimalPackage), make_source());

  REQUIRE(rec.get("delivery_region") == "Yorkshire");
  REQUIRE(rec.get("delivery_postalCode") == "LS1");
  REQUIRE_FALSE(rec.get("delivery_country").has_value());
  REQUIRE(rec.get("tender_delivery_regions_all") == "Yorkshire|North East");
  REQUIRE(rec.get("tender_item_ids") == "1|2");
}

TEST_CASE("buyer fields are none when no party matches the buyer id", "[adapters][ocds_release]") {
  auto package = json::parse(kMinimalPackage);
  package["releases"][0]["buyer"]["id"] = "B404";

  const auto rec = OcdsReleaseAdapter().extract(package, make_source());

  REQUIRE(rec.get("buyer_id") == "B404");
  REQUIRE_FALSE(rec.get("buyer_legalName").has_value());
  REQUIRE_FALSE(rec.get("buyer_locality").has_value());
  REQUIRE_FALSE(rec.get("buyer_roles").has_value());
}

TEST_CASE("empty package degrades every field to none", "[adapters][ocds_release]") {
  const auto rec = OcdsReleaseAdapter().extract(json::object(), make_source());
  const auto full = OcdsReleaseAdapter().extract(json::parse(kMinimalPackage), make_source());

  REQUIRE(rec.get("status") == "ok");
  REQUIRE(rec.size() == full.size());
  REQUIRE_FALSE(rec.get("ocid").has_value());
  REQUIRE_FALSE(rec.get("award_suppliers_ids").has_value());
  REQUIRE(rec.get("uri") == make_source().uri);
}

TEST_CASE("empty package uri falls back to the source uri", "[adapters][ocds_release]") {
  auto package = json::parse(kMinimalPackage);
  package["uri"] = "";

  const auto rec = OcdsReleaseAdapter().extract(package, make_source());

  REQUIRE(rec.get("uri") == make_source().uri);
}

TEST_CASE("wrongly-typed links never throw", "[adapters][ocds_release]") {
  const auto package = json::parse(
      R"({"releases": [{"tender": "n/a", "parties": {"id": "B1"}, "awards": [null], "buyer": 5}]})");

  const auto rec = OcdsReleaseAdapter().extract(package, make_source());

  REQUIRE(rec.get("status") == "ok");
  REQUIRE_FALSE(rec.get("tender_title").has_value());
  REQUIRE_FALSE(rec.get("supplier_party_ids").has_value());
  REQUIRE_FALSE(rec.get("award_id").has_value());
}

TEST_CASE("unparseable text yields a failure record", "[adapters][ocds_release]") {
  const auto rec = OcdsReleaseAdapter().extract_text("{not json", make_source());

  REQUIRE(rec.size() == 5);
  REQUIRE(rec.get("status") == "fetch_failed_or_invalid_json");
  REQUIRE(rec.get("uri") == make_source().uri);
  REQUIRE(rec.get("row_index") == "7");
  REQUIRE_FALSE(rec.get("publishedDate").has_value());
}

TEST_CASE("failure record carries the requested status", "[adapters][ocds_release]") {
  const auto rec = OcdsReleaseAdapter::failure_record(make_source(),
                                                      pnn::record::RecordStatus::kDuplicateSkipped);

  REQUIRE(rec.get("status") == "duplicate_uri_skipped_fetch");
  REQUIRE(rec.get("csv_file") == "notices_2024_01.csv");
}
