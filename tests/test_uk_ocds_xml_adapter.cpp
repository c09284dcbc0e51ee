#include "pnn/adapters/uk_ocds_xml_adapter.h"

#include <catch2/catch_test_macros.hpp>

#include <pugixml.hpp>

#include <string>

using namespace pnn::adapters;

namespace {

constexpr const char* kUk7AwardNotice = R"(<?xml version="1.0" encoding="UTF-8"?>
<NOTICE>
  <NOTICE_DATA>
    <NO_DOC_EXT>2024/S 000-001234</NO_DOC_EXT>
    <URI_DOC>https://www.find-tender.service.gov.uk/Notice/001234-2024</URI_DOC>
    <PUBLISHED>2024-03-01T10:00:00Z</PUBLISHED>
  </NOTICE_DATA>
  <FORM_SECTION>
    <UK7_2023>
      <id>001234-2024</id>
      <date>2024-02-28T09:00:00Z</date>
      <tag>award</tag>
      <tag>contract</tag>
      <parties>
        <name>Example NHS Trust</name>
        <roles>buyer</roles>
        <address>
          <locality>Leeds</locality>
          <postalCode>LS1 1AA</postalCode>
          <country>GB</country>
          <region>UKE42</region>
        </address>
        <details><url>https://trust.example.nhs.uk</url></details>
      </parties>
      <parties>
        <name>Second Buyer</name>
        <roles>buyer</roles>
      </parties>
      <parties>
        <name>Form Supplier Ltd</name>
        <roles>supplier</roles>
        <roles>tenderer</roles>
      </parties>
      <tender>
        <title>Cleaning services</title>
        <description>Hospital cleaning contract</description>
      </tender>
      <awards>
        <mainProcurementCategory>services</mainProcurementCategory>
        <suppliers><name>Award Supplier plc</name></suppliers>
        <parties>
          <name>Form Supplier Ltd</name>
          <roles>supplier</roles>
        </parties>
        <items>
          <additionalClassifications><scheme>CPV</scheme><id>90910000</id></additionalClassifications>
          <additionalClassifications><scheme>OTHER</scheme><id>X1</id></additionalClassifications>
          <additionalClassifications><scheme>CPV</scheme><id>90911200</id></additionalClassifications>
          <deliveryAddresses><region>UKE42</region></deliveryAddresses>
          <deliveryAddresses><region>UKE41</region></deliveryAddresses>
        </items>
      </awards>
      <awards>
        <mainProcurementCategory>works</mainProcurementCategory>
        <items>
          <additionalClassifications><scheme>CPV</scheme><id>90911200</id></additionalClassifications>
          <deliveryAddresses><region>UKE42</region></deliveryAddresses>
        </items>
      </awards>
    </UK7_2023>
  </FORM_SECTION>
</NOTICE>)";

constexpr const char* kUk2PlanningNotice = R"(<NOTICE>
  <FORM_SECTION>
    <UK2_2023>
      <id>ocds-h6vhtk-0abc12</id>
      <date>2024-01-05</date>
      <tag>planning</tag>
      <buyer><name>Pointer-only Council</name></buyer>
    </UK2_2023>
  </FORM_SECTION>
</NOTICE>)";

pnn::record::NoticeRecord extract_from(const char* xml, const std::string& form_tag) {
  pugi::xml_document doc;
  REQUIRE(doc.load_string(xml));
  return UkOcdsXmlAdapter(form_tag).extract(doc.document_element());
}

}  // namespace

TEST_CASE("UK7 award form tagged award is a contract award", "[adapters][uk_xml]") {
  const auto rec = extract_from(kUk7AwardNotice, "UK7_2023");

  REQUIRE(rec.get("schema_type") == "UK7_2023");
  REQUIRE(rec.get("form_type") == "UK7");
  REQUIRE(rec.get("td_document_type_code") == "UK7");
  REQUIRE(rec.get("notice_type_group") == "CONTRACT_AWARD");
}

TEST_CASE("UK identification prefers NOTICE_DATA", "[adapters][uk_xml]") {
  const auto rec = extract_from(kUk7AwardNotice, "UK7_2023");

  // DOC_ID is absent from NOTICE_DATA, so the form id is used
  REQUIRE(rec.get("doc_id") == "001234-2024");
  REQUIRE(rec.get("no_doc_ojs") == "2024/S 000-001234");
  REQUIRE(rec.get("notice_url") == "https://www.find-tender.service.gov.uk/Notice/001234-2024");
  REQUIRE(rec.get("date_pub") == "2024-03-01T10:00:00Z");
  REQUIRE_FALSE(rec.get("edition").has_value());
}

TEST_CASE("UK buyer is the first party with the buyer role", "[adapters][uk_xml]") {
  const auto rec = extract_from(kUk7AwardNotice, "UK7_2023");

  REQUIRE(rec.get("ca_name") == "Example NHS Trust");
  REQUIRE(rec.get("ca_town") == "Leeds");
  REQUIRE(rec.get("ti_town") == "Leeds");
  REQUIRE(rec.get("ca_postcode") == "LS1 1AA");
  REQUIRE(rec.get("ca_country_code") == "GB");
  REQUIRE(rec.get("iso_country") == "GB");
  REQUIRE(rec.get("ca_nuts_code") == "UKE42");
  REQUIRE(rec.get("ca_url") == "https://trust.example.nhs.uk");
}

TEST_CASE("UK suppliers from form and award levels are merged", "[adapters][uk_xml]") {
  const auto rec = extract_from(kUk7AwardNotice, "UK7_2023");

  REQUIRE(rec.get("contractor_names") == "Award Supplier plc;Form Supplier Ltd");
}

TEST_CASE("UK CPV codes and delivery regions come from award items", "[adapters][uk_xml]") {
  const auto rec = extract_from(kUk7AwardNotice, "UK7_2023");

  REQUIRE(rec.get("cpv_main_code") == "90910000");
  REQUIRE(rec.get("original_cpv_code") == "90910000");
  REQUIRE(rec.get("additional_cpv_codes") == "90911200");
  REQUIRE(rec.get("perf_nuts_code") == "UKE41;UKE42");
}

TEST_CASE("UK contract type uses the first award's category", "[adapters][uk_xml]") {
  const auto rec = extract_from(kUk7AwardNotice, "UK7_2023");

  REQUIRE(rec.get("type_contract_ctype") == "SERVICES");
  REQUIRE(rec.get("obj_title") == "Cleaning services");
  REQUIRE(rec.get("ti_text") == "Cleaning services");
  REQUIRE(rec.get("short_descr") == "Hospital cleaning contract");
}

TEST_CASE("UK planning notice with a bare buyer element", "[adapters][uk_xml]") {
  const auto rec = extract_from(kUk2PlanningNotice, "UK2_2023");

  REQUIRE(rec.get("notice_type_group") == "PLANNING");
  REQUIRE(rec.get("ca_name") == "Pointer-only Council");
  REQUIRE_FALSE(rec.get("ca_town").has_value());
  REQUIRE(rec.get("doc_id") == "ocds-h6vhtk-0abc12");
  REQUIRE(rec.get("date_pub") == "2024-01-05");
  REQUIRE_FALSE(rec.get("cpv_main_code").has_value());
  REQUIRE_FALSE(rec.get("additional_cpv_codes").has_value());
  REQUIRE_FALSE(rec.get("contractor_names").has_value());
  REQUIRE(rec.size() == 45);
}

TEST_CASE("UK award tag on a non-award form is not an award", "[adapters][uk_xml]") {
  const auto rec = extract_from(
      "<NOTICE><UK4_2023><tag>award</tag></UK4_2023></NOTICE>", "UK4_2023");

  REQUIRE(rec.get("notice_type_group") == "OTHER");
}

TEST_CASE("UK adapter without its form element returns identification only", "[adapters][uk_xml]") {
  const auto rec = extract_from(
      "<NOTICE><NOTICE_DATA><DOC_ID>D-1</DOC_ID></NOTICE_DATA></NOTICE>", "UK1_2022");

  REQUIRE(rec.get("schema_type") == "UK1_2022");
  REQUIRE(rec.get("form_type") == "UK1_2022");
  REQUIRE(rec.get("notice_type_group") == "OTHER");
  REQUIRE(rec.get("doc_id") == "D-1");
  REQUIRE_FALSE(rec.contains("contractor_names"));
}
