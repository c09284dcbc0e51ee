#include "pnn/record/record_json.h"

#include <catch2/catch_test_macros.hpp>

using namespace pnn::record;

TEST_CASE("record_to_json_string preserves column order and nulls", "[record][record_json]") {
  NoticeRecord rec;
  rec.set("schema_type", "UK7_2023");
  rec.set("doc_id", std::nullopt);
  rec.set("ca_name", "Council \"A\"");

  REQUIRE(record_to_json_string(rec) ==
          R"({"schema_type":"UK7_2023","doc_id":null,"ca_name":"Council \"A\""})");
}

TEST_CASE("record_from_json reads stored rows back", "[record][record_json]") {
  NoticeRecord rec;
  rec.set("uri", "https://example.org/release.json");
  rec.set("row_index", "12");
  rec.set("publishedDate", std::nullopt);

  const auto restored = record_from_json(record_to_json(rec));

  REQUIRE(restored == rec);
}

TEST_CASE("record_from_json keeps non-string scalars lexically", "[record][record_json]") {
  const auto j = nlohmann::ordered_json::parse(R"({"amount": 1200.5, "sme": true, "nested": {"a": 1}})");

  const auto rec = record_from_json(j);

  REQUIRE(rec.get("amount") == "1200.5");
  REQUIRE(rec.get("sme") == "true");
  REQUIRE_FALSE(rec.contains("nested"));
}

TEST_CASE("record_from_json ignores non-objects", "[record][record_json]") {
  REQUIRE(record_from_json(nlohmann::ordered_json::array()).empty());
}
