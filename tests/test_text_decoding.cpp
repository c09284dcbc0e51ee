#include "pnn/ingest/text_decoding.h"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace pnn::ingest;

namespace {

std::vector<uint8_t> bytes_of(const std::string& s) {
  return std::vector<uint8_t>(s.begin(), s.end());
}

}  // namespace

TEST_CASE("valid UTF-8 passes through unchanged", "[ingest][text_decoding]") {
  const std::string text = "<NAME>Caf\xC3\xA9 \xE2\x82\xAC</NAME>";

  REQUIRE(is_valid_utf8(text));
  REQUIRE(decode_notice_bytes(bytes_of(text)) == text);
}

TEST_CASE("invalid UTF-8 is decoded as Latin-1", "[ingest][text_decoding]") {
  // 0xE9 is e-acute in Latin-1 and an incomplete sequence in UTF-8
  const std::string latin1 = "<NAME>Caf\xE9</NAME>";

  REQUIRE_FALSE(is_valid_utf8(latin1));
  REQUIRE(decode_notice_bytes(bytes_of(latin1)) == "<NAME>Caf\xC3\xA9</NAME>");
}

TEST_CASE("overlong and surrogate encodings are rejected", "[ingest][text_decoding]") {
  REQUIRE_FALSE(is_valid_utf8("\xC0\xAF"));
  REQUIRE_FALSE(is_valid_utf8("\xE0\x80\xAF"));
  REQUIRE_FALSE(is_valid_utf8("\xED\xA0\x80"));
  REQUIRE_FALSE(is_valid_utf8("\xF4\x90\x80\x80"));
  REQUIRE(is_valid_utf8("\xF0\x9F\x98\x80"));
}

TEST_CASE("latin1_to_utf8 maps high bytes to two-byte sequences", "[ingest][text_decoding]") {
  REQUIRE(latin1_to_utf8("\xA3" "5") == "\xC2\xA3" "5");
  REQUIRE(latin1_to_utf8("") == "");
  REQUIRE(decode_notice_bytes({}).empty());
}
