#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pnn::ingest {

/// True when bytes form well-formed UTF-8 (no overlongs, surrogates or values above U+10FFFF)
[[nodiscard]] bool is_valid_utf8(std::string_view bytes);

/// Re-encode Latin-1 bytes as UTF-8. Every byte maps to the code point of the same value.
[[nodiscard]] std::string latin1_to_utf8(std::string_view bytes);

/// Decode raw notice bytes to UTF-8 text: valid UTF-8 is kept as-is, anything else is
/// read as Latin-1.
[[nodiscard]] std::string decode_notice_bytes(const std::vector<uint8_t>& data);

}  // namespace pnn::ingest
