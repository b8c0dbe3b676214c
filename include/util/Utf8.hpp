#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace relite::util {

using CodePoints = std::vector<uint32_t>;

// Decode one UTF-8 codepoint. Returns bytes consumed (0 on error).
// Rejects truncated sequences, stray continuation bytes, overlong forms,
// UTF-16 surrogates and values above U+10FFFF.
int decode_utf8(const char* s, size_t len, uint32_t* cp);

// Decode a whole string. nullopt if any sequence is malformed.
[[nodiscard]] std::optional<CodePoints> to_codepoints(std::string_view s);

// Byte offset of the first malformed sequence, or nullopt for valid input.
[[nodiscard]] std::optional<size_t> malformed_offset(std::string_view s);

} // namespace relite::util
