#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace relite::util {

// Matching strategy. Both give identical answers in O(P*T).
enum class Engine : uint8_t { TABLE, STATE_SET };

// Does the entire `text` match the entire `pattern`?
//
// Pattern syntax:
//   .   any single codepoint
//   *   zero or more of the previous atom
//   anything else matches itself
//
// Both arguments are UTF-8 and are compared codepoint by codepoint.
// Invalid patterns ("*a", "a**") and malformed UTF-8 yield false.
// Pure function; safe to call concurrently.
[[nodiscard]] bool is_match(std::string_view pattern, std::string_view text);
[[nodiscard]] bool is_match(std::string_view pattern, std::string_view text, Engine engine);

[[nodiscard]] std::optional<Engine> engine_from_string(std::string_view name);
[[nodiscard]] const char* engine_name(Engine engine);

} // namespace relite::util
