#pragma once

#include <optional>
#include "util/Pattern.hpp"
#include "util/Utf8.hpp"

namespace relite::util {

// Bottom-up full-match decision table.
//
// table[i][j] is true when the first i atoms account for exactly the
// first j codepoints of the text. Rows are built in order of atom-prefix
// length and only two rows of T+1 cells are kept, so each (i, j) pair is
// evaluated once: O(P*T) time, O(T) space, no backtracking.
//
// An invalid pattern (nullopt) matches nothing, not even empty text.
[[nodiscard]] bool matches(const std::optional<Pattern>& pattern, const CodePoints& text);

} // namespace relite::util
