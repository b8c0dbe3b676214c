#include "util/MatchTable.hpp"
#include <utility>
#include <vector>

namespace relite::util {

bool matches(const std::optional<Pattern>& pattern, const CodePoints& text) {
    if (!pattern) return false;

    const auto& atoms = pattern->atoms;
    const size_t T = text.size();

    // Row 0: the empty pattern accounts only for the empty text.
    // uint8_t rather than bool so cells are addressable bytes.
    std::vector<uint8_t> prev(T + 1, 0), cur(T + 1, 0);
    prev[0] = 1;

    for (const Atom& a : atoms) {
        // Column 0: true while every atom so far is repeatable.
        cur[0] = prev[0] && a.repeatable;
        bool any = cur[0] != 0;

        if (a.repeatable) {
            // Zero uses here (prev[j]) or one more codepoint with the
            // atom still available (cur[j-1]).
            for (size_t j = 1; j <= T; ++j) {
                cur[j] = prev[j] || (cur[j - 1] && a.accepts(text[j - 1]));
                any |= cur[j] != 0;
            }
        } else {
            for (size_t j = 1; j <= T; ++j) {
                cur[j] = prev[j - 1] && a.accepts(text[j - 1]);
                any |= cur[j] != 0;
            }
        }

        // No text prefix is reachable any more; later rows stay false.
        if (!any) return false;
        std::swap(prev, cur);
    }

    return prev[T] != 0;
}

} // namespace relite::util
