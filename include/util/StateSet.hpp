#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include "util/Pattern.hpp"
#include "util/Utf8.hpp"

namespace relite::util {

// Parallel simulation over atom positions.
// State k (0..P) = "first k atoms accounted for". A repeatable atom at k
// makes k+1 reachable without input. All live states advance together on
// each codepoint, so no position pair is visited twice: O(P*T) time,
// O(P) space.
class StateSet {
public:
    // Borrows the pattern's atoms; the pattern must outlive the StateSet.
    explicit StateSet(const Pattern& pattern);
    explicit StateSet(Pattern&&) = delete;

    // Does the entire text drive the start state into the accept state?
    [[nodiscard]] bool full_match(const CodePoints& text) const;

private:
    using Bits = std::vector<uint64_t>;

    void closure(Bits& set) const;
    void step(const Bits& cur, Bits& next, uint32_t c) const;
    [[nodiscard]] bool accepting(const Bits& set) const { return test_bit(set, (int)atoms_.size()); }

    static void set_bit(Bits& set, int s)  { set[s >> 6] |= (1ULL << (s & 63)); }
    static bool test_bit(const Bits& set, int s) { return (set[s >> 6] & (1ULL << (s & 63))) != 0; }
    static void clear_set(Bits& set) { for (auto& w : set) w = 0; }
    static bool empty_set(const Bits& set) {
        for (auto w : set) if (w) return false;
        return true;
    }

    const std::vector<Atom>& atoms_;
    size_t words_;
};

// Same contract as matches() in MatchTable.hpp.
[[nodiscard]] bool matches_state_set(const std::optional<Pattern>& pattern, const CodePoints& text);

} // namespace relite::util
