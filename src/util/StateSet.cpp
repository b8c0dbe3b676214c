#include "util/StateSet.hpp"
#include <utility>

namespace relite::util {

StateSet::StateSet(const Pattern& pattern)
    : atoms_(pattern.atoms), words_(pattern.atoms.size() / 64 + 1) {}

// States only ever reach forward, so one ascending pass is a full closure.
void StateSet::closure(Bits& set) const {
    for (int k = 0; k < (int)atoms_.size(); ++k) {
        if (test_bit(set, k) && atoms_[k].repeatable)
            set_bit(set, k + 1);
    }
}

void StateSet::step(const Bits& cur, Bits& next, uint32_t c) const {
    clear_set(next);
    for (int k = 0; k < (int)atoms_.size(); ++k) {
        if (!test_bit(cur, k)) continue;
        const Atom& a = atoms_[k];
        if (!a.accepts(c)) continue;
        set_bit(next, a.repeatable ? k : k + 1);
    }
    closure(next);
}

bool StateSet::full_match(const CodePoints& text) const {
    Bits cur(words_, 0), next(words_, 0);
    set_bit(cur, 0);
    closure(cur);

    for (uint32_t c : text) {
        step(cur, next, c);
        if (empty_set(next)) return false;
        std::swap(cur, next);
    }
    return accepting(cur);
}

bool matches_state_set(const std::optional<Pattern>& pattern, const CodePoints& text) {
    if (!pattern) return false;
    return StateSet(*pattern).full_match(text);
}

} // namespace relite::util
