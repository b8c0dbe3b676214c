#include "util/Pattern.hpp"
#include "util/Utf8.hpp"

namespace relite::util {

std::string ParseError::describe() const {
    std::string at = " at byte " + std::to_string(offset);
    switch (kind) {
        case Kind::NONE:           return "ok";
        case Kind::LEADING_REPEAT: return "repeat marker has no atom to repeat" + at;
        case Kind::STACKED_REPEAT: return "repeat marker stacked on an already repeated atom" + at;
        case Kind::BAD_UTF8:       return "malformed UTF-8" + at;
    }
    return "unknown error";
}

static std::optional<Pattern> fail(ParseError* err, ParseError::Kind kind, size_t offset) {
    if (err) { err->kind = kind; err->offset = offset; }
    return std::nullopt;
}

std::optional<Pattern> parse_pattern(std::string_view pattern, ParseError* err) {
    if (err) *err = ParseError{};

    Pattern out;
    out.atoms.reserve(pattern.size());

    // True right after an atom was produced; a '*' may only land there.
    bool can_repeat = false;

    size_t i = 0;
    while (i < pattern.size()) {
        uint32_t cp;
        int n = decode_utf8(pattern.data() + i, pattern.size() - i, &cp);
        if (n == 0) return fail(err, ParseError::Kind::BAD_UTF8, i);

        if (cp == REPEAT_CHAR) {
            if (out.atoms.empty())
                return fail(err, ParseError::Kind::LEADING_REPEAT, i);
            if (!can_repeat)
                return fail(err, ParseError::Kind::STACKED_REPEAT, i);
            out.atoms.back().repeatable = true;
            can_repeat = false;
        } else if (cp == WILDCARD_CHAR) {
            out.atoms.push_back({Atom::Kind::WILDCARD, 0, false});
            can_repeat = true;
        } else {
            out.atoms.push_back({Atom::Kind::LITERAL, cp, false});
            can_repeat = true;
        }
        i += (size_t)n;
    }
    return out;
}

} // namespace relite::util
