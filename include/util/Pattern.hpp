#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace relite::util {

// One matching unit: a literal codepoint or a wildcard, optionally
// followed by the repeat marker.
struct Atom {
    enum class Kind : uint8_t { LITERAL, WILDCARD };

    Kind     kind{Kind::LITERAL};
    uint32_t cp{0};           // LITERAL: codepoint to match
    bool     repeatable{false};

    [[nodiscard]] bool accepts(uint32_t c) const {
        return kind == Kind::WILDCARD || cp == c;
    }
};

// Parsed pattern. Read-only once produced by parse_pattern().
struct Pattern {
    std::vector<Atom> atoms;

    [[nodiscard]] size_t size() const { return atoms.size(); }
    [[nodiscard]] bool empty() const { return atoms.empty(); }
};

struct ParseError {
    enum class Kind : uint8_t {
        NONE,
        LEADING_REPEAT,   // '*' with no atom before it
        STACKED_REPEAT,   // '*' directly after another '*'
        BAD_UTF8,
    };

    Kind   kind{Kind::NONE};
    size_t offset{0};         // byte offset into the pattern

    [[nodiscard]] std::string describe() const;
};

inline constexpr uint32_t WILDCARD_CHAR = '.';
inline constexpr uint32_t REPEAT_CHAR   = '*';

// Parse a pattern into atoms. nullopt means the pattern is invalid;
// `err`, when given, receives the reason and byte offset.
[[nodiscard]] std::optional<Pattern> parse_pattern(std::string_view pattern,
                                                   ParseError* err = nullptr);

} // namespace relite::util
