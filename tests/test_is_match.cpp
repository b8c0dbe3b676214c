#include "minitest.hpp"
#include "util/RegexLite.hpp"
#include <chrono>
#include <string>

using relite::util::Engine;
using relite::util::is_match;

static const Engine kEngines[] = {Engine::TABLE, Engine::STATE_SET};

// ============================================================================
// EMPTY PATTERN / LITERALS
// ============================================================================

TEST(match_empty_pattern) {
    ASSERT_TRUE(is_match("", ""));
    ASSERT_TRUE(!is_match("", "a"));
    ASSERT_TRUE(!is_match("", " "));
}

TEST(match_literal) {
    ASSERT_TRUE(is_match("abc", "abc"));
    ASSERT_TRUE(!is_match("abc", "ab"));
    ASSERT_TRUE(!is_match("abc", "abcd"));
}

TEST(match_full_not_substring) {
    ASSERT_TRUE(!is_match("a", "ba"));
    ASSERT_TRUE(!is_match("a", "ab"));
    ASSERT_TRUE(is_match(".*a", "ba"));
    ASSERT_TRUE(is_match("a.*", "ab"));
}

// ============================================================================
// WILDCARD / REPEAT
// ============================================================================

TEST(match_wildcard_single_codepoint) {
    ASSERT_TRUE(is_match(".", "x"));
    ASSERT_TRUE(!is_match(".", ""));
    ASSERT_TRUE(!is_match(".", "xy"));
    ASSERT_TRUE(is_match("..", "xy"));
}

TEST(match_wildcard_matches_newline) {
    ASSERT_TRUE(is_match("a.b", "a\nb"));
}

TEST(match_repeat) {
    ASSERT_TRUE(is_match("a*", ""));
    ASSERT_TRUE(is_match("a*", "a"));
    ASSERT_TRUE(is_match("a*", "aaaa"));
    ASSERT_TRUE(!is_match("a*", "b"));
}

TEST(match_mixed_tokens) {
    ASSERT_TRUE(is_match("ab*c", "ac"));
    ASSERT_TRUE(is_match("ab*c", "abc"));
    ASSERT_TRUE(is_match("ab*c", "abbbc"));
    ASSERT_TRUE(!is_match("ab*c", "abbd"));
}

TEST(match_dot_star) {
    ASSERT_TRUE(is_match(".*", ""));
    ASSERT_TRUE(is_match(".*", "abc"));
    ASSERT_TRUE(is_match(".*", "\xF0\x9F\x94\xA5"));
}

TEST(match_classic_examples) {
    ASSERT_TRUE(is_match("c*a*b", "aab"));
    ASSERT_TRUE(!is_match("mis*is*p*.", "mississippi"));
    ASSERT_TRUE(is_match("mis*is*ip*.", "mississippi"));
}

TEST(match_greedy_and_minimal) {
    ASSERT_TRUE(is_match("a.*b", "aXXXb"));
    ASSERT_TRUE(is_match("a.*b", "ab"));
    ASSERT_TRUE(is_match("a.*b.*c", "aXbYc"));
}

TEST(match_star_positions) {
    ASSERT_TRUE(is_match(".*.*.*", ""));
    ASSERT_TRUE(is_match(".*.*.*", "abc"));
    ASSERT_TRUE(is_match("abc.*", "abc"));
    ASSERT_TRUE(is_match("abc.*", "abcdef"));
    ASSERT_TRUE(is_match(".*abc", "abc"));
    ASSERT_TRUE(is_match(".*abc", "xyzabc"));
}

// ============================================================================
// INVALID PATTERNS
// ============================================================================

TEST(match_invalid_patterns_return_false) {
    ASSERT_TRUE(!is_match("*", ""));
    ASSERT_TRUE(!is_match("*a", "a"));
    ASSERT_TRUE(!is_match("a**", ""));
    ASSERT_TRUE(!is_match("a**", "aaa"));
    // The single-marker form is fine.
    ASSERT_TRUE(is_match("a*", ""));
}

TEST(match_malformed_utf8_is_false) {
    ASSERT_TRUE(!is_match(".", "\xFF"));
    ASSERT_TRUE(!is_match(".*", "ok\xC3"));
    ASSERT_TRUE(!is_match("\xFF", "\xFF"));
}

// ============================================================================
// UNICODE
// ============================================================================

TEST(match_unicode_is_codepoint_based) {
    // 🔥 is one codepoint, four bytes.
    ASSERT_TRUE(is_match("..", "\xF0\x9F\x94\xA5" "a"));
    ASSERT_TRUE(!is_match("..", "\xF0\x9F\x94\xA5"));
    ASSERT_TRUE(is_match(".", "\xF0\x9F\x94\xA5"));
}

TEST(match_unicode_literals) {
    ASSERT_TRUE(is_match("caf\xC3\xA9", "caf\xC3\xA9"));
    ASSERT_TRUE(!is_match("caf\xC3\xA9", "cafe"));
    // é* repeats the whole codepoint, not its last byte.
    ASSERT_TRUE(is_match("caf\xC3\xA9*", "caf\xC3\xA9\xC3\xA9\xC3\xA9"));
    ASSERT_TRUE(!is_match("caf\xC3\xA9*", "caf\xC3\xA9\xA9"));
}

// ============================================================================
// ENGINES AGREE
// ============================================================================

TEST(match_engines_agree_on_examples) {
    const char* cases[][2] = {
        {"c*a*b", "aab"}, {"mis*is*p*.", "mississippi"}, {"a.*b", "ab"},
        {"", ""}, {"*", ""}, {"a**", ""}, {"..", "\xF0\x9F\x94\xA5" "a"},
    };
    for (auto& c : cases) {
        ASSERT_EQ(is_match(c[0], c[1], Engine::TABLE), is_match(c[0], c[1], Engine::STATE_SET));
    }
}

TEST(match_engine_names) {
    ASSERT_TRUE(relite::util::engine_from_string("table") == Engine::TABLE);
    ASSERT_TRUE(relite::util::engine_from_string("stateset") == Engine::STATE_SET);
    ASSERT_TRUE(!relite::util::engine_from_string("backtrack").has_value());
    ASSERT_EQ(std::string(relite::util::engine_name(Engine::STATE_SET)), "stateset");
}

// ============================================================================
// ADVERSARIAL INPUTS (would be exponential with naive backtracking)
// ============================================================================

static std::string repeat(const std::string& s, int n) {
    std::string out;
    for (int i = 0; i < n; ++i) out += s;
    return out;
}

TEST(match_no_blowup_simple) {
    for (Engine e : kEngines)
        ASSERT_TRUE(is_match("a*a*a*a*a*a*a*a*a*a*aaaaaaaaaa", "aaaaaaaaaa", e));
}

TEST(match_no_blowup_nested) {
    for (Engine e : kEngines)
        ASSERT_TRUE(!is_match(repeat("a*", 25) + "b", repeat("a", 25), e));
}

TEST(match_no_blowup_dot_star) {
    for (Engine e : kEngines)
        ASSERT_TRUE(!is_match(repeat(".*", 20) + "b", repeat("a", 40), e));
}

TEST(match_long_text) {
    std::string text;
    for (int i = 0; i < 10000; ++i) text += (char)('a' + i % 26);
    for (Engine e : kEngines)
        ASSERT_TRUE(is_match(".*", text, e));
}

TEST(match_many_stars) {
    for (Engine e : kEngines) {
        ASSERT_TRUE(is_match("a*b*c*d*e*f*g*h*i*j*", "aabbccddeeffgghhiijj", e));
        ASSERT_TRUE(!is_match("a*b*c*d*e*f*g*h*i*j*k*l*m*n*o*p*q*r*s*t*u*v*w*x*y*z",
                              "this is a test string without the pattern", e));
    }
}

TEST(match_alternating_stars) {
    for (Engine e : kEngines)
        ASSERT_TRUE(is_match(".*a.*a.*a.*a.*a", "xaxaxaxaxax", e));
}

TEST(match_adversarial_under_100ms) {
    // Ten chained repeatable atoms, a literal run, tens of thousands of codepoints.
    const std::string pattern = repeat("a*", 10) + repeat("a", 10) + "b";
    const std::string text = repeat("a", 40000);
    for (Engine e : kEngines) {
        auto t0 = std::chrono::steady_clock::now();
        bool m = is_match(pattern, text, e);
        auto ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
        ASSERT_TRUE(!m);
        ASSERT_TRUE(ms < 100.0);
    }
}
