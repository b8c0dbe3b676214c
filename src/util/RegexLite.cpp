#include "util/RegexLite.hpp"
#include "util/MatchTable.hpp"
#include "util/Pattern.hpp"
#include "util/StateSet.hpp"
#include "util/Utf8.hpp"

namespace relite::util {

bool is_match(std::string_view pattern, std::string_view text) {
    return is_match(pattern, text, Engine::TABLE);
}

bool is_match(std::string_view pattern, std::string_view text, Engine engine) {
    auto parsed = parse_pattern(pattern);
    if (!parsed) return false;
    auto cps = to_codepoints(text);
    if (!cps) return false;

    switch (engine) {
        case Engine::STATE_SET: return matches_state_set(parsed, *cps);
        case Engine::TABLE:     break;
    }
    return matches(parsed, *cps);
}

std::optional<Engine> engine_from_string(std::string_view name) {
    if (name == "table" || name == "dp") return Engine::TABLE;
    if (name == "stateset" || name == "state_set" || name == "nfa") return Engine::STATE_SET;
    return std::nullopt;
}

const char* engine_name(Engine engine) {
    switch (engine) {
        case Engine::TABLE:     return "table";
        case Engine::STATE_SET: return "stateset";
    }
    return "unknown";
}

} // namespace relite::util
