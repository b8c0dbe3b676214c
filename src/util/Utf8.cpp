#include "util/Utf8.hpp"

namespace relite::util {

static bool is_cont(char b) { return ((uint8_t)b & 0xC0) == 0x80; }

int decode_utf8(const char* s, size_t len, uint32_t* cp) {
    if (len == 0) return 0;
    auto c = (uint8_t)s[0];
    if (c < 0x80)        { *cp = c; return 1; }
    if ((c & 0xE0) == 0xC0 && len >= 2 && is_cont(s[1])) {
        *cp = ((uint32_t)(c & 0x1F) << 6) | (s[1] & 0x3F);
        return (*cp >= 0x80) ? 2 : 0;
    }
    if ((c & 0xF0) == 0xE0 && len >= 3 && is_cont(s[1]) && is_cont(s[2])) {
        *cp = ((uint32_t)(c & 0x0F) << 12) | ((uint32_t)(s[1] & 0x3F) << 6) | (s[2] & 0x3F);
        if (*cp >= 0xD800 && *cp <= 0xDFFF) return 0;
        return (*cp >= 0x800) ? 3 : 0;
    }
    if ((c & 0xF8) == 0xF0 && len >= 4 && is_cont(s[1]) && is_cont(s[2]) && is_cont(s[3])) {
        *cp = ((uint32_t)(c & 0x07) << 18) | ((uint32_t)(s[1] & 0x3F) << 12)
            | ((uint32_t)(s[2] & 0x3F) << 6) | (s[3] & 0x3F);
        return (*cp >= 0x10000 && *cp <= 0x10FFFF) ? 4 : 0;
    }
    return 0;
}

std::optional<CodePoints> to_codepoints(std::string_view s) {
    CodePoints out;
    out.reserve(s.size());
    const char* p = s.data();
    const char* end = p + s.size();
    while (p < end) {
        uint32_t cp;
        int n = decode_utf8(p, (size_t)(end - p), &cp);
        if (n == 0) return std::nullopt;
        out.push_back(cp);
        p += n;
    }
    return out;
}

std::optional<size_t> malformed_offset(std::string_view s) {
    size_t i = 0;
    while (i < s.size()) {
        uint32_t cp;
        int n = decode_utf8(s.data() + i, s.size() - i, &cp);
        if (n == 0) return i;
        i += (size_t)n;
    }
    return std::nullopt;
}

} // namespace relite::util
