#include "app/LineFilter.hpp"
#include "util/RegexLite.hpp"
#include "util/Utf8.hpp"
#include <cstdio>
#include <istream>
#include <ostream>
#include <utility>

namespace relite::app {

LineFilter::LineFilter(std::string pattern, RunConfig cfg)
    : pattern_(std::move(pattern)), cfg_(cfg) {
  // Parsed here only to report why a pattern can never match.
  if (!util::parse_pattern(pattern_, &error_)) {
    std::fprintf(stderr, "relite: pattern: %s\n", error_.describe().c_str());
  }
}

bool LineFilter::evaluate(const std::string& text) const {
  bool m = util::is_match(pattern_, text, cfg_.engine);
  return cfg_.invert ? !m : m;
}

std::string json_escape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 2);
  for (unsigned char c : s) {
    switch (c) {
      case '"':  out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", c);
          out += buf;
        } else {
          out.push_back(static_cast<char>(c));
        }
    }
  }
  return out;
}

void LineFilter::emit(std::ostream& out, size_t lineno, const std::string& text, bool selected) const {
  if (cfg_.json) {
    out << "{\"line\":" << lineno << ",\"text\":\"" << json_escape(text)
        << "\",\"match\":" << (selected ? "true" : "false") << "}\n";
    return;
  }
  if (selected) out << text << '\n';
}

// Malformed input can never match; report where it broke when verbose.
void LineFilter::process(std::ostream& out, const std::string& text, FilterStats& st) const {
  ++st.inputs;
  if (auto bad = util::malformed_offset(text)) {
    ++st.malformed;
    if (cfg_.verbose)
      std::fprintf(stderr, "relite: input: line %zu: malformed UTF-8 at byte %zu\n", st.inputs, *bad);
  }
  bool sel = evaluate(text);
  if (sel) ++st.selected;
  if (!cfg_.count) emit(out, st.inputs, text, sel);
}

FilterStats LineFilter::run(std::istream& in, std::ostream& out) const {
  FilterStats st{};
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    process(out, line, st);
  }
  if (cfg_.count) out << st.selected << '\n';
  return st;
}

FilterStats LineFilter::run(const std::vector<std::string>& texts, std::ostream& out) const {
  FilterStats st{};
  for (const auto& t : texts) process(out, t, st);
  if (cfg_.count) out << st.selected << '\n';
  return st;
}

} // namespace relite::app
