#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>
#include "app/Config.hpp"
#include "util/Pattern.hpp"

namespace relite::app {

struct FilterStats {
  size_t inputs{0};
  size_t selected{0};
  size_t malformed{0};   // inputs that are not valid UTF-8
};

// Full-line filter: an input is selected when the whole line matches the
// pattern (or does not, with invert).
class LineFilter {
public:
  LineFilter(std::string pattern, RunConfig cfg);

  [[nodiscard]] bool pattern_valid() const { return error_.kind == util::ParseError::Kind::NONE; }
  [[nodiscard]] const util::ParseError& pattern_error() const { return error_; }

  [[nodiscard]] bool evaluate(const std::string& text) const;

  // Read lines from `in`, write selected ones (or the count / JSON records) to `out`.
  FilterStats run(std::istream& in, std::ostream& out) const;
  FilterStats run(const std::vector<std::string>& texts, std::ostream& out) const;

private:
  void emit(std::ostream& out, size_t lineno, const std::string& text, bool selected) const;
  void process(std::ostream& out, const std::string& text, FilterStats& st) const;

  std::string pattern_;
  RunConfig cfg_;
  util::ParseError error_;
};

// Escape a string for a JSON string literal.
std::string json_escape(const std::string& s);

} // namespace relite::app
