#include "app/Config.hpp"
#include "app/LineFilter.hpp"
#include "util/RegexLite.hpp"

#include <cstdio>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

static void print_usage(std::ostream& os) {
  os << "Usage: relite [--config PATH] [--engine table|stateset] [--count] [-v|--invert]\n"
        "              [--json] [--verbose] PATTERN [TEXT...]\n"
        "Pattern: '.' matches any codepoint, '*' repeats the previous atom zero or more times.\n"
        "Each TEXT (or each stdin line when none are given) must match the whole pattern.\n"
        "Exit status: 0 if any input was selected, 1 if none, 2 on usage error.\n";
}

int main(int argc, char** argv) {
  std::optional<std::string> config_path;
  std::optional<relite::util::Engine> engine;
  bool count = false, invert = false, json = false, verbose = false;
  std::vector<std::string> positional;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--") {
      for (++i; i < argc; ++i) positional.emplace_back(argv[i]);
      break;
    }
    if ((a == "--config" || a == "--engine") && i + 1 >= argc) {
      std::fprintf(stderr, "relite: option '%s' requires a value\n", a.c_str());
      print_usage(std::cerr);
      return 2;
    }
    if (a == "--config") config_path = argv[++i];
    else if (a == "--engine") {
      engine = relite::util::engine_from_string(argv[++i]);
      if (!engine) {
        std::fprintf(stderr, "relite: unknown engine '%s'\n", argv[i]);
        return 2;
      }
    }
    else if (a == "--count") count = true;
    else if (a == "--invert" || a == "-v") invert = true;
    else if (a == "--json") json = true;
    else if (a == "--verbose") verbose = true;
    else if (a == "-h" || a == "--help") {
      print_usage(std::cout);
      return 0;
    }
    else if (a.size() > 2 && a.rfind("--", 0) == 0) {
      std::fprintf(stderr, "relite: unknown option '%s'\n", a.c_str());
      print_usage(std::cerr);
      return 2;
    }
    else positional.push_back(std::move(a));
  }

  if (positional.empty()) {
    print_usage(std::cerr);
    return 2;
  }

  // Flags override config file and environment.
  auto cfg = relite::app::load_run_config(config_path ? *config_path : relite::app::config_file_path());
  if (engine) cfg.engine = *engine;
  if (count) cfg.count = true;
  if (invert) cfg.invert = true;
  if (json) cfg.json = true;
  if (verbose) cfg.verbose = true;

  if (cfg.verbose) {
    std::fprintf(stderr, "relite: engine=%s count=%d invert=%d json=%d\n",
                 relite::util::engine_name(cfg.engine), cfg.count, cfg.invert, cfg.json);
  }

  std::string pattern = positional.front();
  positional.erase(positional.begin());

  relite::app::LineFilter filter(std::move(pattern), cfg);
  auto st = positional.empty() ? filter.run(std::cin, std::cout)
                               : filter.run(positional, std::cout);
  std::cout.flush();

  if (cfg.verbose) {
    std::fprintf(stderr, "relite: %zu of %zu inputs selected\n", st.selected, st.inputs);
  }
  return st.selected > 0 ? 0 : 1;
}
