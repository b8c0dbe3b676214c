#pragma once

#include <string>
#include "util/RegexLite.hpp"

namespace relite::app {

struct RunConfig {
  util::Engine engine{util::Engine::TABLE};
  bool count{false};     // print only the number of selected inputs
  bool invert{false};    // select inputs that do NOT match
  bool json{false};      // one JSON object per input
  bool verbose{false};   // extra diagnostics on stderr
};

// $XDG_CONFIG_HOME/relite/config.toml, else ~/.config/relite/config.toml.
// Empty when neither variable is set.
std::string config_file_path();

// Resolve every key TOML -> env -> compiled default.
// A missing file is not an error; the env/defaults still apply.
RunConfig load_run_config(const std::string& path);

// Environment variable helpers (RELITE_X or relite_X)
const char* getenv_compat(const char* name);
bool getenv_flag(const char* name, bool defv);

} // namespace relite::app
