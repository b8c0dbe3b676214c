#include "app/Config.hpp"
#include "util/TomlReader.hpp"
#include <cstdio>
#include <cstdlib>
#include <string>

namespace relite::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("RELITE_", 0) == 0) {
    alt = std::string("relite_") + n.substr(7);
  } else if (n.rfind("relite_", 0) == 0) {
    alt = std::string("RELITE_") + n.substr(7);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

bool getenv_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/relite/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/relite/config.toml";
  return {};
}

// A TOML value that is not a boolean is reported and ignored, so the
// environment and default still apply.
static bool resolve_bool(const util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key)) {
    if (auto v = toml.find_bool(section, key)) return *v;
    std::fprintf(stderr, "relite: Config: [%s] %s = '%s' is not a boolean, ignoring\n",
                 section, key, toml.get_string(section, key).c_str());
  }
  return getenv_flag(env_name, def);
}

static util::Engine resolve_engine(const util::TomlReader& toml, bool have_toml) {
  std::string name;
  const char* origin = "config";
  if (have_toml && toml.has("match", "engine")) {
    name = toml.get_string("match", "engine");
  } else if (const char* v = getenv_compat("RELITE_ENGINE")) {
    name = v;
    origin = "RELITE_ENGINE";
  }
  if (name.empty()) return util::Engine::TABLE;
  if (auto e = util::engine_from_string(name)) return *e;
  std::fprintf(stderr, "relite: Config: unknown engine '%s' in %s, using '%s'\n",
               name.c_str(), origin, util::engine_name(util::Engine::TABLE));
  return util::Engine::TABLE;
}

RunConfig load_run_config(const std::string& path) {
  util::TomlReader toml;
  bool have_toml = !path.empty() && toml.load(path);
  if (have_toml) {
    for (int line : toml.malformed_lines())
      std::fprintf(stderr, "relite: Config: %s:%d: ignoring malformed line\n", path.c_str(), line);
  }

  RunConfig cfg{};
  cfg.engine  = resolve_engine(toml, have_toml);
  cfg.count   = resolve_bool(toml, have_toml, "output", "count",   "RELITE_COUNT",   false);
  cfg.invert  = resolve_bool(toml, have_toml, "output", "invert",  "RELITE_INVERT",  false);
  cfg.json    = resolve_bool(toml, have_toml, "output", "json",    "RELITE_JSON",    false);
  cfg.verbose = resolve_bool(toml, have_toml, "log",    "verbose", "RELITE_VERBOSE", false);
  return cfg;
}

} // namespace relite::app
