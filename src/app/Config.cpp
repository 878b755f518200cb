#include "app/Config.hpp"
#include "util/TomlReader.hpp"
#include "util/Trace.hpp"
#include <algorithm>
#include <cstdlib>
#include <string>

namespace ttykit::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("TTYKIT_", 0) == 0) {
    alt = std::string("ttykit_") + n.substr(7);
  } else if (n.rfind("ttykit_", 0) == 0) {
    alt = std::string("TTYKIT_") + n.substr(7);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try { return std::stoi(v); } catch (const std::exception&) { return defv; }
}

bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* explicit_path = getenv_compat("TTYKIT_CONFIG")) return explicit_path;
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/ttykit/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/ttykit/config.toml";
  return {};
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

// Resolve a bool from TOML -> env -> compiled default
static bool resolve_bool(const util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

// Resolve a string from TOML -> env -> compiled default
static std::string resolve_string(const util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

// Color by name or palette index; unparsable values keep the default
static term::Color resolve_color(const util::TomlReader& toml, bool have_toml,
                                 const char* key, const char* env_name, term::Color def) {
  std::string val = resolve_string(toml, have_toml, "colors", key, env_name, "");
  if (val.empty()) return def;
  if (auto c = term::parse_color(val)) return *c;
  util::trace("Config", std::string("ignoring color ") + key + " = " + val);
  return def;
}

Config load_config(const std::string& path) {
  Config c{};
  util::TomlReader toml;
  bool have_toml = !path.empty() && toml.load(path);
  util::trace("Config", have_toml ? "loaded " + path : std::string("no config file, using environment and defaults"));

  // --- [output] ---
  c.output.fallback_width = resolve_int(toml, have_toml, "output", "fallback_width", "TTYKIT_FALLBACK_WIDTH", 80);
  if (c.output.fallback_width < 2) c.output.fallback_width = 80;
  auto mode = resolve_string(toml, have_toml, "output", "color", "TTYKIT_COLOR", "auto");
  if (auto m = term::parse_color_mode(mode)) c.output.color = *m;

  // --- [colors] ---
  c.colors.error  = resolve_color(toml, have_toml, "error",  "TTYKIT_ERROR_COLOR",  term::Color::Red);
  c.colors.accent = resolve_color(toml, have_toml, "accent", "TTYKIT_ACCENT_COLOR", term::Color::Cyan);

  // --- [wait] ---
  c.wait.message         = resolve_string(toml, have_toml, "wait", "message",       "TTYKIT_WAIT_MESSAGE", c.wait.message);
  c.wait.debug_message   = resolve_string(toml, have_toml, "wait", "debug_message", nullptr, c.wait.debug_message);
  c.wait.poll_ms         = std::clamp(resolve_int(toml, have_toml, "wait", "poll_ms", "TTYKIT_POLL_MS", 100), 10, 1000);
  c.wait.non_interactive = resolve_bool(toml, have_toml, "wait", "non_interactive", "TTYKIT_NON_INTERACTIVE", false);

  // --- [debug] ---
  c.debug.trace = resolve_bool(toml, have_toml, "debug", "trace", "TTYKIT_TRACE", false);

  return c;
}

const Config& config() {
  static Config cfg = []{
    Config c = load_config(config_file_path());
    if (c.debug.trace) util::set_trace_enabled(true);
    return c;
  }();
  return cfg;
}

ui::WaitSettings Config::wait_settings() const {
  ui::WaitSettings s;
  s.message = wait.message;
  s.debug_message = wait.debug_message;
  s.poll_interval = std::chrono::milliseconds(wait.poll_ms);
  s.error_color = colors.error;
  return s;
}

term::PosixConsoleOptions Config::console_options() const {
  term::PosixConsoleOptions o;
  o.color_mode = output.color;
  o.force_non_interactive = wait.non_interactive;
  return o;
}

} // namespace ttykit::app
