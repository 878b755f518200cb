#pragma once

#include "term/Console.hpp"
#include "term/PosixConsole.hpp"
#include "ui/Interaction.hpp"
#include <string>

namespace ttykit::app {

struct Config {
  struct Output {
    int fallback_width{80};
    term::ColorMode color{term::ColorMode::Auto};
  } output;

  struct Colors {
    term::Color error{term::Color::Red};
    term::Color accent{term::Color::Cyan};
  } colors;

  struct Wait {
    std::string message{"Press any key to continue..."};
    std::string debug_message{"Press any key to quit..."};
    int poll_ms{100};
    bool non_interactive{false};
  } wait;

  struct Debug {
    bool trace{false};
  } debug;

  [[nodiscard]] ui::WaitSettings wait_settings() const;
  [[nodiscard]] term::PosixConsoleOptions console_options() const;
};

// Process-wide configuration, resolved on first use:
// config file -> environment -> compiled default.
const Config& config();

// Resolve from a specific file (missing file: environment and defaults only).
[[nodiscard]] Config load_config(const std::string& path);

// $TTYKIT_CONFIG, else $XDG_CONFIG_HOME/ttykit/config.toml,
// else $HOME/.config/ttykit/config.toml. Empty if none applies.
[[nodiscard]] std::string config_file_path();

// Environment helpers; accept both TTYKIT_ and ttykit_ prefixes.
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);
bool env_flag(const char* name, bool defv);

} // namespace ttykit::app
