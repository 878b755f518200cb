#pragma once

#include "term/Console.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace ttykit::ui {

struct WaitSettings {
  std::string message{"Press any key to continue..."};
  std::string debug_message{"Press any key to quit..."};
  std::chrono::milliseconds poll_interval{100};
  term::Color error_color{term::Color::Red};
};

enum class WaitState { Idle, WaitingForKey, CountingDown, Done };

enum class WaitOutcome {
  Skipped,     // not interactive, or input redirected
  KeyPressed,
  TimedOut,
  InputClosed, // input ended before a key arrived
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

[[nodiscard]] const char* to_string(WaitOutcome outcome);

// Blocking "press any key" and countdown interactions on one console.
// Single-threaded: call from the thread that owns the terminal.
class Interaction {
public:
  // An empty sleeper means std::this_thread::sleep_for.
  explicit Interaction(term::IConsole& console, WaitSettings settings = {}, Sleeper sleeper = {});

  // Drop keys pressed but not yet read. No-op on redirected input.
  void clear_key_buffer();

  // Print `message` (nullopt: the configured default, "": nothing) and wait.
  // timeout_s < 0 waits for a qualifying key indefinitely; otherwise counts
  // down timeout_s seconds, optionally drawing one dot per second and
  // erasing one per elapsed second.
  WaitOutcome wait(std::optional<std::string> message = std::nullopt, int timeout_s = -1,
                   bool show_dots = false);

  // Indefinite wait with the debug message, only under a debugger.
  WaitOutcome wait_if_debug();

  // Report `message` on stderr in the error color, wait if debugging, and
  // hand back `exit_code` for the caller to return.
  [[nodiscard]] int exit_error(const std::string& message, int exit_code);

  [[nodiscard]] WaitState state() const { return state_; }
  [[nodiscard]] const WaitSettings& settings() const { return settings_; }

private:
  WaitOutcome wait_for_key();
  WaitOutcome count_down(int timeout_s, bool show_dots);
  [[nodiscard]] bool pending_input_key();
  void erase_dot();

  term::IConsole& console_;
  WaitSettings settings_;
  Sleeper sleeper_;
  WaitState state_{WaitState::Idle};
};

} // namespace ttykit::ui
