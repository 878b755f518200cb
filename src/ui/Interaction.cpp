#include "ui/Interaction.hpp"
#include "ui/ColorScope.hpp"
#include "ui/CursorControl.hpp"
#include "util/Trace.hpp"
#include <algorithm>
#include <thread>
#include <utility>

namespace ttykit::ui {

using namespace std::chrono_literals;

namespace {

// Keeps the console in single-key input mode while a wait runs
class KeyInputScope {
public:
  explicit KeyInputScope(term::IConsole& console) : console_(console) { console_.begin_key_input(); }
  ~KeyInputScope() { console_.end_key_input(); }
  KeyInputScope(const KeyInputScope&) = delete;
  KeyInputScope& operator=(const KeyInputScope&) = delete;

private:
  term::IConsole& console_;
};

} // namespace

const char* to_string(WaitOutcome outcome) {
  switch (outcome) {
    case WaitOutcome::Skipped: return "skipped";
    case WaitOutcome::KeyPressed: return "key";
    case WaitOutcome::TimedOut: return "timeout";
    case WaitOutcome::InputClosed: return "input-closed";
  }
  return "unknown";
}

Interaction::Interaction(term::IConsole& console, WaitSettings settings, Sleeper sleeper)
    : console_(console), settings_(std::move(settings)), sleeper_(std::move(sleeper)) {
  if (!sleeper_) sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
  if (settings_.poll_interval <= 0ms) settings_.poll_interval = 100ms;
}

void Interaction::clear_key_buffer() {
  if (console_.input_redirected()) return;
  while (console_.key_available()) {
    if (!console_.read_key()) break;
  }
}

bool Interaction::pending_input_key() {
  if (!console_.key_available()) return false;
  auto key = console_.read_key();
  return key && term::is_input_key(key->code);
}

void Interaction::erase_dot() {
  move_cursor(console_, -1);
  console_.write(" ");
  move_cursor(console_, -1);
}

WaitOutcome Interaction::wait(std::optional<std::string> message, int timeout_s, bool show_dots) {
  state_ = WaitState::Idle;
  if (!console_.user_interactive() || console_.input_redirected()) {
    util::trace("Interaction", "wait skipped (not interactive or input redirected)");
    return WaitOutcome::Skipped;
  }
  const std::string text = message ? *message : settings_.message;
  if (!text.empty()) {
    clear_line(console_);
    console_.write(text);
  }
  console_.flush();

  WaitOutcome outcome;
  {
    KeyInputScope keys(console_);
    outcome = timeout_s < 0 ? wait_for_key() : count_down(timeout_s, show_dots);
  }
  // The key that ends an indefinite wait stands in for the line break
  if (timeout_s >= 0 && !text.empty()) console_.write("\n");
  console_.flush();
  state_ = WaitState::Done;
  util::trace("Interaction", std::string("wait finished: ") + to_string(outcome));
  return outcome;
}

WaitOutcome Interaction::wait_for_key() {
  state_ = WaitState::WaitingForKey;
  clear_key_buffer();
  while (true) {
    auto key = console_.read_key();
    if (!key) return WaitOutcome::InputClosed;
    if (term::is_input_key(key->code)) return WaitOutcome::KeyPressed;
  }
}

WaitOutcome Interaction::count_down(int timeout_s, bool show_dots) {
  state_ = WaitState::CountingDown;
  if (show_dots && timeout_s > 0) {
    console_.write(std::string(static_cast<size_t>(timeout_s), '.'));
    console_.flush();
  }
  const std::chrono::milliseconds total = std::chrono::seconds(timeout_s);
  const std::chrono::milliseconds slice = settings_.poll_interval;
  std::chrono::milliseconds elapsed{0};
  std::chrono::milliseconds next_second = 1s;

  clear_key_buffer();
  WaitOutcome outcome = WaitOutcome::TimedOut;
  while (elapsed < total) {
    if (pending_input_key()) {
      outcome = WaitOutcome::KeyPressed;
      break;
    }
    sleeper_(slice);
    elapsed += slice;
    while (show_dots && elapsed >= next_second && next_second <= total) {
      next_second += 1s;
      erase_dot();
      console_.flush();
    }
  }
  clear_key_buffer();
  return outcome;
}

WaitOutcome Interaction::wait_if_debug() {
  if (!console_.debugger_attached()) return WaitOutcome::Skipped;
  return wait(settings_.debug_message);
}

int Interaction::exit_error(const std::string& message, int exit_code) {
  clear_line(console_);
  {
    ColorScope color(console_, settings_.error_color);
    console_.write_error(message + "\n");
  }
  wait_if_debug();
  return exit_code;
}

} // namespace ttykit::ui
