#include "term/PosixConsole.hpp"
#include "util/Procfs.hpp"
#include "util/Trace.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <poll.h>
#include <string>
#include <sys/ioctl.h>
#include <unistd.h>

namespace ttykit::term {

// Keys that start with ESC get this long for the rest of the sequence
static constexpr int kEscFollowupMs = 25;

std::optional<ColorMode> parse_color_mode(std::string_view s) {
  if (s == "auto") return ColorMode::Auto;
  if (s == "always" || s == "true" || s == "1") return ColorMode::Always;
  if (s == "never" || s == "false" || s == "0") return ColorMode::Never;
  return std::nullopt;
}

std::string sgr_foreground(Color c) {
  int idx = static_cast<int>(c);
  if (idx < 0) return "\x1B[39m";
  if (idx <= 7) return "\x1B[" + std::to_string(30 + idx) + "m";
  return "\x1B[" + std::to_string(90 + (idx - 8)) + "m";
}

std::string sgr_background(Color c) {
  int idx = static_cast<int>(c);
  if (idx < 0) return "\x1B[49m";
  if (idx <= 7) return "\x1B[" + std::to_string(40 + idx) + "m";
  return "\x1B[" + std::to_string(100 + (idx - 8)) + "m";
}

CursorPos advance_column(CursorPos pos, std::string_view text, int width) {
  if (width < 1) width = 1;
  for (char ch : text) {
    unsigned char c = static_cast<unsigned char>(ch);
    if (c == '\n' || c == '\r') pos = {0, false};
    else if (c == '\b') pos = {std::max(0, pos.column - 1), false};
    else if (c == '\t') pos = {std::min(width - 1, (pos.column / 8 + 1) * 8), false};
    else if ((c & 0xC0) == 0x80) continue; // UTF-8 continuation byte
    else if (c < 0x20 || c == 0x7F) continue;
    else {
      // A full row holds the cursor on its last column; the next printable
      // character lands at column 0 of the following row
      if (pos.pending_wrap) pos = {0, false};
      if (++pos.column >= width) pos = {width - 1, true};
    }
  }
  return pos;
}

int term_cols(int fd) {
  struct winsize ws{};
  if (ioctl(fd, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
    return ws.ws_col;
  const char* c = std::getenv("COLUMNS");
  if (c && *c) {
    try { return std::max(20, std::stoi(c)); } catch (const std::exception&) {}
  }
  return 80;
}

RawInputGuard::RawInputGuard() {
  if (::isatty(STDIN_FILENO) == 1) {
    if (tcgetattr(STDIN_FILENO, &old_) == 0) {
      termios neo = old_;
      neo.c_lflag &= ~(ICANON | ECHO);
      neo.c_cc[VMIN] = 1;
      neo.c_cc[VTIME] = 0;
      if (tcsetattr(STDIN_FILENO, TCSANOW, &neo) == 0) active_ = true;
      else util::trace("RawInputGuard", std::string("tcsetattr failed: ") + std::strerror(errno));
    }
  }
}

RawInputGuard::~RawInputGuard() {
  if (active_) tcsetattr(STDIN_FILENO, TCSANOW, &old_);
}

static bool foreground_process_group() {
  pid_t fg = ::tcgetpgrp(STDIN_FILENO);
  return fg != -1 && fg == ::getpgrp();
}

static bool colors_allowed_for(int fd, ColorMode mode) {
  if (mode == ColorMode::Never) return false;
  if (mode == ColorMode::Always) return true;
  if (is_redirected(fd)) return false;
  const char* no_color = std::getenv("NO_COLOR");
  if (no_color && *no_color) return false;
  const char* term = std::getenv("TERM");
  return term && std::string(term) != "dumb";
}

PosixConsole::PosixConsole(PosixConsoleOptions options) {
  StreamProbe probe;
  streams_ = probe.state();
  interactive_ = !options.force_non_interactive &&
                 ::isatty(STDIN_FILENO) == 1 && foreground_process_group();
  colors_enabled_ = colors_allowed_for(STDOUT_FILENO, options.color_mode);
  error_colors_enabled_ = colors_allowed_for(STDERR_FILENO, options.color_mode);
  util::trace("PosixConsole",
              std::string("interactive=") + (interactive_ ? "yes" : "no") +
              " colors=" + (colors_enabled_ ? "on" : "off") +
              " width=" + std::to_string(window_width()));
}

PosixConsole::~PosixConsole() {
  raw_.reset();
  if (colors_enabled_ && (fg_ != Color::Default || bg_ != Color::Default))
    emit(STDOUT_FILENO, "\x1B[0m");
}

bool PosixConsole::debugger_attached() const {
  return util::debugger_attached();
}

int PosixConsole::window_width() const {
  return term_cols(STDOUT_FILENO);
}

void PosixConsole::set_cursor_left(int col) {
  if (col < 0) col = 0;
  if (!streams_.output_redirected) {
    // CHA is 1-based
    emit(STDOUT_FILENO, "\x1B[" + std::to_string(col + 1) + "G");
  }
  cursor_ = {col, false};
}

void PosixConsole::set_foreground(Color c) {
  if (c == fg_) return;
  fg_ = c;
  if (colors_enabled_) emit(STDOUT_FILENO, sgr_foreground(c));
}

void PosixConsole::set_background(Color c) {
  if (c == bg_) return;
  bg_ = c;
  if (colors_enabled_) emit(STDOUT_FILENO, sgr_background(c));
}

std::string PosixConsole::sgr_state() const {
  return sgr_foreground(fg_) + sgr_background(bg_);
}

void PosixConsole::write(std::string_view text) {
  emit(STDOUT_FILENO, text);
  cursor_ = advance_column(cursor_, text, window_width());
}

void PosixConsole::write_error(std::string_view text) {
  bool tinted = error_colors_enabled_ && (fg_ != Color::Default || bg_ != Color::Default);
  if (!tinted) {
    emit(STDERR_FILENO, text);
    return;
  }
  std::string out = sgr_state();
  out.append(text);
  out += "\x1B[0m";
  emit(STDERR_FILENO, out);
  // The reset above also hits stdout when both share the terminal
  if (colors_enabled_) emit(STDOUT_FILENO, sgr_state());
}

void PosixConsole::flush() {
  // All output goes straight to the descriptors; only drain the tty queue
  if (!streams_.output_redirected) tcdrain(STDOUT_FILENO);
}

void PosixConsole::emit(int fd, std::string_view bytes) {
  const char* p = bytes.data();
  size_t left = bytes.size();
  while (left > 0) {
    ssize_t n = ::write(fd, p, left);
    if (n < 0) {
      if (errno == EINTR) continue;
      if (!write_failed_) {
        write_failed_ = true;
        util::trace("PosixConsole", std::string("write failed: ") + std::strerror(errno));
      }
      return;
    }
    p += n;
    left -= static_cast<size_t>(n);
  }
}

// Read whatever stdin has within timeout_ms into pending_. False on
// timeout, end of input or error.
bool PosixConsole::fill_pending(int timeout_ms) {
  struct pollfd pfd{.fd=STDIN_FILENO,.events=POLLIN,.revents=0};
  int rv;
  do { rv = ::poll(&pfd, 1, timeout_ms); } while (rv < 0 && errno == EINTR);
  if (rv <= 0 || !(pfd.revents & (POLLIN | POLLHUP))) return false;
  char buf[32];
  ssize_t n;
  do { n = ::read(STDIN_FILENO, buf, sizeof(buf)); } while (n < 0 && errno == EINTR);
  if (n <= 0) return false;
  pending_.append(buf, static_cast<size_t>(n));
  return true;
}

bool PosixConsole::key_available() {
  if (streams_.input_redirected) return false;
  if (!pending_.empty()) return true;
  return fill_pending(0);
}

std::optional<KeyPress> PosixConsole::read_key() {
  if (pending_.empty() && !fill_pending(-1)) return std::nullopt;
  // A lone ESC may be the start of a sequence still in flight
  if (pending_.size() == 1 && pending_[0] == '\x1B') {
    while (fill_pending(kEscFollowupMs) && pending_.size() < 8) {}
  }
  auto decoded = decode_key(pending_);
  if (!decoded) return std::nullopt;
  pending_.erase(0, decoded->consumed);
  return decoded->key;
}

void PosixConsole::begin_key_input() {
  if (!raw_) raw_ = std::make_unique<RawInputGuard>();
}

void PosixConsole::end_key_input() {
  raw_.reset();
}

} // namespace ttykit::term
