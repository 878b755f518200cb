#pragma once
/*
 * PosixConsole
 *
 * Purpose: IConsole on top of the process's stdin/stdout/stderr.
 * Geometry from TIOCGWINSZ, colors and cursor moves as ANSI sequences,
 * keys read in raw mode with poll(). Stream state is probed once, at
 * construction, and never re-evaluated.
 */
#include "term/Console.hpp"
#include "term/StreamProbe.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <termios.h>

namespace ttykit::term {

enum class ColorMode { Auto, Always, Never };

[[nodiscard]] std::optional<ColorMode> parse_color_mode(std::string_view s);

struct PosixConsoleOptions {
  ColorMode color_mode{ColorMode::Auto};
  bool force_non_interactive{false};
};

// SGR sequences for one color; Default maps to 39/49.
[[nodiscard]] std::string sgr_foreground(Color c);
[[nodiscard]] std::string sgr_background(Color c);

// Tracked cursor column. pending_wrap: the last write filled the row and the
// cursor still sits on its last column.
struct CursorPos {
  int column{0};
  bool pending_wrap{false};
};

// Cursor after writing `text` from `pos` on a row `width` wide.
[[nodiscard]] CursorPos advance_column(CursorPos pos, std::string_view text, int width);

// Columns from TIOCGWINSZ on `fd`, then COLUMNS, then 80.
[[nodiscard]] int term_cols(int fd);

// Non-canonical, no-echo stdin for the lifetime of the guard.
class RawInputGuard {
  bool active_{false};
  termios old_{};
public:
  RawInputGuard();
  ~RawInputGuard();
  RawInputGuard(const RawInputGuard&) = delete;
  RawInputGuard& operator=(const RawInputGuard&) = delete;
};

class PosixConsole : public IConsole {
public:
  explicit PosixConsole(PosixConsoleOptions options = {});
  ~PosixConsole() override;
  PosixConsole(const PosixConsole&) = delete;
  PosixConsole& operator=(const PosixConsole&) = delete;

  bool input_redirected() const override { return streams_.input_redirected; }
  bool output_redirected() const override { return streams_.output_redirected; }
  bool user_interactive() const override { return interactive_; }
  bool debugger_attached() const override;

  int window_width() const override;
  int cursor_left() const override { return cursor_.column; }
  void set_cursor_left(int col) override;

  Color foreground() const override { return fg_; }
  Color background() const override { return bg_; }
  void set_foreground(Color c) override;
  void set_background(Color c) override;

  void write(std::string_view text) override;
  void write_error(std::string_view text) override;
  void flush() override;

  bool key_available() override;
  std::optional<KeyPress> read_key() override;
  void begin_key_input() override;
  void end_key_input() override;

  [[nodiscard]] bool colors_enabled() const { return colors_enabled_; }

private:
  void emit(int fd, std::string_view bytes);
  [[nodiscard]] std::string sgr_state() const;
  [[nodiscard]] bool fill_pending(int timeout_ms);

  StreamState streams_;
  bool interactive_{false};
  bool colors_enabled_{false};
  bool error_colors_enabled_{false};
  bool write_failed_{false};
  CursorPos cursor_;
  Color fg_{Color::Default};
  Color bg_{Color::Default};
  std::string pending_; // raw key bytes read but not yet decoded
  std::unique_ptr<RawInputGuard> raw_;
};

} // namespace ttykit::term
