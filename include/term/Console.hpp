#pragma once
/*
 * IConsole
 *
 * Purpose: the terminal/stream primitives the layout and interaction code
 * needs (geometry, cursor column, colors, stdout/stderr writes, key input).
 * Implementations: PosixConsole (real terminal), HeadlessConsole (tests).
 */
#include "term/Keys.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace ttykit::term {

// 16-color ANSI palette order plus the terminal's own default.
enum class Color : int {
  Black = 0, Red, Green, Yellow, Blue, Magenta, Cyan, White,
  BrightBlack, BrightRed, BrightGreen, BrightYellow,
  BrightBlue, BrightMagenta, BrightCyan, BrightWhite,
  Default = -1,
};

// Parse "red", "bright_blue", "default" or a palette index 0..15.
[[nodiscard]] std::optional<Color> parse_color(std::string_view name);
[[nodiscard]] const char* color_name(Color c);

class IConsole {
public:
  virtual ~IConsole() = default;

  // Stream state, fixed for the lifetime of the console
  [[nodiscard]] virtual bool input_redirected() const = 0;
  [[nodiscard]] virtual bool output_redirected() const = 0;
  [[nodiscard]] virtual bool user_interactive() const = 0;
  [[nodiscard]] virtual bool debugger_attached() const = 0;

  [[nodiscard]] virtual int window_width() const = 0;
  [[nodiscard]] virtual int cursor_left() const = 0;
  virtual void set_cursor_left(int col) = 0;

  [[nodiscard]] virtual Color foreground() const = 0;
  [[nodiscard]] virtual Color background() const = 0;
  virtual void set_foreground(Color c) = 0;
  virtual void set_background(Color c) = 0;

  virtual void write(std::string_view text) = 0;
  virtual void write_error(std::string_view text) = 0;
  virtual void flush() {}

  // Key input. begin/end bracket a stretch of single-key reads (raw mode).
  [[nodiscard]] virtual bool key_available() = 0;
  // Blocks. std::nullopt when input is closed.
  virtual std::optional<KeyPress> read_key() = 0;
  virtual void begin_key_input() {}
  virtual void end_key_input() {}
};

} // namespace ttykit::term
