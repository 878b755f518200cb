#pragma once

#include "term/Console.hpp"
#include "ui/TextLayout.hpp"
#include <functional>
#include <string_view>

namespace ttykit::ui {

// What to do with one character of formatted output.
struct CharFormat {
  bool emit{true};
  term::Color foreground{term::Color::Default};
  term::Color background{term::Color::Default};
};

using Formatter = std::function<CharFormat(char)>;

// Write `text` byte by byte as `formatter` decides: emitted bytes take the
// colors of their CharFormat, suppressed bytes are dropped. The console's
// foreground and background are restored afterwards, also on exceptions.
void write_formatted(term::IConsole& console, std::string_view text, const Formatter& formatter);

// Terminal width, or `fallback_width` when output is redirected.
[[nodiscard]] int layout_width(const term::IConsole& console, int fallback_width = kFallbackWidth);

// Wrap each '\n'-separated line of `text` (trailing whitespace removed) to
// the layout width and write it.
void write_wrapped(term::IConsole& console, std::string_view text, bool table_mode = false,
                   int fallback_width = kFallbackWidth);

// As write_wrapped, then through write_formatted. Wrapping sees the raw text,
// so characters the formatter suppresses still take up width.
void write_wrapped_formatted(term::IConsole& console, std::string_view text,
                             const Formatter& formatter, bool table_mode = false,
                             int fallback_width = kFallbackWidth);

// Emits every character in fixed colors.
[[nodiscard]] Formatter plain_formatter(term::Color foreground, term::Color background);

// Highlight markup: `on` switches to the accent color, `off` back to the
// base color. Marker characters are suppressed.
class MarkupFormatter {
public:
  static constexpr char kHighlightOn = '\x01';
  static constexpr char kHighlightOff = '\x02';

  MarkupFormatter(term::Color base, term::Color background, term::Color accent,
                  char on = kHighlightOn, char off = kHighlightOff);

  CharFormat operator()(char c);

private:
  term::Color base_;
  term::Color background_;
  term::Color accent_;
  char on_;
  char off_;
  bool highlighted_{false};
};

} // namespace ttykit::ui
