#include "ui/FormattedWriter.hpp"
#include <string>

namespace ttykit::ui {

namespace {

class ColorRestore {
public:
  explicit ColorRestore(term::IConsole& console)
      : console_(console), fg_(console.foreground()), bg_(console.background()) {}
  ~ColorRestore() {
    console_.set_foreground(fg_);
    console_.set_background(bg_);
  }
  ColorRestore(const ColorRestore&) = delete;
  ColorRestore& operator=(const ColorRestore&) = delete;

private:
  term::IConsole& console_;
  term::Color fg_;
  term::Color bg_;
};

} // namespace

void write_formatted(term::IConsole& console, std::string_view text, const Formatter& formatter) {
  ColorRestore restore(console);
  // Runs of equally colored characters go out in one write
  std::string run;
  term::Color run_fg = console.foreground();
  term::Color run_bg = console.background();
  auto flush_run = [&]{
    if (run.empty()) return;
    if (console.foreground() != run_fg) console.set_foreground(run_fg);
    if (console.background() != run_bg) console.set_background(run_bg);
    console.write(run);
    run.clear();
  };
  for (char c : text) {
    CharFormat f = formatter(c);
    if (!f.emit) continue;
    if (f.foreground != run_fg || f.background != run_bg) {
      flush_run();
      run_fg = f.foreground;
      run_bg = f.background;
    }
    run.push_back(c);
  }
  flush_run();
}

int layout_width(const term::IConsole& console, int fallback_width) {
  return console.output_redirected() ? fallback_width : console.window_width();
}

void write_wrapped(term::IConsole& console, std::string_view text, bool table_mode, int fallback_width) {
  int width = layout_width(console, fallback_width);
  for (auto line : split_lines(text)) {
    console.write(format_wrapped(trim_end(line), width, table_mode));
  }
}

void write_wrapped_formatted(term::IConsole& console, std::string_view text,
                             const Formatter& formatter, bool table_mode, int fallback_width) {
  int width = layout_width(console, fallback_width);
  for (auto line : split_lines(text)) {
    write_formatted(console, format_wrapped(trim_end(line), width, table_mode), formatter);
  }
}

Formatter plain_formatter(term::Color foreground, term::Color background) {
  return [foreground, background](char) { return CharFormat{true, foreground, background}; };
}

MarkupFormatter::MarkupFormatter(term::Color base, term::Color background, term::Color accent,
                                 char on, char off)
    : base_(base), background_(background), accent_(accent), on_(on), off_(off) {}

CharFormat MarkupFormatter::operator()(char c) {
  if (c == on_) { highlighted_ = true; return {false, accent_, background_}; }
  if (c == off_) { highlighted_ = false; return {false, base_, background_}; }
  return {true, highlighted_ ? accent_ : base_, background_};
}

} // namespace ttykit::ui
