#include "ui/CursorControl.hpp"
#include <algorithm>
#include <string>

namespace ttykit::ui {

void move_cursor(term::IConsole& console, int delta) {
  if (console.output_redirected()) return;
  long long last = std::max(0, console.window_width() - 1);
  long long x = static_cast<long long>(console.cursor_left()) + delta;
  console.set_cursor_left(static_cast<int>(std::clamp<long long>(x, 0, last)));
}

void clear_line(term::IConsole& console) {
  if (console.output_redirected()) {
    console.write("\n");
    return;
  }
  int width = console.window_width();
  console.set_cursor_left(0);
  // One short of the width so the terminal does not wrap to the next row
  console.write(std::string(static_cast<size_t>(std::max(0, width - 1)), ' '));
  console.set_cursor_left(0);
}

} // namespace ttykit::ui
