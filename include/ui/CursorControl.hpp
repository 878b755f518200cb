#pragma once

#include "term/Console.hpp"

namespace ttykit::ui {

// Move the cursor `delta` columns within the current line, clamped to
// [0, window_width - 1]. No-op when output is redirected.
void move_cursor(term::IConsole& console, int delta);

// Blank the current line and return to column 0. On redirected output there
// is no line to blank; a line break is written instead.
void clear_line(term::IConsole& console);

} // namespace ttykit::ui
