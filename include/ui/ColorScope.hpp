#pragma once

#include "term/Console.hpp"

namespace ttykit::ui {

// Sets the console foreground color for the lifetime of the scope and puts
// the previous color back when the scope ends, however it ends.
class ColorScope {
public:
  ColorScope(term::IConsole& console, term::Color color);
  ~ColorScope();
  ColorScope(const ColorScope&) = delete;
  ColorScope& operator=(const ColorScope&) = delete;

  [[nodiscard]] term::Color previous() const { return previous_; }

private:
  term::IConsole& console_;
  term::Color previous_;
};

} // namespace ttykit::ui
