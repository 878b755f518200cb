#include "ui/ColorScope.hpp"

namespace ttykit::ui {

ColorScope::ColorScope(term::IConsole& console, term::Color color)
    : console_(console), previous_(console.foreground()) {
  console_.set_foreground(color);
}

ColorScope::~ColorScope() {
  console_.set_foreground(previous_);
}

} // namespace ttykit::ui
