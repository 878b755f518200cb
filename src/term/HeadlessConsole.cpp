#include "term/HeadlessConsole.hpp"
#include <algorithm>
#include <stdexcept>

namespace ttykit::term {

void HeadlessConsole::push_text(std::string_view text) {
  while (auto d = decode_key(text)) {
    keys_.push_back(d->key);
    text.remove_prefix(d->consumed);
  }
}

int HeadlessConsole::window_width() const {
  events_.push_back("window_width");
  return width_;
}

int HeadlessConsole::cursor_left() const {
  events_.push_back("cursor_left");
  return column_;
}

void HeadlessConsole::set_cursor_left(int col) {
  events_.push_back("set_cursor_left:" + std::to_string(col));
  if (col < 0) col = 0;
  column_ = col;
}

void HeadlessConsole::set_foreground(Color c) {
  events_.push_back(std::string("fg:") + color_name(c));
  fg_ = c;
}

void HeadlessConsole::set_background(Color c) {
  events_.push_back(std::string("bg:") + color_name(c));
  bg_ = c;
}

void HeadlessConsole::put(char c) {
  cells_.push_back({c, fg_, bg_});
  output_.push_back(c);
  if (c == '\n') {
    rows_.push_back(row_);
    row_.clear();
    column_ = 0;
    return;
  }
  if (c == '\r') { column_ = 0; return; }
  if (static_cast<size_t>(column_) < row_.size()) row_[static_cast<size_t>(column_)] = c;
  else {
    row_.resize(static_cast<size_t>(column_), ' ');
    row_.push_back(c);
  }
  ++column_;
  if (column_ >= width_) column_ = std::max(0, width_ - 1);
}

void HeadlessConsole::write(std::string_view text) {
  if (writes_until_failure_ == 0) throw std::runtime_error("headless console: write failed");
  if (writes_until_failure_ > 0) --writes_until_failure_;
  events_.push_back("write:" + std::string(text));
  for (char c : text) put(c);
}

void HeadlessConsole::write_error(std::string_view text) {
  events_.push_back("write_error:" + std::string(text));
  error_fg_ = fg_;
  error_output_.append(text);
}

bool HeadlessConsole::key_available() {
  events_.push_back("key_available");
  return !keys_.empty();
}

std::optional<KeyPress> HeadlessConsole::read_key() {
  events_.push_back("read_key");
  auto& queue = keys_.empty() ? late_keys_ : keys_;
  if (queue.empty()) return std::nullopt;
  KeyPress k = queue.front();
  queue.pop_front();
  ++keys_read_;
  return k;
}

void HeadlessConsole::begin_key_input() {
  events_.push_back("begin_key_input");
  in_key_input_ = true;
}

void HeadlessConsole::end_key_input() {
  events_.push_back("end_key_input");
  in_key_input_ = false;
}

bool HeadlessConsole::has_event(std::string_view prefix) const {
  for (const auto& e : events_)
    if (e.rfind(prefix, 0) == 0) return true;
  return false;
}

} // namespace ttykit::term
