#pragma once
/*
 * HeadlessConsole
 *
 * Purpose: in-memory IConsole for tests. Records every primitive call,
 * simulates one terminal row (cursor column, overwrites, colors per cell)
 * and serves keys from a queue.
 */
#include "term/Console.hpp"
#include <deque>
#include <string>
#include <vector>

namespace ttykit::term {

class HeadlessConsole : public IConsole {
public:
  struct Cell {
    char ch;
    Color fg;
    Color bg;
  };

  HeadlessConsole() = default;

  // --- setup ---
  void set_input_redirected(bool v) { input_redirected_ = v; }
  void set_output_redirected(bool v) { output_redirected_ = v; }
  void set_interactive(bool v) { interactive_ = v; }
  void set_debugger_attached(bool v) { debugger_ = v; }
  void set_window_width(int w) { width_ = w; }
  void push_key(KeyPress k) { keys_.push_back(k); }
  void push_text(std::string_view text);
  // Keys typed while read_key() blocks: invisible to key_available() and
  // served only once the type-ahead queue is empty
  void push_key_when_blocked(KeyPress k) { late_keys_.push_back(k); }
  // Throw std::runtime_error from write() once `n` more writes succeeded
  void fail_writes_after(int n) { writes_until_failure_ = n; }

  // --- IConsole ---
  bool input_redirected() const override { return input_redirected_; }
  bool output_redirected() const override { return output_redirected_; }
  bool user_interactive() const override { return interactive_; }
  bool debugger_attached() const override { return debugger_; }

  int window_width() const override;
  int cursor_left() const override;
  void set_cursor_left(int col) override;

  Color foreground() const override { return fg_; }
  Color background() const override { return bg_; }
  void set_foreground(Color c) override;
  void set_background(Color c) override;

  void write(std::string_view text) override;
  void write_error(std::string_view text) override;

  bool key_available() override;
  std::optional<KeyPress> read_key() override;
  void begin_key_input() override;
  void end_key_input() override;

  // --- inspection ---
  [[nodiscard]] const std::string& output() const { return output_; }
  [[nodiscard]] const std::string& error_output() const { return error_output_; }
  [[nodiscard]] const std::vector<Cell>& cells() const { return cells_; }
  [[nodiscard]] const std::vector<std::string>& events() const { return events_; }
  [[nodiscard]] size_t pending_keys() const { return keys_.size(); }
  [[nodiscard]] int keys_read() const { return keys_read_; }
  [[nodiscard]] bool in_key_input() const { return in_key_input_; }
  [[nodiscard]] Color error_foreground() const { return error_fg_; }
  // Text of the simulated current row, after overwrites
  [[nodiscard]] const std::string& row() const { return row_; }
  // Rows finished with '\n'
  [[nodiscard]] const std::vector<std::string>& rows() const { return rows_; }
  [[nodiscard]] bool has_event(std::string_view prefix) const;
  void clear_events() { events_.clear(); }

private:
  void put(char c);

  bool input_redirected_{false};
  bool output_redirected_{false};
  bool interactive_{true};
  bool debugger_{false};
  bool in_key_input_{false};
  int width_{80};
  int column_{0};
  int writes_until_failure_{-1};
  int keys_read_{0};
  Color fg_{Color::Default};
  Color bg_{Color::Default};
  Color error_fg_{Color::Default};
  std::deque<KeyPress> keys_;
  std::deque<KeyPress> late_keys_;
  std::string output_;
  std::string error_output_;
  std::string row_;
  std::vector<std::string> rows_;
  std::vector<Cell> cells_;
  mutable std::vector<std::string> events_;
};

} // namespace ttykit::term
