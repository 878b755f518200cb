#pragma once

#include <optional>
#include <unistd.h>

namespace ttykit::term {

struct StreamState {
  bool input_redirected{true};
  bool output_redirected{true};
};

// Decides once per stream whether it is attached to an interactive terminal.
// A stream counts as redirected when its descriptor is not a character device
// or the terminal-mode query fails on it (/dev/null is a character device
// without terminal modes). Any OS query failure also counts as redirected.
class StreamProbe {
public:
  explicit StreamProbe(int input_fd = STDIN_FILENO, int output_fd = STDOUT_FILENO);

  [[nodiscard]] bool input_redirected();
  [[nodiscard]] bool output_redirected();
  [[nodiscard]] StreamState state();

private:
  int input_fd_;
  int output_fd_;
  std::optional<bool> input_redirected_;
  std::optional<bool> output_redirected_;
};

// Single descriptor check, uncached.
[[nodiscard]] bool is_redirected(int fd);

} // namespace ttykit::term
