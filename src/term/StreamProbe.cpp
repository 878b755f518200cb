#include "term/StreamProbe.hpp"
#include "util/Trace.hpp"
#include <cerrno>
#include <cstring>
#include <string>
#include <sys/stat.h>
#include <termios.h>

namespace ttykit::term {

bool is_redirected(int fd) {
  struct stat st{};
  if (::fstat(fd, &st) != 0) {
    util::trace("StreamProbe", "fstat(" + std::to_string(fd) + ") failed: " + std::strerror(errno));
    return true;
  }
  if (!S_ISCHR(st.st_mode)) return true;
  termios mode{};
  return ::tcgetattr(fd, &mode) != 0;
}

StreamProbe::StreamProbe(int input_fd, int output_fd)
    : input_fd_(input_fd), output_fd_(output_fd) {}

bool StreamProbe::input_redirected() {
  if (!input_redirected_) {
    input_redirected_ = is_redirected(input_fd_);
    util::trace("StreamProbe", std::string("input ") + (*input_redirected_ ? "redirected" : "is a terminal"));
  }
  return *input_redirected_;
}

bool StreamProbe::output_redirected() {
  if (!output_redirected_) {
    output_redirected_ = is_redirected(output_fd_);
    util::trace("StreamProbe", std::string("output ") + (*output_redirected_ ? "redirected" : "is a terminal"));
  }
  return *output_redirected_;
}

StreamState StreamProbe::state() {
  return StreamState{input_redirected(), output_redirected()};
}

} // namespace ttykit::term
