#include "util/Procfs.hpp"
#include "util/Trace.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace ttykit::util {

static std::string proc_root() {
  const char* env = std::getenv("TTYKIT_PROC_ROOT");
  if (env && *env) return std::string(env);
  return std::string();
}

auto map_proc_path(const std::string& abs) -> std::string {
  if (abs.rfind("/proc", 0) != 0) return abs; // not under /proc
  auto root = proc_root();
  if (root.empty()) return abs;
  std::filesystem::path p(root);
  p /= std::filesystem::path(abs.substr(1)); // drop leading '/'
  return p.string();
}

auto read_file_string(const std::string& abs) -> std::optional<std::string> {
  std::ifstream in(map_proc_path(abs));
  if (!in) return std::nullopt;
  std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) return std::nullopt;
  return s;
}

auto parse_tracer_pid(std::string_view status) -> int {
  constexpr std::string_view key = "TracerPid:";
  size_t pos = 0;
  while (pos < status.size()) {
    size_t eol = status.find('\n', pos);
    if (eol == std::string_view::npos) eol = status.size();
    auto line = status.substr(pos, eol - pos);
    if (line.rfind(key, 0) == 0) {
      auto v = line.substr(key.size());
      while (!v.empty() && (v.front() == ' ' || v.front() == '\t')) v.remove_prefix(1);
      int pid = 0;
      auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), pid);
      if (ec != std::errc()) return 0;
      return pid;
    }
    pos = eol + 1;
  }
  return 0;
}

auto debugger_attached() -> bool {
  auto status = read_file_string("/proc/self/status");
  if (!status) {
    trace("Procfs", "cannot read /proc/self/status; assuming no debugger");
    return false;
  }
  return parse_tracer_pid(*status) != 0;
}

} // namespace ttykit::util
