#include "util/Trace.hpp"
#include <atomic>
#include <cstdio>
#include <cstdlib>

namespace ttykit::util {

static bool env_trace_default() {
  const char* v = std::getenv("TTYKIT_TRACE");
  if (!v || !*v) v = std::getenv("ttykit_TRACE");
  return v && (v[0]=='1'||v[0]=='t'||v[0]=='T'||v[0]=='y'||v[0]=='Y');
}

static std::atomic<int>& trace_state() {
  // -1: not yet resolved from the environment
  static std::atomic<int> state{-1};
  return state;
}

bool trace_enabled() {
  int s = trace_state().load();
  if (s < 0) {
    s = env_trace_default() ? 1 : 0;
    trace_state().store(s);
  }
  return s == 1;
}

void set_trace_enabled(bool enabled) {
  trace_state().store(enabled ? 1 : 0);
}

void trace(const char* component, const std::string& message) {
  if (!trace_enabled()) return;
  std::fprintf(stderr, "ttykit: %s: %s\n", component, message.c_str());
}

} // namespace ttykit::util
