#pragma once

#include <string>

namespace ttykit::util {

// Opt-in diagnostics on stderr: "ttykit: <component>: <message>".
// Off unless enabled by configuration, TTYKIT_TRACE or --verbose.
[[nodiscard]] bool trace_enabled();
void set_trace_enabled(bool enabled);

void trace(const char* component, const std::string& message);

} // namespace ttykit::util
