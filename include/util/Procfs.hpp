// Helpers for reading /proc with optional root remap
#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace ttykit::util {

// Map an absolute /proc path to an alternate root if TTYKIT_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// Extract the TracerPid field from /proc/<pid>/status text. 0 when absent.
[[nodiscard]] auto parse_tracer_pid(std::string_view status) -> int;

// True when a tracer (debugger) is attached to this process.
[[nodiscard]] auto debugger_attached() -> bool;

} // namespace ttykit::util
