#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ttykit::ui {

// Width used when output is not a terminal
inline constexpr int kFallbackWidth = 80;
// Narrower requests are raised to this so every pass consumes input
inline constexpr int kMinWrapWidth = 2;

// Indent carried onto continuation lines.
// table_mode: just past the last run of two spaces (0 if none).
// otherwise: number of leading spaces.
[[nodiscard]] int infer_indent(std::string_view input, bool table_mode);

// Wrap `input` (a single line) to `width` columns, breaking at spaces where
// possible. Every line ends with '\n'; lines after the first are prefixed
// with the inferred indent and, after the first break, wrap within
// width - indent.
[[nodiscard]] std::string format_wrapped(std::string_view input, int width, bool table_mode);

// Split on '\n' (a trailing '\n' yields a final empty line).
[[nodiscard]] std::vector<std::string_view> split_lines(std::string_view text);

[[nodiscard]] std::string_view trim_end(std::string_view s);

} // namespace ttykit::ui
