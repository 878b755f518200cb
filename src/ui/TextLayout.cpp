#include "ui/TextLayout.hpp"
#include <algorithm>
#include <cctype>

namespace ttykit::ui {

std::string_view trim_end(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

std::vector<std::string_view> split_lines(std::string_view text) {
  std::vector<std::string_view> out;
  size_t start = 0;
  while (true) {
    size_t nl = text.find('\n', start);
    if (nl == std::string_view::npos) {
      out.push_back(text.substr(start));
      break;
    }
    out.push_back(text.substr(start, nl - start));
    start = nl + 1;
  }
  return out;
}

int infer_indent(std::string_view input, bool table_mode) {
  if (table_mode) {
    size_t pos = input.rfind("  ");
    return pos == std::string_view::npos ? 0 : static_cast<int>(pos) + 2;
  }
  int indent = 0;
  while (static_cast<size_t>(indent) < input.size() && input[static_cast<size_t>(indent)] == ' ') ++indent;
  return indent;
}

// Move a hard break back so it does not land inside a UTF-8 sequence.
static size_t char_boundary(std::string_view s, size_t pos) {
  size_t p = pos;
  while (p > 0 && (static_cast<unsigned char>(s[p]) & 0xC0) == 0x80) --p;
  return p > 0 ? p : pos;
}

std::string format_wrapped(std::string_view input, int width, bool table_mode) {
  if (trim_end(input).empty()) return "\n";

  const int indent = infer_indent(input, table_mode);
  const std::string indent_str(static_cast<size_t>(indent), ' ');
  width = std::max(width, kMinWrapWidth);

  std::string output;
  output.reserve(input.size() + input.size() / 8 + 1);
  bool first_line = true;
  bool reduced_width = false;
  std::string_view rest = input;
  while (!rest.empty()) {
    size_t pos = static_cast<size_t>(width - 1);
    size_t next;
    if (pos >= rest.size()) {
      pos = rest.size();
      next = pos;
    } else {
      size_t space = pos;
      while (space > 0 && rest[space] != ' ') --space;
      if (space > 0) {
        pos = space;
        next = space + 1; // the break space is dropped
      } else {
        // No space to wrap at: cut at full width
        pos = char_boundary(rest, pos);
        next = pos;
      }
    }
    if (!first_line) output += indent_str;
    output.append(rest.substr(0, pos));
    output += '\n';
    first_line = false;
    rest.remove_prefix(next);
    if (!rest.empty() && !reduced_width) {
      width = std::max(width - indent, kMinWrapWidth);
      reduced_width = true;
    }
  }
  return output;
}

} // namespace ttykit::ui
