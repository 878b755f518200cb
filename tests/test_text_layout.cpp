#include "minitest.hpp"
#include "ui/TextLayout.hpp"
#include <string>
#include <vector>

using namespace ttykit::ui;

static std::vector<std::string> lines_of(const std::string& s) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start < s.size()) {
    size_t nl = s.find('\n', start);
    if (nl == std::string::npos) nl = s.size();
    out.emplace_back(s.substr(start, nl - start));
    start = nl + 1;
  }
  return out;
}

TEST(wrap_breaks_at_last_space) {
  ASSERT_EQ(format_wrapped("The quick brown fox jumps", 11, false),
            std::string("The quick\nbrown fox\njumps\n"));
}

TEST(wrap_indents_continuation_lines) {
  // Leading spaces are carried and the remaining lines wrap in width - indent
  ASSERT_EQ(format_wrapped("  key: value that is long", 15, false),
            std::string("  key: value\n  that is long\n"));
}

TEST(wrap_short_input_is_one_line) {
  ASSERT_EQ(format_wrapped("short", 80, false), std::string("short\n"));
  ASSERT_EQ(format_wrapped("  indented", 80, false), std::string("  indented\n"));
}

TEST(wrap_empty_input_is_a_bare_newline) {
  ASSERT_EQ(format_wrapped("", 40, false), std::string("\n"));
  ASSERT_EQ(format_wrapped("   ", 40, true), std::string("\n"));
}

TEST(infer_indent_normal_counts_leading_spaces) {
  ASSERT_EQ(infer_indent("    four", false), 4);
  ASSERT_EQ(infer_indent("none", false), 0);
  ASSERT_EQ(infer_indent("a  b", false), 0);
}

TEST(infer_indent_table_uses_last_double_space) {
  ASSERT_EQ(infer_indent("opt  description", true), 5);
  ASSERT_EQ(infer_indent("a  b  c", true), 6);
  ASSERT_EQ(infer_indent("no double space", true), 0);
  ASSERT_EQ(infer_indent("  lead only", true), 2);
}

TEST(wrap_table_mode_aligns_description_column) {
  auto out = format_wrapped("--flag  turns on the thing that is described here", 24, true);
  auto lines = lines_of(out);
  ASSERT_TRUE(lines.size() >= 2);
  ASSERT_EQ(lines[0].rfind("--flag  ", 0), 0u);
  for (size_t i = 1; i < lines.size(); ++i) {
    ASSERT_EQ(lines[i].rfind("        ", 0), 0u);
    ASSERT_TRUE(lines[i][8] != ' ');
  }
}

TEST(wrap_table_mode_without_double_space_has_no_indent) {
  auto lines = lines_of(format_wrapped("one two three four five six", 10, true));
  ASSERT_TRUE(lines.size() > 1);
  for (const auto& l : lines) ASSERT_TRUE(l.empty() || l[0] != ' ');
}

TEST(wrap_lines_stay_below_width) {
  const std::string text =
    "Lorem ipsum dolor sit amet consectetur adipiscing elit sed do eiusmod tempor "
    "incididunt ut labore et dolore magna aliqua";
  for (int width : {8, 13, 20, 33, 79}) {
    for (const auto& l : lines_of(format_wrapped(text, width, false)))
      ASSERT_TRUE(static_cast<int>(l.size()) <= width - 1);
  }
  for (const auto& l : lines_of(format_wrapped("   " + text, 20, false)))
    ASSERT_TRUE(static_cast<int>(l.size()) <= 19);
}

TEST(wrap_hard_breaks_long_words) {
  ASSERT_EQ(format_wrapped("abcdefghij", 5, false), std::string("abcd\nefgh\nij\n"));
}

TEST(wrap_does_not_split_utf8_sequences) {
  // A cut at byte 3 would land inside the two-byte e-acute
  std::string s = "ab\xC3\xA9" "cd";
  ASSERT_EQ(format_wrapped(s, 4, false), std::string("ab\n\xC3\xA9" "c\nd\n"));
}

TEST(wrap_tiny_width_still_terminates) {
  ASSERT_EQ(format_wrapped("abc", 0, false), std::string("a\nb\nc\n"));
  ASSERT_EQ(format_wrapped("abc", -5, false), std::string("a\nb\nc\n"));
  ASSERT_EQ(format_wrapped("a b", 1, false), std::string("a\nb\n"));
}

TEST(wrap_indent_wider_than_width_terminates) {
  auto out = format_wrapped("          deep indent text", 6, false);
  ASSERT_FALSE(out.empty());
  ASSERT_EQ(out.back(), '\n');
}

TEST(split_lines_keeps_empty_lines) {
  auto v = split_lines("a\n\nb\n");
  ASSERT_EQ(v.size(), 4u);
  ASSERT_EQ(v[0], "a");
  ASSERT_EQ(v[1], "");
  ASSERT_EQ(v[2], "b");
  ASSERT_EQ(v[3], "");
}

TEST(trim_end_drops_trailing_whitespace) {
  ASSERT_EQ(trim_end("text \t\r"), "text");
  ASSERT_EQ(trim_end("  lead"), "  lead");
  ASSERT_EQ(trim_end(""), "");
}
