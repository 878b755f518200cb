#include "term/Console.hpp"
#include <array>
#include <cctype>
#include <charconv>
#include <string>

namespace ttykit::term {

static constexpr std::array<const char*, 16> kColorNames = {
  "black", "red", "green", "yellow", "blue", "magenta", "cyan", "white",
  "bright_black", "bright_red", "bright_green", "bright_yellow",
  "bright_blue", "bright_magenta", "bright_cyan", "bright_white",
};

std::optional<Color> parse_color(std::string_view name) {
  std::string s;
  s.reserve(name.size());
  for (char c : name) {
    if (c == '-' || c == ' ') c = '_';
    s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (s.empty()) return std::nullopt;
  if (s == "default") return Color::Default;
  if (s == "gray" || s == "grey") return Color::White;
  if (s == "dark_gray" || s == "dark_grey") return Color::BrightBlack;
  for (size_t i = 0; i < kColorNames.size(); ++i) {
    if (s == kColorNames[i]) return static_cast<Color>(i);
  }
  int idx = -1;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), idx);
  if (ec == std::errc() && ptr == s.data() + s.size() && idx >= 0 && idx <= 15)
    return static_cast<Color>(idx);
  return std::nullopt;
}

const char* color_name(Color c) {
  int idx = static_cast<int>(c);
  if (idx < 0 || idx >= static_cast<int>(kColorNames.size())) return "default";
  return kColorNames[static_cast<size_t>(idx)];
}

} // namespace ttykit::term
