#include "app/Config.hpp"
#include "term/PosixConsole.hpp"
#include "ui/CursorControl.hpp"
#include "ui/FormattedWriter.hpp"
#include "ui/Interaction.hpp"
#include "ui/TextLayout.hpp"
#include "util/Trace.hpp"

#include <cstddef>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

using namespace ttykit;

static const char* kUsage =
  "Usage: ttykit [--verbose] <command> [options]\n"
  "\n"
  "Commands:\n"
  "  probe  Show whether stdin/stdout are terminals, the session and debugger state, and the layout width.\n"
  "  wrap [--table] [--width N] [--markup] [TEXT...]  Wrap TEXT (or standard input) to the terminal width. --table aligns continuation lines after the last double space; --markup highlights text between { and }.\n"
  "  wait [--timeout S] [--dots] [--message M]  Wait for a key, or count down S seconds.\n"
  "  error MESSAGE [--code N]  Print MESSAGE as an error and exit with code N (default 1).\n"
  "  clear  Clear the current line.\n";

static bool parse_int(const std::string& s, int& out) {
  try {
    size_t used = 0;
    out = std::stoi(s, &used);
    return used == s.size();
  } catch (const std::exception&) {
    return false;
  }
}

static std::string join(const std::vector<std::string>& parts) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i) out.push_back(' ');
    out += parts[i];
  }
  return out;
}

static int cmd_probe(term::IConsole& con, const app::Config& cfg) {
  auto yes_no = [](bool b) { return std::string(b ? "yes" : "no"); };
  std::string report;
  report += "input redirected:   " + yes_no(con.input_redirected()) + "\n";
  report += "output redirected:  " + yes_no(con.output_redirected()) + "\n";
  report += "interactive:        " + yes_no(con.user_interactive()) + "\n";
  report += "debugger attached:  " + yes_no(con.debugger_attached()) + "\n";
  report += "layout width:       " + std::to_string(ui::layout_width(con, cfg.output.fallback_width));
  ui::write_wrapped(con, report, true, cfg.output.fallback_width);
  return 0;
}

static int cmd_wrap(term::IConsole& con, ui::Interaction& interaction, const app::Config& cfg,
                    const std::vector<std::string>& args) {
  bool table = false, markup = false;
  std::optional<int> width;
  std::vector<std::string> words;
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& a = args[i];
    if (a == "--table") table = true;
    else if (a == "--markup") markup = true;
    else if (a == "--width" && i + 1 < args.size()) {
      int w = 0;
      if (!parse_int(args[++i], w) || w < 1) return interaction.exit_error("ttykit: invalid --width: " + args[i], 2);
      width = w;
    }
    else words.push_back(a);
  }
  std::string text;
  if (words.empty()) {
    text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    if (!text.empty() && text.back() == '\n') text.pop_back();
  } else {
    text = join(words);
  }

  if (markup) {
    // One formatter for the whole text so a highlight may span lines
    ui::Formatter fmt = ui::MarkupFormatter(con.foreground(), con.background(), cfg.colors.accent, '{', '}');
    if (width) {
      for (auto line : ui::split_lines(text))
        ui::write_formatted(con, ui::format_wrapped(ui::trim_end(line), *width, table), fmt);
    } else {
      ui::write_wrapped_formatted(con, text, fmt, table, cfg.output.fallback_width);
    }
  } else if (width) {
    for (auto line : ui::split_lines(text))
      con.write(ui::format_wrapped(ui::trim_end(line), *width, table));
  } else {
    ui::write_wrapped(con, text, table, cfg.output.fallback_width);
  }
  return 0;
}

static int cmd_wait(ui::Interaction& interaction, const std::vector<std::string>& args) {
  int timeout = -1;
  bool dots = false;
  std::optional<std::string> message;
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& a = args[i];
    if (a == "--timeout" && i + 1 < args.size()) {
      if (!parse_int(args[++i], timeout)) return interaction.exit_error("ttykit: invalid --timeout: " + args[i], 2);
    }
    else if (a == "--dots") dots = true;
    else if (a == "--message" && i + 1 < args.size()) message = args[++i];
    else return interaction.exit_error("ttykit: unknown wait option: " + a, 2);
  }
  auto outcome = interaction.wait(message, timeout, dots);
  return outcome == ui::WaitOutcome::InputClosed ? 1 : 0;
}

static int cmd_error(ui::Interaction& interaction, const std::vector<std::string>& args) {
  int code = 1;
  std::vector<std::string> words;
  for (size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--code" && i + 1 < args.size()) {
      if (!parse_int(args[++i], code)) return interaction.exit_error("ttykit: invalid --code: " + args[i], 2);
    } else {
      words.push_back(args[i]);
    }
  }
  if (words.empty()) return interaction.exit_error("ttykit: error needs a MESSAGE", 2);
  return interaction.exit_error(join(words), code);
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  size_t i = 0;
  bool help = false;
  for (; i < args.size(); ++i) {
    if (args[i] == "--verbose" || args[i] == "-v") util::set_trace_enabled(true);
    else if (args[i] == "-h" || args[i] == "--help") help = true;
    else break;
  }

  const app::Config& cfg = app::config();
  term::PosixConsole console(cfg.console_options());
  ui::Interaction interaction(console, cfg.wait_settings());

  if (help || i >= args.size()) {
    ui::write_wrapped(console, kUsage, true, cfg.output.fallback_width);
    return help ? 0 : 2;
  }

  const std::string cmd = args[i];
  std::vector<std::string> rest(args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());
  if (cmd == "probe") return cmd_probe(console, cfg);
  if (cmd == "wrap") return cmd_wrap(console, interaction, cfg, rest);
  if (cmd == "wait") return cmd_wait(interaction, rest);
  if (cmd == "error") return cmd_error(interaction, rest);
  if (cmd == "clear") { ui::clear_line(console); return 0; }
  return interaction.exit_error("ttykit: unknown command: " + cmd + " (see --help)", 2);
}
