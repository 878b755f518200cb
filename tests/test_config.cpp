#include "minitest.hpp"
#include "app/Config.hpp"
#include "util/TomlReader.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace ttykit;

static std::string tmp_path(const char* suffix) {
  return std::string("/tmp/ttykit_test_config_") + suffix + ".toml";
}

static void write_file(const std::string& path, const std::string& content) {
  std::ofstream f(path);
  f << content;
}

static void remove_file(const std::string& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

TEST(toml_load_missing_file) {
  util::TomlReader tr;
  ASSERT_FALSE(tr.load("/tmp/ttykit_test_config_nonexistent.toml"));
}

TEST(toml_reads_sections_and_types) {
  auto path = tmp_path("types");
  write_file(path,
    "# top comment\n"
    "[output]\n"
    "fallback_width = 100   # trailing comment\n"
    "color = \"never\"\n"
    "\n"
    "[wait]\n"
    "message = \"Hit # to go\"\n"
    "non_interactive = true\n"
  );
  util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_int("output", "fallback_width"), 100);
  ASSERT_EQ(tr.get_string("output", "color"), "never");
  ASSERT_EQ(tr.get_string("wait", "message"), "Hit # to go");
  ASSERT_EQ(tr.get_bool("wait", "non_interactive", false), true);
  ASSERT_TRUE(tr.has("wait", "message"));
  ASSERT_FALSE(tr.has("wait", "missing"));
  ASSERT_FALSE(tr.has("nosection", "message"));
  remove_file(path);
}

TEST(toml_bad_values_use_defaults) {
  auto path = tmp_path("bad");
  write_file(path, "[output]\nfallback_width = 12abc\nflag = maybe\n");
  util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_int("output", "fallback_width", 80), 80);
  ASSERT_EQ(tr.get_bool("output", "flag", true), true);
  remove_file(path);
}

TEST(toml_unescapes_quoted_strings) {
  auto path = tmp_path("escape");
  write_file(path, "[wait]\nmessage = \"say \\\"hi\\\"\\tnow\"\n");
  util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_string("wait", "message"), "say \"hi\"\tnow");
  remove_file(path);
}

TEST(config_defaults_without_file) {
  auto c = app::load_config("/tmp/ttykit_test_config_nonexistent.toml");
  ASSERT_EQ(c.output.fallback_width, 80);
  ASSERT_TRUE(c.output.color == term::ColorMode::Auto);
  ASSERT_EQ(c.colors.error, term::Color::Red);
  ASSERT_EQ(c.colors.accent, term::Color::Cyan);
  ASSERT_EQ(c.wait.message, "Press any key to continue...");
  ASSERT_EQ(c.wait.debug_message, "Press any key to quit...");
  ASSERT_EQ(c.wait.poll_ms, 100);
  ASSERT_FALSE(c.wait.non_interactive);
}

TEST(config_reads_file) {
  auto path = tmp_path("full");
  write_file(path,
    "[output]\n"
    "fallback_width = 120\n"
    "color = \"always\"\n"
    "[colors]\n"
    "error = \"bright_red\"\n"
    "accent = 3\n"
    "[wait]\n"
    "message = \"Any key...\"\n"
    "poll_ms = 50\n"
    "non_interactive = true\n"
  );
  auto c = app::load_config(path);
  ASSERT_EQ(c.output.fallback_width, 120);
  ASSERT_TRUE(c.output.color == term::ColorMode::Always);
  ASSERT_EQ(c.colors.error, term::Color::BrightRed);
  ASSERT_EQ(c.colors.accent, term::Color::Yellow);
  ASSERT_EQ(c.wait.message, "Any key...");
  ASSERT_EQ(c.wait.poll_ms, 50);
  ASSERT_TRUE(c.wait.non_interactive);

  auto ws = c.wait_settings();
  ASSERT_EQ(ws.message, "Any key...");
  ASSERT_EQ(ws.poll_interval.count(), 50);
  ASSERT_EQ(ws.error_color, term::Color::BrightRed);
  auto opts = c.console_options();
  ASSERT_TRUE(opts.color_mode == term::ColorMode::Always);
  ASSERT_TRUE(opts.force_non_interactive);
  remove_file(path);
}

TEST(config_rejects_out_of_range_values) {
  auto path = tmp_path("range");
  write_file(path,
    "[output]\nfallback_width = 1\ncolor = \"rainbow\"\n"
    "[colors]\nerror = \"chartreuse\"\n"
    "[wait]\npoll_ms = 5000\n"
  );
  auto c = app::load_config(path);
  ASSERT_EQ(c.output.fallback_width, 80);
  ASSERT_TRUE(c.output.color == term::ColorMode::Auto);
  ASSERT_EQ(c.colors.error, term::Color::Red);
  ASSERT_EQ(c.wait.poll_ms, 1000);
  remove_file(path);
}

TEST(config_environment_fills_in_for_file) {
  auto path = tmp_path("env");
  write_file(path, "[output]\nfallback_width = 90\n");
  ::setenv("TTYKIT_FALLBACK_WIDTH", "70", 1);
  ::setenv("ttykit_ERROR_COLOR", "magenta", 1);
  ::setenv("TTYKIT_WAIT_MESSAGE", "from env", 1);
  auto c = app::load_config(path);
  ::unsetenv("TTYKIT_FALLBACK_WIDTH");
  ::unsetenv("ttykit_ERROR_COLOR");
  ::unsetenv("TTYKIT_WAIT_MESSAGE");
  // The file wins where it has a value
  ASSERT_EQ(c.output.fallback_width, 90);
  ASSERT_EQ(c.colors.error, term::Color::Magenta);
  ASSERT_EQ(c.wait.message, "from env");
  remove_file(path);
}

TEST(config_file_path_prefers_explicit_setting) {
  ::setenv("TTYKIT_CONFIG", "/tmp/ttykit_explicit.toml", 1);
  ASSERT_EQ(app::config_file_path(), "/tmp/ttykit_explicit.toml");
  ::unsetenv("TTYKIT_CONFIG");
  const char* old = std::getenv("XDG_CONFIG_HOME");
  std::string saved = old ? old : "";
  ::setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
  auto path = app::config_file_path();
  if (old) ::setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
  else ::unsetenv("XDG_CONFIG_HOME");
  ASSERT_EQ(path, "/tmp/xdg/ttykit/config.toml");
}

TEST(env_helpers) {
  ::setenv("TTYKIT_TEST_INT", "42", 1);
  ::setenv("ttykit_TEST_FLAG", "no", 1);
  ASSERT_EQ(app::getenv_int("TTYKIT_TEST_INT", 0), 42);
  ASSERT_EQ(app::env_flag("TTYKIT_TEST_FLAG", true), false);
  ASSERT_EQ(app::env_flag("TTYKIT_TEST_UNSET_FLAG", true), true);
  ::setenv("TTYKIT_TEST_INT", "forty", 1);
  ASSERT_EQ(app::getenv_int("TTYKIT_TEST_INT", 7), 7);
  ::unsetenv("TTYKIT_TEST_INT");
  ::unsetenv("ttykit_TEST_FLAG");
}
