#include "minitest.hpp"
#include "term/Keys.hpp"
#include <vector>

using namespace ttykit::term;

static KeyCode code_of(std::string_view bytes) {
  auto d = decode_key(bytes);
  if (!d) throw mini::AssertionError("decode_key returned nullopt");
  return d->key.code;
}

static size_t consumed_of(std::string_view bytes) {
  auto d = decode_key(bytes);
  if (!d) throw mini::AssertionError("decode_key returned nullopt");
  return d->consumed;
}

TEST(ignorable_keys_are_not_input) {
  for (KeyCode k : {KeyCode::Shift, KeyCode::Control, KeyCode::Alt, KeyCode::CapsLock,
                    KeyCode::NumLock, KeyCode::ScrollLock, KeyCode::LeftWindows,
                    KeyCode::RightWindows, KeyCode::Applications, KeyCode::Pause,
                    KeyCode::PrintScreen, KeyCode::Print, KeyCode::VolumeUp,
                    KeyCode::MediaPlay, KeyCode::BrowserBack, KeyCode::LaunchApp2}) {
    ASSERT_FALSE(is_input_key(k));
  }
}

TEST(ordinary_keys_are_input) {
  for (KeyCode k : {KeyCode::A, KeyCode::Z, KeyCode::D5, KeyCode::Enter, KeyCode::Escape,
                    KeyCode::Spacebar, KeyCode::F1, KeyCode::UpArrow, KeyCode::Delete,
                    KeyCode::None, KeyCode::Oem1}) {
    ASSERT_TRUE(is_input_key(k));
  }
}

TEST(decode_empty_is_nullopt) {
  ASSERT_FALSE(decode_key("").has_value());
}

TEST(decode_printable_ascii) {
  auto d = decode_key("q");
  ASSERT_TRUE(d.has_value());
  ASSERT_EQ(d->key.code, KeyCode::Q);
  ASSERT_EQ(d->key.ch, 'q');
  ASSERT_EQ(d->consumed, 1u);
  ASSERT_EQ(code_of("7"), KeyCode::D7);
  ASSERT_EQ(code_of(" "), KeyCode::Spacebar);
  ASSERT_EQ(code_of("/"), KeyCode::Oem2);
}

TEST(decode_control_bytes) {
  ASSERT_EQ(code_of("\r"), KeyCode::Enter);
  ASSERT_EQ(code_of("\n"), KeyCode::Enter);
  ASSERT_EQ(code_of("\t"), KeyCode::Tab);
  ASSERT_EQ(code_of("\x7F"), KeyCode::Backspace);
  ASSERT_EQ(code_of("\x03"), KeyCode::C); // Ctrl+C
  ASSERT_EQ(code_of("\x1C"), KeyCode::None);
  // Ctrl+backslash must not decode as an ignorable key
  ASSERT_TRUE(is_input_key(code_of("\x1C")));
}

TEST(decode_arrow_and_navigation_sequences) {
  ASSERT_EQ(code_of("\x1B[A"), KeyCode::UpArrow);
  ASSERT_EQ(code_of("\x1B[D"), KeyCode::LeftArrow);
  ASSERT_EQ(code_of("\x1BOB"), KeyCode::DownArrow);
  ASSERT_EQ(code_of("\x1B[H"), KeyCode::Home);
  ASSERT_EQ(code_of("\x1B[3~"), KeyCode::Delete);
  ASSERT_EQ(code_of("\x1B[5~"), KeyCode::PageUp);
  ASSERT_EQ(code_of("\x1B[15~"), KeyCode::F5);
  ASSERT_EQ(code_of("\x1BOP"), KeyCode::F1);
  ASSERT_EQ(consumed_of("\x1B[15~rest"), 5u);
}

TEST(decode_modified_sequences_use_first_param) {
  // Ctrl+Right and Shift+Delete
  ASSERT_EQ(code_of("\x1B[1;5C"), KeyCode::RightArrow);
  ASSERT_EQ(code_of("\x1B[3;2~"), KeyCode::Delete);
  ASSERT_EQ(consumed_of("\x1B[1;5C"), 6u);
}

TEST(decode_overlong_parameter_is_unknown_key) {
  auto d = decode_key("\x1B[99999999999~");
  ASSERT_TRUE(d.has_value());
  ASSERT_EQ(d->key.code, KeyCode::None);
  ASSERT_EQ(d->consumed, 14u);
  // A modifier after an overlong first parameter is still consumed
  ASSERT_EQ(consumed_of("\x1B[123456789012;5A"), 17u);
}

TEST(decode_lone_and_double_escape) {
  ASSERT_EQ(code_of("\x1B"), KeyCode::Escape);
  ASSERT_EQ(consumed_of("\x1B"), 1u);
  ASSERT_EQ(code_of("\x1B\x1B[A"), KeyCode::Escape);
  ASSERT_EQ(consumed_of("\x1B\x1B[A"), 1u);
}

TEST(decode_incomplete_sequence_is_escape) {
  ASSERT_EQ(code_of("\x1B[1;"), KeyCode::Escape);
  ASSERT_EQ(consumed_of("\x1B[1;"), 4u);
  ASSERT_EQ(code_of("\x1BO"), KeyCode::Escape);
}

TEST(decode_alt_key) {
  auto d = decode_key("\x1Bx");
  ASSERT_TRUE(d.has_value());
  ASSERT_EQ(d->key.code, KeyCode::X);
  ASSERT_EQ(d->consumed, 2u);
}

TEST(decode_utf8_character_as_one_key) {
  auto d = decode_key("\xE2\x82\xAC" "a");
  ASSERT_TRUE(d.has_value());
  ASSERT_EQ(d->key.code, KeyCode::None);
  ASSERT_EQ(d->consumed, 3u);
  // Truncated sequence consumes what is there
  ASSERT_EQ(consumed_of("\xE2\x82"), 2u);
}

TEST(decode_burst_key_by_key) {
  std::string_view burst = "a\x1B[Bz";
  std::vector<KeyCode> codes;
  while (auto d = decode_key(burst)) {
    codes.push_back(d->key.code);
    burst.remove_prefix(d->consumed);
  }
  ASSERT_EQ(codes.size(), 3u);
  ASSERT_EQ(codes[0], KeyCode::A);
  ASSERT_EQ(codes[1], KeyCode::DownArrow);
  ASSERT_EQ(codes[2], KeyCode::Z);
}
