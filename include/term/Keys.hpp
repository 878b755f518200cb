#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace ttykit::term {

// Key identifiers, numbered like the platform virtual-key codes so that the
// ignorable-key table stays recognizable. None marks a character key without
// a dedicated code (e.g. non-ASCII text).
enum class KeyCode : int {
  None = 0,
  Backspace = 8, Tab = 9, Clear = 12, Enter = 13,
  Shift = 16, Control = 17, Alt = 18, Pause = 19, CapsLock = 20,
  Escape = 27, Spacebar = 32,
  PageUp = 33, PageDown = 34, End = 35, Home = 36,
  LeftArrow = 37, UpArrow = 38, RightArrow = 39, DownArrow = 40,
  Print = 42, PrintScreen = 44, Insert = 45, Delete = 46,
  D0 = 48, D1, D2, D3, D4, D5, D6, D7, D8, D9,
  A = 65, B, C, D, E, F, G, H, I, J, K, L, M,
  N, O, P, Q, R, S, T, U, V, W, X, Y, Z,
  LeftWindows = 91, RightWindows = 92, Applications = 93,
  F1 = 112, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12,
  NumLock = 144, ScrollLock = 145,
  BrowserBack = 166, BrowserForward = 167, BrowserRefresh = 168, BrowserStop = 169,
  BrowserSearch = 170, BrowserFavorites = 171, BrowserHome = 172,
  VolumeMute = 173, VolumeDown = 174, VolumeUp = 175,
  MediaNext = 176, MediaPrevious = 177, MediaStop = 178, MediaPlay = 179,
  LaunchMail = 180, LaunchMediaSelect = 181, LaunchApp1 = 182, LaunchApp2 = 183,
  Oem1 = 186, OemPlus = 187, OemComma = 188, OemMinus = 189, OemPeriod = 190,
  Oem2 = 191, Oem3 = 192, Oem4 = 219, Oem5 = 220, Oem6 = 221, Oem7 = 222,
};

struct KeyPress {
  KeyCode code{KeyCode::None};
  char ch{0}; // ASCII character when the key produced one, else 0
};

struct DecodedKey {
  KeyPress key;
  size_t consumed{0}; // bytes of input used by this key
};

// False for modifier, lock and media keys that should not count as a
// deliberate key press.
[[nodiscard]] bool is_input_key(KeyCode code);

// Decode the first key of a burst of raw terminal input (plain bytes, control
// characters, CSI/SS3 escape sequences, Alt+key). std::nullopt on empty input.
[[nodiscard]] std::optional<DecodedKey> decode_key(std::string_view bytes);

} // namespace ttykit::term
