#include "term/Keys.hpp"
#include <algorithm>
#include <array>

namespace ttykit::term {

static constexpr std::array<KeyCode, 30> kIgnoredKeys = {
  KeyCode::Shift, KeyCode::Control, KeyCode::Alt, KeyCode::Pause, KeyCode::CapsLock,
  KeyCode::Print, KeyCode::PrintScreen,
  KeyCode::LeftWindows, KeyCode::RightWindows, KeyCode::Applications,
  KeyCode::NumLock, KeyCode::ScrollLock,
  KeyCode::BrowserBack, KeyCode::BrowserForward, KeyCode::BrowserRefresh, KeyCode::BrowserStop,
  KeyCode::BrowserSearch, KeyCode::BrowserFavorites, KeyCode::BrowserHome,
  KeyCode::VolumeMute, KeyCode::VolumeDown, KeyCode::VolumeUp,
  KeyCode::MediaNext, KeyCode::MediaPrevious, KeyCode::MediaStop, KeyCode::MediaPlay,
  KeyCode::LaunchMail, KeyCode::LaunchMediaSelect, KeyCode::LaunchApp1, KeyCode::LaunchApp2,
};

bool is_input_key(KeyCode code) {
  return std::find(kIgnoredKeys.begin(), kIgnoredKeys.end(), code) == kIgnoredKeys.end();
}

static int u8_len(unsigned char c) {
  if (c < 0x80) return 1;
  if ((c >> 5) == 0x6) return 2;
  if ((c >> 4) == 0xE) return 3;
  if ((c >> 3) == 0x1E) return 4;
  return 1;
}

static KeyCode ascii_code(unsigned char c) {
  if (c >= 'a' && c <= 'z') return static_cast<KeyCode>('A' + (c - 'a'));
  if (c >= 'A' && c <= 'Z') return static_cast<KeyCode>(c);
  if (c >= '0' && c <= '9') return static_cast<KeyCode>(c);
  switch (c) {
    case ' ': return KeyCode::Spacebar;
    case ';': case ':': return KeyCode::Oem1;
    case '=': case '+': return KeyCode::OemPlus;
    case ',': case '<': return KeyCode::OemComma;
    case '-': case '_': return KeyCode::OemMinus;
    case '.': case '>': return KeyCode::OemPeriod;
    case '/': case '?': return KeyCode::Oem2;
    case '`': case '~': return KeyCode::Oem3;
    case '[': case '{': return KeyCode::Oem4;
    case '\\': case '|': return KeyCode::Oem5;
    case ']': case '}': return KeyCode::Oem6;
    case '\'': case '"': return KeyCode::Oem7;
    default: return KeyCode::None;
  }
}

// Single byte (or UTF-8 sequence) outside of an escape sequence.
static DecodedKey decode_plain(std::string_view bytes) {
  unsigned char c = static_cast<unsigned char>(bytes[0]);
  switch (c) {
    case 0x00: return {{KeyCode::Spacebar, 0}, 1};
    case 0x08: case 0x7F: return {{KeyCode::Backspace, 0}, 1};
    case 0x09: return {{KeyCode::Tab, '\t'}, 1};
    case 0x0A: case 0x0D: return {{KeyCode::Enter, '\r'}, 1};
    default: break;
  }
  if (c <= 0x1A) {
    // Ctrl+letter
    return {{static_cast<KeyCode>('A' + c - 1), static_cast<char>(c)}, 1};
  }
  if (c < 0x20) return {{KeyCode::None, static_cast<char>(c)}, 1};
  if (c < 0x80) return {{ascii_code(c), static_cast<char>(c)}, 1};
  size_t len = std::min<size_t>(static_cast<size_t>(u8_len(c)), bytes.size());
  return {{KeyCode::None, 0}, len};
}

static KeyCode tilde_code(int param) {
  switch (param) {
    case 1: case 7: return KeyCode::Home;
    case 2: return KeyCode::Insert;
    case 3: return KeyCode::Delete;
    case 4: case 8: return KeyCode::End;
    case 5: return KeyCode::PageUp;
    case 6: return KeyCode::PageDown;
    case 11: return KeyCode::F1;
    case 12: return KeyCode::F2;
    case 13: return KeyCode::F3;
    case 14: return KeyCode::F4;
    case 15: return KeyCode::F5;
    case 17: return KeyCode::F6;
    case 18: return KeyCode::F7;
    case 19: return KeyCode::F8;
    case 20: return KeyCode::F9;
    case 21: return KeyCode::F10;
    case 23: return KeyCode::F11;
    case 24: return KeyCode::F12;
    case 29: return KeyCode::Applications;
    default: return KeyCode::None;
  }
}

static KeyCode final_code(unsigned char f) {
  switch (f) {
    case 'A': return KeyCode::UpArrow;
    case 'B': return KeyCode::DownArrow;
    case 'C': return KeyCode::RightArrow;
    case 'D': return KeyCode::LeftArrow;
    case 'E': return KeyCode::Clear;
    case 'H': return KeyCode::Home;
    case 'F': return KeyCode::End;
    case 'P': return KeyCode::F1;
    case 'Q': return KeyCode::F2;
    case 'R': return KeyCode::F3;
    case 'S': return KeyCode::F4;
    case 'Z': return KeyCode::Tab; // shift+tab
    default: return KeyCode::None;
  }
}

std::optional<DecodedKey> decode_key(std::string_view bytes) {
  if (bytes.empty()) return std::nullopt;
  if (bytes[0] != '\x1B') return decode_plain(bytes);
  if (bytes.size() == 1) return DecodedKey{{KeyCode::Escape, '\x1B'}, 1};

  unsigned char intro = static_cast<unsigned char>(bytes[1]);
  if (intro == 'O') {
    // SS3: ESC O <final>
    if (bytes.size() < 3) return DecodedKey{{KeyCode::Escape, '\x1B'}, bytes.size()};
    return DecodedKey{{final_code(static_cast<unsigned char>(bytes[2])), 0}, 3};
  }
  if (intro == '[') {
    // CSI: ESC [ params final, params are digits and ';'
    size_t k = 2;
    int first_param = -1;
    int cur = 0; bool in_num = false;
    while (k < bytes.size()) {
      unsigned char c = static_cast<unsigned char>(bytes[k]);
      if (c >= '0' && c <= '9') {
        // Larger parameters name no key; stop growing before int overflows
        if (cur < 10000) cur = cur * 10 + (c - '0');
        in_num = true; ++k; continue;
      }
      if (c == ';') {
        if (first_param < 0) first_param = in_num ? cur : 0;
        cur = 0; in_num = false; ++k; continue;
      }
      break;
    }
    if (first_param < 0 && in_num) first_param = cur;
    if (k >= bytes.size()) return DecodedKey{{KeyCode::Escape, '\x1B'}, bytes.size()};
    unsigned char f = static_cast<unsigned char>(bytes[k]);
    KeyCode code = (f == '~') ? tilde_code(first_param) : final_code(f);
    return DecodedKey{{code, 0}, k + 1};
  }
  if (intro == '\x1B') return DecodedKey{{KeyCode::Escape, '\x1B'}, 1};
  // Alt+key arrives as ESC followed by the key itself
  auto rest = decode_plain(bytes.substr(1));
  rest.consumed += 1;
  return rest;
}

} // namespace ttykit::term
