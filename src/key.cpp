#include "key.hpp"
#include <vector>

static constexpr char ESC = 0x1b;
static constexpr char32_t RUNE_ERROR = 0xfffd;

std::string encode_utf8(char32_t cp) {
  std::string s;
  if (cp < 0x80) {
    s += static_cast<char>(cp);
  } else if (cp < 0x800) {
    s += static_cast<char>(0xc0 | (cp >> 6));
    s += static_cast<char>(0x80 | (cp & 0x3f));
  } else if (cp < 0x10000) {
    s += static_cast<char>(0xe0 | (cp >> 12));
    s += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
    s += static_cast<char>(0x80 | (cp & 0x3f));
  } else {
    s += static_cast<char>(0xf0 | (cp >> 18));
    s += static_cast<char>(0x80 | ((cp >> 12) & 0x3f));
    s += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
    s += static_cast<char>(0x80 | (cp & 0x3f));
  }
  return s;
}

std::string key_name(const KeyMsg& k) {
  std::string base;
  switch (k.type) {
    case KeyType::Rune: base = encode_utf8(k.rune); break;
    case KeyType::Ctrl: base = "ctrl+" + encode_utf8(k.rune); break;
    case KeyType::Enter: base = "enter"; break;
    case KeyType::Tab: base = "tab"; break;
    case KeyType::Backspace: base = "backspace"; break;
    case KeyType::Escape: base = "esc"; break;
    case KeyType::Up: base = "up"; break;
    case KeyType::Down: base = "down"; break;
    case KeyType::Right: base = "right"; break;
    case KeyType::Left: base = "left"; break;
    case KeyType::Home: base = "home"; break;
    case KeyType::End: base = "end"; break;
    case KeyType::PageUp: base = "pgup"; break;
    case KeyType::PageDown: base = "pgdown"; break;
    case KeyType::Delete: base = "delete"; break;
    case KeyType::Insert: base = "insert"; break;
    case KeyType::Unknown: base = "unknown"; break;
  }
  return k.alt ? "alt+" + base : base;
}

static KeyMsg make_key(KeyType t, char32_t rune = 0) {
  KeyMsg k;
  k.type = t;
  k.rune = rune;
  return k;
}

static size_t decode_rune(std::string_view in, KeyMsg& out, bool more_may_follow) {
  unsigned char b = static_cast<unsigned char>(in[0]);
  size_t len = 0;
  char32_t cp = 0;
  if (b < 0x80) { out = make_key(KeyType::Rune, b); return 1; }
  if ((b & 0xe0) == 0xc0) { len = 2; cp = b & 0x1f; }
  else if ((b & 0xf0) == 0xe0) { len = 3; cp = b & 0x0f; }
  else if ((b & 0xf8) == 0xf0) { len = 4; cp = b & 0x07; }
  else { out = make_key(KeyType::Rune, RUNE_ERROR); return 1; }
  if (in.size() < len) {
    if (more_may_follow) return 0;
    out = make_key(KeyType::Rune, RUNE_ERROR);
    return 1;
  }
  for (size_t i = 1; i < len; ++i) {
    unsigned char c = static_cast<unsigned char>(in[i]);
    if ((c & 0xc0) != 0x80) { out = make_key(KeyType::Rune, RUNE_ERROR); return 1; }
    cp = (cp << 6) | (c & 0x3f);
  }
  // overlong forms, surrogates and values past U+10FFFF are not runes
  static constexpr char32_t min_for_len[] = {0, 0, 0x80, 0x800, 0x10000};
  if (cp < min_for_len[len] || (cp >= 0xd800 && cp <= 0xdfff) || cp > 0x10ffff) {
    out = make_key(KeyType::Rune, RUNE_ERROR);
    return 1;
  }
  out = make_key(KeyType::Rune, cp);
  return len;
}

static constexpr int MAX_CSI_PARAM = 9999;

static std::vector<int> csi_params(std::string_view p) {
  std::vector<int> v;
  int cur = 0;
  bool any = false;
  for (char c : p) {
    if (c >= '0' && c <= '9') {
      if (cur <= MAX_CSI_PARAM) cur = cur * 10 + (c - '0');
      any = true;
    }
    else if (c == ';') { v.push_back(any ? cur : 0); cur = 0; any = false; }
  }
  if (any || !v.empty()) v.push_back(any ? cur : 0);
  return v;
}

static KeyType cursor_key(char final) {
  switch (final) {
    case 'A': return KeyType::Up;
    case 'B': return KeyType::Down;
    case 'C': return KeyType::Right;
    case 'D': return KeyType::Left;
    case 'H': return KeyType::Home;
    case 'F': return KeyType::End;
    default: return KeyType::Unknown;
  }
}

static KeyType tilde_key(int n) {
  switch (n) {
    case 1: case 7: return KeyType::Home;
    case 2: return KeyType::Insert;
    case 3: return KeyType::Delete;
    case 4: case 8: return KeyType::End;
    case 5: return KeyType::PageUp;
    case 6: return KeyType::PageDown;
    default: return KeyType::Unknown;
  }
}

// in starts with ESC '[' or ESC 'O'
static size_t decode_escape_seq(std::string_view in, KeyMsg& out, bool more_may_follow) {
  bool ss3 = in[1] == 'O';
  size_t i = 2;
  if (!ss3) {
    while (i < in.size() && static_cast<unsigned char>(in[i]) >= 0x30 && static_cast<unsigned char>(in[i]) <= 0x3f) i++;
  }
  if (i >= in.size()) {
    if (more_may_follow) return 0;
    // ESC [ / ESC O with nothing behind it: alt+[ / alt+O
    out = make_key(KeyType::Rune, static_cast<unsigned char>(in[1]));
    out.alt = true;
    return 2;
  }
  char final = in[i];
  auto params = csi_params(in.substr(2, i - 2));
  KeyType t = final == '~' && !ss3 ? tilde_key(params.empty() ? 0 : params[0]) : cursor_key(final);
  out = make_key(t);
  // xterm modifier parameter: 1 + (shift 1 | alt 2 | ctrl 4)
  if (params.size() >= 2 && params[1] > 1 && ((params[1] - 1) & 2)) out.alt = true;
  return i + 1;
}

size_t decode_key(std::string_view in, KeyMsg& out, bool more_may_follow) {
  if (in.empty()) return 0;
  unsigned char b = static_cast<unsigned char>(in[0]);
  if (b == ESC) {
    if (in.size() == 1) {
      if (more_may_follow) return 0;
      out = make_key(KeyType::Escape);
      return 1;
    }
    if (in[1] == '[' || in[1] == 'O') return decode_escape_seq(in, out, more_may_follow);
    size_t n = decode_key(in.substr(1), out, more_may_follow);
    if (n == 0) return 0;
    out.alt = true;
    return n + 1;
  }
  switch (b) {
    case '\r': case '\n': out = make_key(KeyType::Enter); return 1;
    case '\t': out = make_key(KeyType::Tab); return 1;
    case 0x7f: case 0x08: out = make_key(KeyType::Backspace); return 1;
    case 0x00: out = make_key(KeyType::Ctrl, '@'); return 1;
    default: break;
  }
  if (b < 0x1b) { out = make_key(KeyType::Ctrl, U'a' + (b - 1)); return 1; }
  if (b < 0x20) { out = make_key(KeyType::Ctrl, U"\\]^_"[b - 0x1c]); return 1; }
  return decode_rune(in, out, more_may_follow);
}

void KeyMap::add(std::string seq, KeyType type) {
  if (seq.size() < 2 || seq[0] != ESC) return;
  for (auto& e : seqs_) {
    if (e.first == seq) { e.second = type; return; }
  }
  seqs_.emplace_back(std::move(seq), type);
}

size_t KeyMap::decode(std::string_view in, KeyMsg& out, bool more_may_follow) const {
  size_t best = 0;
  KeyType best_type = KeyType::Unknown;
  bool prefix = false;
  for (const auto& [seq, type] : seqs_) {
    if (in.size() < seq.size()) {
      if (seq.compare(0, in.size(), in) == 0) prefix = true;
    } else if (seq.size() > best && in.compare(0, seq.size(), seq) == 0) {
      best = seq.size();
      best_type = type;
    }
  }
  if (prefix && more_may_follow) return 0;
  if (best > 0) {
    out = make_key(best_type);
    return best;
  }
  return decode_key(in, out, more_may_follow);
}
