#include "key.hpp"
#include <cassert>
#include <string>

static KeyMsg one(std::string_view in, size_t expect_len, bool more = false) {
  KeyMsg k;
  size_t n = decode_key(in, k, more);
  assert(n == expect_len);
  return k;
}

int main() {
  KeyMsg k = one("a", 1);
  assert(k.type == KeyType::Rune && k.rune == U'a' && !k.alt);
  assert(key_name(k) == "a");

  k = one("\x03", 1);
  assert(k.type == KeyType::Ctrl && key_name(k) == "ctrl+c");
  assert(key_name(one("\r", 1)) == "enter");
  assert(key_name(one("\t", 1)) == "tab");
  assert(key_name(one("\x7f", 1)) == "backspace");
  assert(key_name(one("\x1f", 1)) == "ctrl+_");

  // CSI / SS3 cursor keys
  assert(one("\x1b[A", 3).type == KeyType::Up);
  assert(one("\x1bOB", 3).type == KeyType::Down);
  assert(one("\x1b[3~", 4).type == KeyType::Delete);
  assert(one("\x1b[5~", 4).type == KeyType::PageUp);
  k = one("\x1b[1;3C", 6);
  assert(k.type == KeyType::Right && k.alt);
  assert(key_name(k) == "alt+right");
  assert(one("\x1b[99~", 5).type == KeyType::Unknown);

  // oversized parameters are clamped, not overflowed
  k = one("\x1b[99999999999999;3A", 19);
  assert(k.type == KeyType::Up && k.alt);
  assert(one("\x1b[99999999999999999999~", 23).type == KeyType::Unknown);

  // only the first key is consumed
  assert(one("\x1b[Dxyz", 3).type == KeyType::Left);

  // ESC: incomplete while more may follow, Escape otherwise
  KeyMsg e;
  assert(decode_key("\x1b", e, true) == 0);
  assert(one("\x1b", 1).type == KeyType::Escape);
  assert(decode_key("\x1b[1;", e, true) == 0);

  // alt + rune
  k = one("\x1bx", 2);
  assert(k.type == KeyType::Rune && k.rune == U'x' && k.alt);
  assert(key_name(k) == "alt+x");

  // UTF-8
  k = one("\xc3\xa9", 2);
  assert(k.rune == 0xe9);
  assert(key_name(k) == "\xc3\xa9");
  k = one("\xe2\x82\xac", 3);
  assert(k.rune == 0x20ac);
  assert(decode_key("\xe2\x82", e, true) == 0);
  assert(one("\xe2\x82", 1).rune == 0xfffd);
  assert(one("\xff", 1).rune == 0xfffd);

  assert(encode_utf8(0x1f600) == "\xf0\x9f\x98\x80");

  // malformed UTF-8: one byte becomes U+FFFD, the rest decodes on its own
  assert(one("\xc0\x80", 1).rune == 0xfffd);         // overlong NUL
  assert(one("\xe0\x80\xaf", 1).rune == 0xfffd);     // overlong '/'
  assert(one("\xf0\x8f\xbf\xbf", 1).rune == 0xfffd); // overlong U+FFFF
  assert(one("\xed\xa0\x80", 1).rune == 0xfffd);     // surrogate
  assert(one("\xf4\x90\x80\x80", 1).rune == 0xfffd); // past U+10FFFF
  assert(one("\xf4\x8f\xbf\xbf", 4).rune == 0x10ffff);
  assert(one("\xed\x9f\xbf", 3).rune == 0xd7ff);
  assert(one("\xc2\x80", 2).rune == 0x80);

  // terminal-specific sequences
  KeyMap map;
  map.add("\x1b[[A", KeyType::Up);
  map.add("\x1b[@", KeyType::Insert);
  map.add("\x7f", KeyType::Delete); // no ESC: ignored
  assert(map.size() == 2);
  assert(map.decode("\x1b[[", e, true) == 0);
  assert(map.decode("\x1b[[A", e, true) == 4 && e.type == KeyType::Up && !e.alt);
  assert(map.decode("\x1b[@x", e, false) == 3 && e.type == KeyType::Insert);
  assert(map.decode("\x7f", e, false) == 1 && e.type == KeyType::Backspace);
  assert(map.decode("\x1b[B", e, false) == 3 && e.type == KeyType::Down);
  assert(map.decode("\x1b", e, true) == 0);
  assert(map.decode("\x1b", e, false) == 1 && e.type == KeyType::Escape);
  map.add("\x1b[@", KeyType::Home);
  assert(map.size() == 2);
  assert(map.decode("\x1b[@", e, false) == 3 && e.type == KeyType::Home);

  KeyMsg none;
  assert(decode_key("", none, false) == 0);
  return 0;
}
