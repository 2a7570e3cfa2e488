#pragma once
/*
 * Key
 *
 * Purpose: semantic key value delivered to applications as KeyMsg.
 * decode_key: turn raw tty bytes (UTF-8, C0 controls, CSI/SS3) into one key.
 * KeyMap: escape sequences a particular terminal sends (from terminfo),
 *         tried before the built-in xterm/vt100 decoding.
 */
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

enum class KeyType {
  Rune, Ctrl, Enter, Tab, Backspace, Escape,
  Up, Down, Right, Left, Home, End, PageUp, PageDown, Delete, Insert,
  Unknown // recognized escape sequence without a mapping; never delivered
};

struct KeyMsg {
  KeyType type = KeyType::Rune;
  char32_t rune = 0; // Rune: code point; Ctrl: lowercase letter
  bool alt = false;

  bool operator==(const KeyMsg&) const = default;
};

// "a", "ctrl+c", "alt+x", "up", "enter"
std::string key_name(const KeyMsg& k);

// Returns bytes consumed, 0 when `in` holds an incomplete sequence and
// more_may_follow is set.
size_t decode_key(std::string_view in, KeyMsg& out, bool more_may_follow);

std::string encode_utf8(char32_t cp);

class KeyMap {
public:
  // Sequences not starting with ESC are left to decode_key.
  void add(std::string seq, KeyType type);
  bool empty() const { return seqs_.empty(); }
  size_t size() const { return seqs_.size(); }

  // Longest matching sequence wins; a proper prefix of a known sequence is
  // incomplete while more may follow. Anything else goes to decode_key.
  size_t decode(std::string_view in, KeyMsg& out, bool more_may_follow) const;

private:
  std::vector<std::pair<std::string, KeyType>> seqs_;
};
