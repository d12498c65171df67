#include "KeyEncoder.hpp"

namespace ras {
namespace {
const char ESC = '\x1b';

const std::map<KeyType, string>& keySequences() {
  static const std::map<KeyType, string> sequences = {
      {KEY_ENTER, "\r"},
      {KEY_TAB, "\t"},
      {KEY_BACKSPACE, "\x7f"},
      {KEY_ESCAPE, "\x1b"},
      {KEY_DELETE, "\x1b[3~"},
      {KEY_INSERT, "\x1b[2~"},
      {KEY_UP, "\x1b[A"},
      {KEY_DOWN, "\x1b[B"},
      {KEY_RIGHT, "\x1b[C"},
      {KEY_LEFT, "\x1b[D"},
      {KEY_HOME, "\x1b[H"},
      {KEY_END, "\x1b[F"},
      {KEY_PAGE_UP, "\x1b[5~"},
      {KEY_PAGE_DOWN, "\x1b[6~"},
      {KEY_F1, "\x1bOP"},
      {KEY_F2, "\x1bOQ"},
      {KEY_F3, "\x1bOR"},
      {KEY_F4, "\x1bOS"},
      {KEY_F5, "\x1b[15~"},
      {KEY_F6, "\x1b[17~"},
      {KEY_F7, "\x1b[18~"},
      {KEY_F8, "\x1b[19~"},
      {KEY_F9, "\x1b[20~"},
      {KEY_F10, "\x1b[21~"},
      {KEY_F11, "\x1b[23~"},
      {KEY_F12, "\x1b[24~"},
      {KEY_CTRL_C, "\x03"},
      {KEY_CTRL_D, "\x04"},
      {KEY_CTRL_Z, "\x1a"},
  };
  return sequences;
}

bool isControlKey(KeyType key) {
  return key == KEY_CTRL_C || key == KEY_CTRL_D || key == KEY_CTRL_Z;
}
}  // namespace

string KeyEncoder::baseSequence(KeyType key) {
  const auto& sequences = keySequences();
  auto it = sequences.find(key);
  if (it == sequences.end()) {
    return "";
  }
  return it->second;
}

string KeyEncoder::encode(KeyType key, uint32_t modifiers) {
  string base = baseSequence(key);
  if (base.empty()) {
    return base;
  }
  modifiers &= MOD_MASK;
  if (modifiers == 0 || isControlKey(key)) {
    return base;
  }
  if (key == KEY_TAB && (modifiers & MOD_SHIFT)) {
    return "\x1b[Z";
  }
  return applyModifiers(base, modifiers);
}

string KeyEncoder::applyModifiers(const string& base, uint32_t modifiers) {
  // Single byte keys have no modified form
  if (base.size() < 3 || base[0] != ESC) {
    return base;
  }
  string param = std::to_string(1 + modifiers);
  char finalByte = base.back();

  if (base[1] == 'O') {
    // SS3: ESC O P -> ESC [ 1 ; <param> P
    return string("\x1b[1;") + param + finalByte;
  }
  if (base[1] != '[') {
    return base;
  }

  string body = base.substr(2, base.size() - 3);
  if (body.empty()) {
    return string("\x1b[1;") + param + finalByte;
  }
  return string("\x1b[") + body + ";" + param + finalByte;
}
}  // namespace ras
