#include "keys.h"

#include <cctype>

namespace tracekey {

KeyAction KeyAction::classify(const KeySpec &key) {
  KeyAction action;
  const std::string &code = key.code;

  if (code == "backspace") {
    action.kind = KeyKind::Backspace;
  } else if (code == "shift") {
    action.kind = KeyKind::Shift;
  } else if (code == "capslock") {
    action.kind = KeyKind::CapsLock;
  } else if (code == "ctrl") {
    action.kind = KeyKind::Ctrl;
  } else if (code.size() > 3 && code.compare(0, 3, "sug") == 0) {
    int slot = 0;
    for (size_t i = 3; i < code.size(); ++i) {
      if (!std::isdigit(static_cast<unsigned char>(code[i]))) {
        return action; // Other
      }
      slot = slot * 10 + (code[i] - '0');
    }
    action.kind = KeyKind::Suggestion;
    action.suggestionSlot = slot;
  } else if (code.size() == 1 &&
             std::isalpha(static_cast<unsigned char>(code[0]))) {
    action.kind = KeyKind::Letter;
    action.letter =
        static_cast<char>(std::tolower(static_cast<unsigned char>(code[0])));
  } else if (key.insertion.size() == 1) {
    action.kind = KeyKind::Text;
  }
  return action;
}

CaseMode caseModeFor(bool shift, bool capslock) {
  if (shift == capslock)
    return CaseMode::AsIs;
  return shift ? CaseMode::Capitalized : CaseMode::Upper;
}

std::string applyCase(const std::string &word, CaseMode mode) {
  std::string out = word;
  if (out.empty())
    return out;

  switch (mode) {
  case CaseMode::AsIs:
    break;
  case CaseMode::Capitalized:
    out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    break;
  case CaseMode::Upper:
    for (char &c : out) {
      c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    break;
  }
  return out;
}

} // namespace tracekey
