#pragma once

/**
 * TraceKey - Key Model
 *
 * Layout key records and the action each key code stands for. Codes are
 * classified once when a layout row is read, not on every touch.
 */

#include <string>

namespace tracekey {

// One key of a layout row
struct KeySpec {
  std::string display;   // Text drawn on the key
  std::string insertion; // Text inserted on press, empty for action keys
  std::string code;      // Key code (e.g., "a", "backspace", "sug2")
  double columns = 1.0;  // Width in layout columns
};

enum class KeyKind {
  Letter,     // a-z, part of the current word
  Text,       // Inserts non-letter text; ends the current word
  Backspace,
  Shift,
  CapsLock,
  Ctrl,
  Suggestion, // Candidate bar slot
  Other
};

struct KeyAction {
  KeyKind kind = KeyKind::Other;
  char letter = 0;         // Letter keys only
  int suggestionSlot = -1; // Suggestion keys only

  static KeyAction classify(const KeySpec &key);

  // True when pressing the key commits the word typed so far
  bool commitsWord() const { return kind == KeyKind::Text; }
};

// How candidates are shown under the active modifiers
enum class CaseMode { AsIs, Capitalized, Upper };

// shift alone capitalizes, capslock alone upper-cases, both cancel out
CaseMode caseModeFor(bool shift, bool capslock);

std::string applyCase(const std::string &word, CaseMode mode);

} // namespace tracekey
