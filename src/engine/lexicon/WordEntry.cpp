#include "WordEntry.h"

namespace tracekey::lexicon {

WordEntry WordEntry::build(const std::string &word, const KeyLayout &layout,
                           double frequency) {
  WordEntry entry;
  entry.frequency = frequency;
  entry.relayout(word, layout);
  return entry;
}

void WordEntry::relayout(const std::string &word, const KeyLayout &layout) {
  auto p = keyboardPath(word, layout);
  if (!p) {
    path.clear();
    pathLength = 0;
    gestureEligible = false;
    return;
  }
  path = std::move(*p);
  pathLength = tracekey::pathLength(path);
  gestureEligible = true;
}

} // namespace tracekey::lexicon
