#pragma once

#include "../geometry.h"

#include <string>

namespace tracekey::lexicon {

// Per-word value stored in the Trie. Geometry depends on the active layout
// and is rebuilt on layout change; frequency is a corpus prior in [0, 1].
struct WordEntry {
    Path path;
    double pathLength = 0;
    double frequency = 0;
    // False when some letter has no key center; such words stay available
    // for lookup and correction but never match a gesture.
    bool gestureEligible = false;

    static WordEntry build(const std::string& word, const KeyLayout& layout,
                           double frequency);

    // Recompute geometry for a new layout, keeping the frequency
    void relayout(const std::string& word, const KeyLayout& layout);
};

} // namespace tracekey::lexicon
