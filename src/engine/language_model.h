#pragma once

/**
 * TraceKey - Adaptive Language Model
 *
 * Session-local unigram/bigram counters interpolated with the static corpus
 * frequency stored in the Trie:
 *
 *   p(w | prev) = Wb * (bigram(prev, w) + 1) / (unigram(prev) + |U|)
 *               + Wu * (unigram(w) + 1)       / (nogram + |U|)
 *               + Ws * staticFrequency(w)
 *
 * where |U| is the number of distinct session unigrams. With no previous
 * word the bigram term backs off to the unigram rate. The add-one terms keep
 * unseen words above zero; the static prior carries cold-start ranking.
 *
 * Design Principles:
 * - Learn only on explicit commit
 * - Counters live in an explicit SessionState, never in globals
 * - Kept in process memory only, append-only for the whole session
 */

#include "geometry.h"
#include "lexicon/Trie.h"
#include "settings.h"

#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <utility>

namespace tracekey {

// ============================================================================
// Session State
// ============================================================================

struct SessionState {
  // Total committed words
  uint64_t nogramCount = 0;
  // word -> count
  std::unordered_map<std::string, uint32_t> unigrams;
  // (previous, word) -> count
  std::map<std::pair<std::string, std::string>, uint32_t> bigrams;

  // Fresh state bootstrapped with seedCount commits of seedWord
  static SessionState seeded(const std::string &seedWord, int seedCount);

  uint32_t unigram(const std::string &word) const;
  uint32_t bigram(const std::string &previous, const std::string &word) const;
};

// ============================================================================
// Language Model
// ============================================================================

class LanguageModel {
public:
  LanguageModel() = default;
  explicit LanguageModel(const Settings &settings)
      : bigramWeight_(settings.bigramWeight),
        unigramWeight_(settings.unigramWeight),
        staticWeight_(settings.staticWeight) {}

  // p(word | previous). previous may be empty; words absent from the trie
  // contribute a static frequency of zero.
  double probability(const SessionState &state, const lexicon::Trie &words,
                     const std::string &word,
                     const std::string &previous) const;

  // Record an explicit commit. Unknown words are added to the trie with
  // their path on the active layout and a static frequency of zero.
  void commit(SessionState &state, lexicon::Trie &words,
              const KeyLayout &layout, const std::string &word,
              const std::string &previous) const;

  double bigramWeight() const { return bigramWeight_; }
  double unigramWeight() const { return unigramWeight_; }
  double staticWeight() const { return staticWeight_; }

private:
  double bigramWeight_ = 0.4;
  double unigramWeight_ = 0.1;
  double staticWeight_ = 0.5;
};

// Lowercase copy, as committed words are stored
std::string normalizeWord(const std::string &word);

} // namespace tracekey
