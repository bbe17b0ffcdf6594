/**
 * TraceKey - Adaptive Language Model Implementation
 */

#include "language_model.h"
#include "log.h"

#include <cctype>

namespace tracekey {

std::string normalizeWord(const std::string &word) {
  std::string normalized = word;
  for (char &c : normalized) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return normalized;
}

// ============================================================================
// Session State
// ============================================================================

SessionState SessionState::seeded(const std::string &seedWord,
                                  int seedCount) {
  SessionState state;
  if (seedCount > 0) {
    state.nogramCount = static_cast<uint64_t>(seedCount);
    if (!seedWord.empty()) {
      state.unigrams[normalizeWord(seedWord)] =
          static_cast<uint32_t>(seedCount);
    }
  }
  return state;
}

uint32_t SessionState::unigram(const std::string &word) const {
  auto it = unigrams.find(word);
  return it == unigrams.end() ? 0 : it->second;
}

uint32_t SessionState::bigram(const std::string &previous,
                              const std::string &word) const {
  auto it = bigrams.find({previous, word});
  return it == bigrams.end() ? 0 : it->second;
}

// ============================================================================
// Probability
// ============================================================================

double LanguageModel::probability(const SessionState &state,
                                  const lexicon::Trie &words,
                                  const std::string &word,
                                  const std::string &previous) const {
  double distinct = static_cast<double>(state.unigrams.size());

  double unigramTerm = 0.0;
  double unigramDenom = static_cast<double>(state.nogramCount) + distinct;
  if (unigramDenom > 0) {
    unigramTerm = (state.unigram(word) + 1.0) / unigramDenom;
  }

  // Without a previous word there is no bigram context; back off to the
  // session unigram rate.
  double bigramTerm = unigramTerm;
  if (!previous.empty()) {
    bigramTerm = 0.0;
    double bigramDenom = state.unigram(previous) + distinct;
    if (bigramDenom > 0) {
      bigramTerm = (state.bigram(previous, word) + 1.0) / bigramDenom;
    }
  }

  const lexicon::WordEntry *entry = words.get(word);
  double staticFrequency = entry ? entry->frequency : 0.0;

  return bigramWeight_ * bigramTerm + unigramWeight_ * unigramTerm +
         staticWeight_ * staticFrequency;
}

// ============================================================================
// Learning
// ============================================================================

void LanguageModel::commit(SessionState &state, lexicon::Trie &words,
                           const KeyLayout &layout, const std::string &word,
                           const std::string &previous) const {
  if (word.empty())
    return;

  std::string normalizedWord = normalizeWord(word);

  state.nogramCount++;

  if (!words.contains(normalizedWord)) {
    lexicon::WordEntry entry =
        lexicon::WordEntry::build(normalizedWord, layout, 0.0);
    if (!entry.gestureEligible) {
      TKLOG(Debug) << "Learned '" << normalizedWord
                   << "' without a keyboard path";
    }
    words.set(normalizedWord, entry);
    TKLOG(Debug) << "Learned new word '" << normalizedWord << "'";
  }

  state.unigrams[normalizedWord]++;

  if (!previous.empty()) {
    state.bigrams[{normalizeWord(previous), normalizedWord}]++;
  }
}

} // namespace tracekey
