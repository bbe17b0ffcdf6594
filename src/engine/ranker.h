#pragma once

/**
 * TraceKey - Candidate Ranker
 *
 * One scoring core behind three input modes:
 * - gesture:    exp(-gestureDistance / decay) * p(word | prev)
 * - correction: editDecayBase ^ editCost      * p(word | prev)
 * - prediction: same as correction, over prefix-completion matches
 *
 * Gesture matching rejects cheaply before any resampling: first and last
 * key centers must lie within one key of the gesture end points, and the
 * word path length must fall inside the configured ratio window of the
 * gesture length.
 */

#include "geometry.h"
#include "language_model.h"
#include "lexicon/Trie.h"
#include "settings.h"

#include <atomic>
#include <string>
#include <vector>

namespace tracekey {

// ============================================================================
// Candidate Result
// ============================================================================
struct Candidate {
  std::string word;
  double score = 0;

  // Score components (for debugging/tuning)
  double gestureDistance = 0;
  int editCost = 0;
  double probability = 0;

  Candidate() = default;
  Candidate(const std::string &w, double s) : word(w), score(s) {}
};

// Everything a ranking call reads; owned by the caller for the call
struct RankingInput {
  const lexicon::Trie &words;
  const KeyLayout &layout;
  const SessionState &session;
};

// ============================================================================
// Ranker
// ============================================================================
class Ranker {
public:
  Ranker() = default;
  explicit Ranker(const Settings &settings);

  // Rank vocabulary words against a raw gesture. Returns an empty list for
  // an empty gesture, or when cancel is raised before scoring completes.
  std::vector<Candidate>
  fromGesture(const RankingInput &in, const Path &gesture,
              const std::string &previous,
              const std::atomic<bool> *cancel = nullptr) const;

  // Words within maxCost edits of the typed word
  std::vector<Candidate> fromCorrection(const RankingInput &in,
                                        const std::string &typed,
                                        const std::string &previous,
                                        int maxCost) const;

  // Completions of prefixes within maxCost edits of the typed prefix
  std::vector<Candidate> fromPrediction(const RankingInput &in,
                                        const std::string &typed,
                                        const std::string &previous,
                                        int maxCost) const;

  // Whole vocabulary ranked by the language model alone
  std::vector<Candidate> guesses(const RankingInput &in,
                                 const std::string &previous) const;

  const LanguageModel &model() const { return model_; }

  // Keep the first count entries
  static void truncate(std::vector<Candidate> &candidates, int count);

private:
  std::vector<Candidate> scoreMatches(const RankingInput &in,
                                      const std::vector<lexicon::Match> &matches,
                                      const std::string &previous) const;

  static void sortByScore(std::vector<Candidate> &candidates);

  LanguageModel model_;
  double gestureDecay_ = 2.0;
  double editDecayBase_ = 0.001;
  double minLengthRatio_ = 0.8;
  double maxLengthRatio_ = 1.4;
};

} // namespace tracekey
