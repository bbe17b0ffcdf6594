#pragma once

/**
 * TraceKey - Prediction Engine
 *
 * Owns the vocabulary trie, the active key layout and one keyboard
 * session's language state. Every call runs to completion on the calling
 * thread; one instance serves exactly one session. Wrap it in an
 * AsyncGestureScorer to score gestures off the event thread.
 */

#include "geometry.h"
#include "language_model.h"
#include "lexicon/Trie.h"
#include "ranker.h"
#include "settings.h"
#include "vocabulary.h"

#include <atomic>
#include <string>
#include <vector>

namespace tracekey {

class Engine {
public:
  explicit Engine(const Settings &settings = Settings());

  // Insert or overwrite vocabulary words. Geometry comes from the active
  // layout; words the layout cannot address stay lookup-only.
  void loadVocabulary(const std::vector<VocabularyEntry> &entries);

  // Switch layouts and rebuild every stored keyboard path
  void setLayout(const KeyLayout &layout);

  // nullptr when word is not in the vocabulary
  const lexicon::WordEntry *lookup(const std::string &word) const;

  std::vector<Candidate> correct(const std::string &typed, int maxEditCost,
                                 const std::string &previous = "") const;
  std::vector<Candidate> correct(const std::string &typed) const;

  std::vector<Candidate> predict(const std::string &typed, int maxEditCost,
                                 const std::string &previous = "") const;
  std::vector<Candidate> predict(const std::string &typed) const;

  std::vector<Candidate>
  scoreGesture(const Path &points, const std::string &previous = "",
               const std::atomic<bool> *cancel = nullptr) const;

  // Candidate bar content while typing: predictions once the typed word
  // reaches the configured minimum length, nothing before that
  std::vector<Candidate> suggestForPrefix(const std::string &typed,
                                          const std::string &previous) const;

  // Candidate bar content right after a commit
  std::vector<Candidate> suggestNext(const std::string &previous) const;

  // Learn from an explicitly committed word
  void commit(const std::string &word, const std::string &previous);

  double probability(const std::string &word,
                     const std::string &previous) const;

  // Drop everything learned this session and restore the seed
  void resetSession();

  const lexicon::Trie &vocabulary() const { return words_; }
  const KeyLayout &layout() const { return layout_; }
  const SessionState &session() const { return session_; }
  const Settings &settings() const { return settings_; }

private:
  RankingInput input() const { return {words_, layout_, session_}; }

  Settings settings_;
  Ranker ranker_;
  lexicon::Trie words_;
  KeyLayout layout_;
  SessionState session_;
};

} // namespace tracekey
