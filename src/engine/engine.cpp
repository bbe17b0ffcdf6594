/**
 * TraceKey - Prediction Engine Implementation
 */

#include "engine.h"
#include "log.h"

namespace tracekey {

Engine::Engine(const Settings &settings)
    : settings_(clampSettings(settings)), ranker_(settings_),
      layout_(KeyLayout::qwerty()),
      session_(SessionState::seeded(settings_.seedWord, settings_.seedCount)) {}

// ============================================================================
// Vocabulary & Layout
// ============================================================================

void Engine::loadVocabulary(const std::vector<VocabularyEntry> &entries) {
  size_t lookupOnly = 0;
  for (const auto &e : entries) {
    std::string word = normalizeWord(e.word);
    if (word.empty())
      continue;

    lexicon::WordEntry entry =
        lexicon::WordEntry::build(word, layout_, e.frequency);
    if (!entry.gestureEligible)
      lookupOnly++;
    words_.set(word, entry);
  }

  TKLOG(Info) << "Vocabulary: " << words_.size() << " words ("
              << lookupOnly << " not gesture-eligible in this batch)";
}

void Engine::setLayout(const KeyLayout &layout) {
  layout_ = layout;

  size_t lookupOnly = 0;
  const auto &all = words_.words();
  for (size_t i = 0; i < all.size(); ++i) {
    lexicon::WordEntry &entry = words_.valueAt(i);
    entry.relayout(all[i], layout_);
    if (!entry.gestureEligible)
      lookupOnly++;
  }

  TKLOG(Info) << "Layout set: " << layout_.size() << " keys, "
              << all.size() - lookupOnly << " gesture-eligible words";
}

const lexicon::WordEntry *Engine::lookup(const std::string &word) const {
  return words_.get(normalizeWord(word));
}

// ============================================================================
// Ranking
// ============================================================================

std::vector<Candidate> Engine::correct(const std::string &typed,
                                       int maxEditCost,
                                       const std::string &previous) const {
  return ranker_.fromCorrection(input(), typed, previous, maxEditCost);
}

std::vector<Candidate> Engine::correct(const std::string &typed) const {
  return correct(typed, settings_.correctionMaxCost);
}

std::vector<Candidate> Engine::predict(const std::string &typed,
                                       int maxEditCost,
                                       const std::string &previous) const {
  return ranker_.fromPrediction(input(), typed, previous, maxEditCost);
}

std::vector<Candidate> Engine::predict(const std::string &typed) const {
  return predict(typed, settings_.predictionMaxCost);
}

std::vector<Candidate>
Engine::scoreGesture(const Path &points, const std::string &previous,
                     const std::atomic<bool> *cancel) const {
  auto candidates = ranker_.fromGesture(input(), points, previous, cancel);
  TKLOG(Debug) << "Gesture points=" << points.size()
               << " candidates=" << candidates.size();
  return candidates;
}

std::vector<Candidate>
Engine::suggestForPrefix(const std::string &typed,
                         const std::string &previous) const {
  if (typed.size() < static_cast<size_t>(settings_.minPredictionPrefix)) {
    return {};
  }
  auto candidates = predict(typed, settings_.predictionMaxCost, previous);
  Ranker::truncate(candidates, settings_.displayCount);
  return candidates;
}

std::vector<Candidate> Engine::suggestNext(const std::string &previous) const {
  auto candidates = ranker_.guesses(input(), previous);
  Ranker::truncate(candidates, settings_.displayCount);
  return candidates;
}

double Engine::probability(const std::string &word,
                           const std::string &previous) const {
  return ranker_.model().probability(session_, words_, normalizeWord(word),
                                     normalizeWord(previous));
}

// ============================================================================
// Learning
// ============================================================================

void Engine::commit(const std::string &word, const std::string &previous) {
  if (word.empty())
    return;
  ranker_.model().commit(session_, words_, layout_, word, previous);
  TKLOG(Debug) << "Commit word=" << word << " prev=" << previous;
}

void Engine::resetSession() {
  session_ = SessionState::seeded(settings_.seedWord, settings_.seedCount);
  TKLOG(Info) << "Session reset";
}

} // namespace tracekey
