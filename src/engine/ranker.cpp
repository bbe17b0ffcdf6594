/**
 * TraceKey - Candidate Ranker Implementation
 */

#include "ranker.h"

#include <algorithm>
#include <cmath>

namespace tracekey {

Ranker::Ranker(const Settings &settings) {
  // gestureDecay = 0 would turn every gesture score into NaN
  const Settings s = clampSettings(settings);
  model_ = LanguageModel(s);
  gestureDecay_ = s.gestureDecay;
  editDecayBase_ = s.editDecayBase;
  minLengthRatio_ = s.minLengthRatio;
  maxLengthRatio_ = s.maxLengthRatio;
}

void Ranker::sortByScore(std::vector<Candidate> &candidates) {
  // Stable: equal scores keep vocabulary order
  std::stable_sort(
      candidates.begin(), candidates.end(),
      [](const Candidate &a, const Candidate &b) { return a.score > b.score; });
}

void Ranker::truncate(std::vector<Candidate> &candidates, int count) {
  if (count >= 0 && candidates.size() > static_cast<size_t>(count)) {
    candidates.resize(count);
  }
}

// ============================================================================
// Gesture Matching
// ============================================================================

std::vector<Candidate> Ranker::fromGesture(const RankingInput &in,
                                           const Path &gesture,
                                           const std::string &previous,
                                           const std::atomic<bool> *cancel) const {
  if (gesture.empty() || in.words.empty()) {
    return {};
  }

  const std::string prev = normalizeWord(previous);
  const Point &start = gesture.front();
  const Point &end = gesture.back();
  const double keyW = in.layout.keyWidth();
  const double keyH = in.layout.keyHeight();

  const double gestureLength = pathLength(gesture);
  const double minLength = minLengthRatio_ * gestureLength;
  const double maxLength = maxLengthRatio_ * gestureLength;

  const int n = static_cast<int>(gesture.size());
  const Path sampled = resample(gesture, n);

  std::vector<Candidate> results;
  const auto &vocabulary = in.words.words();

  for (size_t i = 0; i < vocabulary.size(); ++i) {
    if (cancel && cancel->load(std::memory_order_relaxed)) {
      return {};
    }

    const lexicon::WordEntry &entry = in.words.valueAt(i);
    if (!entry.gestureEligible)
      continue;

    // Stage 1: start/end key pruning
    const Point &first = entry.path.front();
    const Point &last = entry.path.back();
    if (std::abs(first.x - start.x) > keyW ||
        std::abs(first.y - start.y) > keyH)
      continue;
    if (std::abs(last.x - end.x) > keyW || std::abs(last.y - end.y) > keyH)
      continue;

    // Stage 2: length window
    if (entry.pathLength < minLength || entry.pathLength > maxLength)
      continue;

    // Stage 3: location distance on equally resampled paths
    Candidate cand;
    cand.word = vocabulary[i];
    cand.gestureDistance = meanPointDistance(sampled, resample(entry.path, n));
    cand.probability =
        model_.probability(in.session, in.words, cand.word, prev);
    cand.score =
        std::exp(-cand.gestureDistance / gestureDecay_) * cand.probability;
    results.push_back(std::move(cand));
  }

  sortByScore(results);
  return results;
}

// ============================================================================
// Typed Input
// ============================================================================

std::vector<Candidate>
Ranker::scoreMatches(const RankingInput &in,
                     const std::vector<lexicon::Match> &matches,
                     const std::string &previous) const {
  const std::string prev = normalizeWord(previous);

  std::vector<Candidate> results;
  results.reserve(matches.size());
  for (const auto &m : matches) {
    Candidate cand;
    cand.word = m.word;
    cand.editCost = m.cost;
    cand.probability = model_.probability(in.session, in.words, m.word, prev);
    cand.score = std::pow(editDecayBase_, m.cost) * cand.probability;
    results.push_back(std::move(cand));
  }

  sortByScore(results);
  return results;
}

std::vector<Candidate> Ranker::fromCorrection(const RankingInput &in,
                                              const std::string &typed,
                                              const std::string &previous,
                                              int maxCost) const {
  if (typed.empty()) {
    return {};
  }
  return scoreMatches(
      in, in.words.searchCorrection(normalizeWord(typed), maxCost), previous);
}

std::vector<Candidate> Ranker::fromPrediction(const RankingInput &in,
                                              const std::string &typed,
                                              const std::string &previous,
                                              int maxCost) const {
  if (typed.empty()) {
    return {};
  }
  return scoreMatches(
      in, in.words.searchPrediction(normalizeWord(typed), maxCost), previous);
}

std::vector<Candidate> Ranker::guesses(const RankingInput &in,
                                       const std::string &previous) const {
  const std::string prev = normalizeWord(previous);

  std::vector<Candidate> results;
  results.reserve(in.words.size());
  for (const auto &word : in.words.words()) {
    double p = model_.probability(in.session, in.words, word, prev);
    Candidate cand(word, p);
    cand.probability = p;
    results.push_back(std::move(cand));
  }

  sortByScore(results);
  return results;
}

} // namespace tracekey
