/**
 * Ranker Test Utility
 *
 * Gesture pre-filters and location scoring, typed-input correction and
 * prediction ranking.
 */

#include "ranker.h"
#include "test_harness.h"

#include <atomic>
#include <cmath>

using namespace tracekey;

namespace {

struct Fixture {
  KeyLayout layout = KeyLayout::qwerty();
  lexicon::Trie words;
  SessionState session = SessionState::seeded("the", 1);

  void add(const std::string &w, double f) {
    words.set(w, lexicon::WordEntry::build(w, layout, f));
  }

  RankingInput input() const { return {words, layout, session}; }
};

Path idealGesture(const KeyLayout &layout, const std::string &word, int n) {
  return resample(*keyboardPath(word, layout), n);
}

} // namespace

// ============================================================================
// Typed input
// ============================================================================

TEST(correctionRanksByFrequency) {
  Fixture fx;
  fx.add("cat", 0.5);
  fx.add("car", 0.3);
  fx.add("can", 0.2);
  Ranker ranker;

  auto results = ranker.fromCorrection(fx.input(), "cac", "", 1);
  ASSERT_EQ(results.size(), 3u);
  ASSERT_EQ(results[0].word, "cat");
  ASSERT_EQ(results[1].word, "car");
  ASSERT_EQ(results[2].word, "can");
  for (const auto &c : results) {
    ASSERT_EQ(c.editCost, 1);
    ASSERT_NEAR(c.score, 0.001 * c.probability, 1e-15);
  }
}

TEST(correctionExactBeatsFrequentNeighbour) {
  Fixture fx;
  fx.add("cart", 0.9);
  fx.add("cat", 0.001);
  Ranker ranker;

  auto results = ranker.fromCorrection(fx.input(), "cat", "", 1);
  ASSERT_EQ(results.size(), 2u);
  ASSERT_EQ(results[0].word, "cat");
  ASSERT_EQ(results[0].editCost, 0);
}

TEST(correctionNormalizesQuery) {
  Fixture fx;
  fx.add("cat", 0.5);
  Ranker ranker;

  auto results = ranker.fromCorrection(fx.input(), "CAT", "", 0);
  ASSERT_EQ(results.size(), 1u);
  ASSERT_EQ(results[0].word, "cat");
}

TEST(emptyTypedInput) {
  Fixture fx;
  fx.add("a", 0.5);
  Ranker ranker;

  ASSERT_TRUE(ranker.fromCorrection(fx.input(), "", "", 2).empty());
  ASSERT_TRUE(ranker.fromPrediction(fx.input(), "", "", 2).empty());
}

TEST(predictionRanksCompletions) {
  Fixture fx;
  fx.add("help", 0.1);
  fx.add("helpful", 0.02);
  fx.add("helper", 0.01);
  fx.add("world", 0.5);
  Ranker ranker;

  auto results = ranker.fromPrediction(fx.input(), "help", "", 0);
  ASSERT_EQ(results.size(), 3u);
  ASSERT_EQ(results[0].word, "help");
  ASSERT_EQ(results[1].word, "helpful");
  ASSERT_EQ(results[2].word, "helper");
}

TEST(contextLiftsBigramPartner) {
  Fixture fx;
  fx.add("the", 0.05);
  fx.add("cat", 0.001);
  fx.add("car", 0.002);
  Ranker ranker;

  // Before: car wins on static frequency alone
  auto before = ranker.fromCorrection(fx.input(), "ca", "the", 1);
  ASSERT_EQ(before[0].word, "car");

  LanguageModel model;
  for (int i = 0; i < 3; ++i) {
    model.commit(fx.session, fx.words, fx.layout, "cat", "the");
  }
  auto after = ranker.fromCorrection(fx.input(), "ca", "the", 1);
  ASSERT_EQ(after[0].word, "cat");
}

TEST(guessesCoverVocabulary) {
  Fixture fx;
  fx.add("a", 0.1);
  fx.add("b", 0.3);
  fx.add("c", 0.2);
  Ranker ranker;

  auto results = ranker.guesses(fx.input(), "");
  ASSERT_EQ(results.size(), 3u);
  ASSERT_EQ(results[0].word, "b");
  ASSERT_EQ(results[1].word, "c");
  ASSERT_EQ(results[2].word, "a");
  ASSERT_EQ(results[0].score, results[0].probability);
}

TEST(equalScoresKeepVocabularyOrder) {
  Fixture fx;
  fx.add("bat", 0.1);
  fx.add("cat", 0.1);
  fx.add("hat", 0.1);
  Ranker ranker;

  auto results = ranker.fromCorrection(fx.input(), "rat", "", 1);
  ASSERT_EQ(results.size(), 3u);
  ASSERT_EQ(results[0].word, "bat");
  ASSERT_EQ(results[1].word, "cat");
  ASSERT_EQ(results[2].word, "hat");
}

TEST(truncateKeepsHead) {
  std::vector<Candidate> c = {{"a", 3}, {"b", 2}, {"c", 1}};
  Ranker::truncate(c, 5);
  ASSERT_EQ(c.size(), 3u);
  Ranker::truncate(c, 2);
  ASSERT_EQ(c.size(), 2u);
  ASSERT_EQ(c[1].word, "b");
  Ranker::truncate(c, 0);
  ASSERT_TRUE(c.empty());
}

// ============================================================================
// Gesture
// ============================================================================

TEST(idealGestureRanksWordFirst) {
  Fixture fx;
  for (const char *w : {"hello", "hero", "halo", "hippo", "hollo", "help"}) {
    fx.add(w, 0.01);
  }
  Ranker ranker;

  // Raw key centers: the word path itself, traced exactly
  Path gesture = *keyboardPath("hello", fx.layout);
  auto results = ranker.fromGesture(fx.input(), gesture, "");
  ASSERT_TRUE(!results.empty());
  ASSERT_EQ(results[0].word, "hello");
  ASSERT_NEAR(results[0].gestureDistance, 0.0, 1e-6);
  ASSERT_NEAR(results[0].score, results[0].probability, 1e-9);
  for (const auto &c : results) {
    ASSERT_TRUE(c.word != "help"); // ends on the wrong key
  }
}

TEST(gestureFarFromEveryWord) {
  Fixture fx;
  fx.add("the", 0.05);
  fx.add("cat", 0.01);
  Ranker ranker;

  Path far = {{-500, -500}, {-400, -500}, {-300, -500}};
  ASSERT_TRUE(ranker.fromGesture(fx.input(), far, "").empty());
}

TEST(gestureLengthWindow) {
  Fixture fx;
  fx.add("hello", 0.01);
  fx.add("ho", 0.5); // same end keys, far shorter path
  Ranker ranker;

  auto results =
      ranker.fromGesture(fx.input(), idealGesture(fx.layout, "hello", 30), "");
  ASSERT_EQ(results.size(), 1u);
  ASSERT_EQ(results[0].word, "hello");
}

TEST(gestureSkipsLookupOnlyWords) {
  Fixture fx;
  fx.add("o'clock", 0.5);
  fx.add("oclock", 0.01);
  Ranker ranker;

  auto results = ranker.fromGesture(fx.input(),
                                    idealGesture(fx.layout, "oclock", 30), "");
  ASSERT_EQ(results.size(), 1u);
  ASSERT_EQ(results[0].word, "oclock");
}

TEST(singleTapGesture) {
  Fixture fx;
  fx.add("a", 0.02);
  fx.add("as", 0.02);
  Ranker ranker;

  Path tap = {*fx.layout.keyCenter('a')};
  auto results = ranker.fromGesture(fx.input(), tap, "");
  ASSERT_EQ(results.size(), 1u);
  ASSERT_EQ(results[0].word, "a");
}

TEST(emptyGesture) {
  Fixture fx;
  fx.add("a", 0.02);
  Ranker ranker;
  ASSERT_TRUE(ranker.fromGesture(fx.input(), {}, "").empty());
}

TEST(gestureScoreDecaysWithDistance) {
  Fixture fx;
  fx.add("hello", 0.01);
  Ranker ranker;

  Path gesture = *keyboardPath("hello", fx.layout);
  for (auto &p : gesture) {
    p.y += 4; // every point 4px off
  }
  auto results = ranker.fromGesture(fx.input(), gesture, "");
  ASSERT_EQ(results.size(), 1u);
  ASSERT_NEAR(results[0].gestureDistance, 4.0, 1e-6);
  ASSERT_NEAR(results[0].score, std::exp(-2.0) * results[0].probability,
              1e-12);
}

TEST(zeroGestureDecayIsClamped) {
  Fixture fx;
  fx.add("hello", 0.01);
  fx.add("hero", 0.01);
  Settings settings;
  settings.gestureDecay = 0;
  Ranker ranker(settings);

  Path gesture = *keyboardPath("hello", fx.layout);
  auto results = ranker.fromGesture(fx.input(), gesture, "");
  ASSERT_TRUE(!results.empty());
  ASSERT_EQ(results[0].word, "hello");
  for (const auto &c : results) {
    ASSERT_TRUE(std::isfinite(c.score));
  }
  ASSERT_NEAR(results[0].score, results[0].probability, 1e-12);

  for (auto &p : gesture) {
    p.y += 4;
  }
  results = ranker.fromGesture(fx.input(), gesture, "");
  ASSERT_EQ(results[0].word, "hello");
  ASSERT_NEAR(results[0].score, std::exp(-40.0) * results[0].probability,
              1e-30);
}

TEST(cancelledGestureReturnsNothing) {
  Fixture fx;
  fx.add("hello", 0.01);
  Ranker ranker;

  std::atomic<bool> cancel{true};
  auto results = ranker.fromGesture(
      fx.input(), idealGesture(fx.layout, "hello", 20), "", &cancel);
  ASSERT_TRUE(results.empty());
}

int main() { return runAllTests("Ranker"); }
