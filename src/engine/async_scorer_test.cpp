/**
 * Async Gesture Scorer Test Utility
 */

#include "async_scorer.h"
#include "test_harness.h"

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <thread>

using namespace tracekey;

namespace {

Engine loadedEngine() {
  Engine engine;
  engine.loadVocabulary(
      {{"world", 0.001}, {"would", 0.004}, {"word", 0.002}, {"hello", 0.002}});
  return engine;
}

} // namespace

TEST(deliversLatestGesture) {
  Engine engine = loadedEngine();
  AsyncGestureScorer scorer(engine);

  std::promise<std::vector<Candidate>> done;
  auto future = done.get_future();
  uint64_t seq = scorer.submit(engine.lookup("world")->path, "",
                               [&done](uint64_t, std::vector<Candidate> c) {
                                 done.set_value(std::move(c));
                               });
  ASSERT_EQ(seq, scorer.latestSequence());

  ASSERT_TRUE(future.wait_for(std::chrono::seconds(10)) ==
              std::future_status::ready);
  auto results = future.get();
  ASSERT_TRUE(!results.empty());
  ASSERT_EQ(results[0].word, "world");
}

TEST(supersededGesturesNeverOutliveTheLatest) {
  Engine engine = loadedEngine();
  AsyncGestureScorer scorer(engine);

  std::mutex m;
  std::vector<uint64_t> delivered;
  std::promise<void> lastDone;
  auto future = lastDone.get_future();

  const Path hello = engine.lookup("hello")->path;
  const Path world = engine.lookup("world")->path;

  uint64_t last = 0;
  for (int i = 0; i < 20; ++i) {
    bool isLast = i == 19;
    last = scorer.submit(isLast ? world : hello, "",
                         [&, isLast](uint64_t s, std::vector<Candidate>) {
                           std::lock_guard<std::mutex> lock(m);
                           delivered.push_back(s);
                           if (isLast)
                             lastDone.set_value();
                         });
  }

  ASSERT_TRUE(future.wait_for(std::chrono::seconds(10)) ==
              std::future_status::ready);

  std::lock_guard<std::mutex> lock(m);
  ASSERT_TRUE(!delivered.empty());
  ASSERT_EQ(delivered.back(), last);
  for (size_t i = 1; i < delivered.size(); ++i) {
    ASSERT_GT(delivered[i], delivered[i - 1]);
  }
}

TEST(cancelSuppressesCallback) {
  Engine engine = loadedEngine();
  std::atomic<int> calls{0};
  {
    AsyncGestureScorer scorer(engine);
    // Block the worker behind the engine lock so the job stays pending
    scorer.withEngine([&](Engine &) {
      scorer.submit(engine.lookup("word")->path, "",
                    [&calls](uint64_t, std::vector<Candidate>) { calls++; });
      scorer.cancel();
    });
  }
  ASSERT_EQ(calls.load(), 0);
}

TEST(cancelWaitsForRunningCallback) {
  Engine engine = loadedEngine();
  AsyncGestureScorer scorer(engine);

  std::promise<void> started;
  auto future = started.get_future();
  std::atomic<bool> finished{false};
  scorer.submit(engine.lookup("world")->path, "",
                [&](uint64_t, std::vector<Candidate>) {
                  started.set_value();
                  std::this_thread::sleep_for(std::chrono::milliseconds(50));
                  finished = true;
                });

  ASSERT_TRUE(future.wait_for(std::chrono::seconds(10)) ==
              std::future_status::ready);
  scorer.cancel();
  ASSERT_TRUE(finished.load());
}

TEST(noCallbackAfterCancelReturns) {
  Engine engine = loadedEngine();
  AsyncGestureScorer scorer(engine);
  const Path world = engine.lookup("world")->path;

  // Highest sequence whose cancel() has returned
  std::atomic<uint64_t> closed{0};
  std::atomic<int> late{0};
  for (int i = 0; i < 200; ++i) {
    uint64_t seq = scorer.submit(world, "",
                                 [&](uint64_t s, std::vector<Candidate>) {
                                   if (s <= closed.load())
                                     late++;
                                 });
    if (i % 3 == 0)
      std::this_thread::sleep_for(std::chrono::microseconds(200));
    scorer.cancel();
    closed = seq;
  }
  ASSERT_EQ(late.load(), 0);
}

TEST(callbackMaySubmit) {
  Engine engine = loadedEngine();
  AsyncGestureScorer scorer(engine);
  const Path hello = engine.lookup("hello")->path;

  std::promise<std::string> done;
  auto future = done.get_future();
  scorer.submit(engine.lookup("world")->path, "",
                [&](uint64_t, std::vector<Candidate>) {
                  scorer.submit(hello, "",
                                [&done](uint64_t, std::vector<Candidate> c) {
                                  done.set_value(c.empty() ? "" : c[0].word);
                                });
                });

  ASSERT_TRUE(future.wait_for(std::chrono::seconds(10)) ==
              std::future_status::ready);
  ASSERT_EQ(future.get(), "hello");
}

TEST(commitThroughScorer) {
  Engine engine = loadedEngine();
  AsyncGestureScorer scorer(engine);

  scorer.commit("world", "hello");
  uint32_t count = 0;
  scorer.withEngine([&count](Engine &e) {
    count = e.session().bigram("hello", "world");
  });
  ASSERT_EQ(count, 1u);
}

TEST(destroyWithPendingJob) {
  Engine engine = loadedEngine();
  {
    AsyncGestureScorer scorer(engine);
    scorer.submit(engine.lookup("would")->path, "",
                  [](uint64_t, std::vector<Candidate>) {});
  }
  ASSERT_EQ(engine.vocabulary().size(), 4u);
}

int main() { return runAllTests("Async Gesture Scorer"); }
