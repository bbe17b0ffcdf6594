#pragma once

/**
 * TraceKey - Asynchronous Gesture Scoring
 *
 * Runs Engine::scoreGesture on a worker thread so touch handling never waits
 * on a full vocabulary scan. Only the newest gesture matters: submitting a
 * new one cancels the pending and in-flight jobs. Once submit() or cancel()
 * returns, no earlier job's callback is running or will start.
 *
 * Callbacks run on the worker thread and may call submit() or cancel().
 * All engine access made through this class (scoring and commits) is
 * serialized.
 */

#include "engine.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace tracekey {

class AsyncGestureScorer {
public:
  using ResultCallback =
      std::function<void(uint64_t sequence, std::vector<Candidate>)>;

  explicit AsyncGestureScorer(Engine &engine);
  ~AsyncGestureScorer();

  AsyncGestureScorer(const AsyncGestureScorer &) = delete;
  AsyncGestureScorer &operator=(const AsyncGestureScorer &) = delete;

  // Queue a gesture for scoring, superseding any earlier one. Returns the
  // sequence number passed back to the callback.
  uint64_t submit(Path gesture, std::string previous, ResultCallback callback);

  // Cancel the pending and in-flight jobs without queueing a new one
  void cancel();

  // Commit through the same lock the worker scores under
  void commit(const std::string &word, const std::string &previous);

  // Run fn with exclusive engine access
  void withEngine(const std::function<void(Engine &)> &fn);

  uint64_t latestSequence() const;

private:
  struct Job {
    uint64_t sequence = 0;
    Path gesture;
    std::string previous;
    ResultCallback callback;
    std::shared_ptr<std::atomic<bool>> cancelled;
  };

  void run();
  void cancelLocked();

  Engine &engine_;
  std::mutex engineMutex_;

  // Held across the cancelled check and the callback. Taken before
  // queueMutex_. Recursive so callbacks can submit on the worker thread.
  std::recursive_mutex deliveryMutex_;

  mutable std::mutex queueMutex_;
  std::condition_variable wake_;
  std::optional<Job> pending_;
  std::shared_ptr<std::atomic<bool>> inFlight_;
  uint64_t nextSequence_ = 1;
  bool stopping_ = false;

  // Started last, after every member it touches is initialized
  std::thread worker_;
};

} // namespace tracekey
