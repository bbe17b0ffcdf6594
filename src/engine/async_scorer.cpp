/**
 * TraceKey - Asynchronous Gesture Scoring Implementation
 */

#include "async_scorer.h"
#include "log.h"

#include <utility>

namespace tracekey {

AsyncGestureScorer::AsyncGestureScorer(Engine &engine)
    : engine_(engine), worker_([this] { run(); }) {}

AsyncGestureScorer::~AsyncGestureScorer() {
  {
    std::lock_guard<std::recursive_mutex> delivery(deliveryMutex_);
    std::lock_guard<std::mutex> lock(queueMutex_);
    stopping_ = true;
    cancelLocked();
  }
  wake_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

void AsyncGestureScorer::cancelLocked() {
  if (pending_) {
    pending_->cancelled->store(true);
    pending_.reset();
  }
  if (inFlight_) {
    inFlight_->store(true);
  }
}

uint64_t AsyncGestureScorer::submit(Path gesture, std::string previous,
                                    ResultCallback callback) {
  Job job;
  job.gesture = std::move(gesture);
  job.previous = std::move(previous);
  job.callback = std::move(callback);
  job.cancelled = std::make_shared<std::atomic<bool>>(false);

  uint64_t sequence;
  {
    std::lock_guard<std::recursive_mutex> delivery(deliveryMutex_);
    std::lock_guard<std::mutex> lock(queueMutex_);
    cancelLocked();
    sequence = nextSequence_++;
    job.sequence = sequence;
    pending_ = std::move(job);
  }
  wake_.notify_one();
  return sequence;
}

void AsyncGestureScorer::cancel() {
  std::lock_guard<std::recursive_mutex> delivery(deliveryMutex_);
  std::lock_guard<std::mutex> lock(queueMutex_);
  cancelLocked();
}

void AsyncGestureScorer::commit(const std::string &word,
                                const std::string &previous) {
  std::lock_guard<std::mutex> lock(engineMutex_);
  engine_.commit(word, previous);
}

void AsyncGestureScorer::withEngine(const std::function<void(Engine &)> &fn) {
  std::lock_guard<std::mutex> lock(engineMutex_);
  fn(engine_);
}

uint64_t AsyncGestureScorer::latestSequence() const {
  std::lock_guard<std::mutex> lock(queueMutex_);
  return nextSequence_ - 1;
}

// ============================================================================
// Worker
// ============================================================================

void AsyncGestureScorer::run() {
  for (;;) {
    Job job;
    {
      std::unique_lock<std::mutex> lock(queueMutex_);
      wake_.wait(lock, [this] { return stopping_ || pending_.has_value(); });
      if (stopping_)
        return;
      job = std::move(*pending_);
      pending_.reset();
      inFlight_ = job.cancelled;
    }

    std::vector<Candidate> results;
    {
      std::lock_guard<std::mutex> lock(engineMutex_);
      results =
          engine_.scoreGesture(job.gesture, job.previous, job.cancelled.get());
    }

    // A cancel can only land before this lock or after the callback
    std::lock_guard<std::recursive_mutex> delivery(deliveryMutex_);
    {
      std::lock_guard<std::mutex> lock(queueMutex_);
      if (inFlight_ == job.cancelled)
        inFlight_.reset();
    }

    if (job.cancelled->load()) {
      TKLOG(Debug) << "Gesture " << job.sequence << " superseded";
      continue;
    }

    if (job.callback) {
      job.callback(job.sequence, std::move(results));
    }
  }
}

} // namespace tracekey
