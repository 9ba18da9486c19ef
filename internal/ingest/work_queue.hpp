#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

#include "envelope_decoder.hpp"

namespace meshgraph::ingest {

/*
  Bounded thread-safe blocking queue feeding decode workers.

  TryEnqueue never blocks the broker thread: a full queue rejects the
  envelope. After Shutdown() workers still drain what is queued.
*/
class WorkQueue {
 public:
  explicit WorkQueue(std::size_t capacity);

  bool TryEnqueue(Envelope envelope);

  // blocking wait; nullopt once shut down and empty
  std::optional<Envelope> Dequeue();

  // called by the worker after finishing a dequeued envelope
  void TaskDone();

  // blocks until nothing is queued or in flight
  void WaitIdle();

  void Shutdown();

  std::size_t Size() const;

 private:
  const std::size_t       capacity_;
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::queue<Envelope>    queue_;
  std::size_t             in_flight_ = 0;
  bool                    shutdown_  = false;
};

} // namespace meshgraph::ingest
