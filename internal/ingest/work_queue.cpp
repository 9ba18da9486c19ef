#include "work_queue.hpp"

namespace meshgraph::ingest {

WorkQueue::WorkQueue(std::size_t capacity) : capacity_(capacity) {
}

bool WorkQueue::TryEnqueue(Envelope envelope) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_ || queue_.size() >= capacity_) return false;
    queue_.push(std::move(envelope));
  }
  cv_.notify_one();
  return true;
}

std::optional<Envelope> WorkQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  Envelope envelope = std::move(queue_.front());
  queue_.pop();
  ++in_flight_;
  return envelope;
}

void WorkQueue::TaskDone() {
  {
    std::lock_guard lock(mutex_);
    if (in_flight_ > 0) --in_flight_;
  }
  idle_cv_.notify_all();
}

void WorkQueue::WaitIdle() {
  std::unique_lock lock(mutex_);
  idle_cv_.wait(lock, [&] { return queue_.empty() && in_flight_ == 0; });
}

void WorkQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t WorkQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace meshgraph::ingest
