#pragma once

#include <functional>
#include <memory>
#include <thread>

#include "work_queue.hpp"

namespace meshgraph::ingest {

/*
  Background worker that decodes and stores envelopes.

  handler must contain its own per-event failures; anything that still
  escapes is logged and the worker moves on.
*/
class DecodeWorker {
 public:
  using Handler = std::function<void(const Envelope&)>;

  DecodeWorker(std::shared_ptr<WorkQueue> queue, Handler handler);
  ~DecodeWorker();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<WorkQueue> queue_;
  Handler                    handler_;

  std::thread thread_;
};

} // namespace meshgraph::ingest
