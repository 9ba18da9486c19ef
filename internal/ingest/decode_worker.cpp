#include "decode_worker.hpp"

#include "internal/observability/logging.hpp"

namespace meshgraph::ingest {

DecodeWorker::DecodeWorker(std::shared_ptr<WorkQueue> queue, Handler handler)
    : queue_(std::move(queue)),
      handler_(std::move(handler)) {}

DecodeWorker::~DecodeWorker() {
  Stop();
}

void DecodeWorker::Start() {
  thread_ = std::thread(&DecodeWorker::Run, this);
}

// Shuts the shared queue down; queued envelopes are still processed.
void DecodeWorker::Stop() {
  queue_->Shutdown();
  if (thread_.joinable())
    thread_.join();
}

void DecodeWorker::Run() {
  while (true) {

    auto envelope = queue_->Dequeue();
    if (!envelope)
      break;

    try {
      handler_(*envelope);
    }
    catch (const std::exception& e) {
      MESHGRAPH_LOG_ERROR("decode worker failed", {observability::StringField("topic", envelope->topic),
                                                   observability::StringField("error", e.what())});
    }
    queue_->TaskDone();
  }
}

}
