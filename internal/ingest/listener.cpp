#include "listener.hpp"

#include <type_traits>
#include <variant>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/store/event_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace meshgraph::ingest {

using observability::IntField;
using observability::StringField;

Listener::Listener(std::unique_ptr<BrokerTransport> transport, std::shared_ptr<store::EventStore> store, ListenerOptions options)
    : transport_(std::move(transport)),
      store_(std::move(store)),
      options_(std::move(options)),
      connection_(options_.backoff),
      decoder_(ChannelCipher(options_.channel_keys)),
      last_stats_(std::chrono::steady_clock::now()) {
  if (options_.workers > 0) {
    queue_ = std::make_shared<WorkQueue>(options_.queue_capacity);
    for (uint32_t i = 0; i < options_.workers; ++i) {
      auto worker = std::make_unique<DecodeWorker>(queue_, [this](const Envelope& e) { ProcessContained(e); });
      worker->Start();
      workers_.push_back(std::move(worker));
    }
  }
}

Listener::~Listener() {
  StopWorkers();
  transport_->Disconnect();
}

// ------------------------------------------------------------------
// Connection state machine
// ------------------------------------------------------------------

void Listener::Step() {
  switch (connection_.State()) {
    case ConnectionState::kDisconnected:
      connection_.BeginConnect();
      break;

    case ConnectionState::kConnecting:
      TryConnect();
      break;

    case ConnectionState::kConnected:
      PollOnce();
      break;

    case ConnectionState::kBackoff:
      WaitBackoff(connection_.CurrentDelay());
      if (!stopping_) connection_.BeginConnect();
      break;
  }
}

void Listener::TryConnect() {
  try {
    transport_->Connect();
    transport_->Subscribe(options_.topic);
  } catch (const util::TransientNetworkError& e) {
    transport_->Disconnect();
    auto delay = connection_.OnFailure(std::chrono::steady_clock::now());
    MESHGRAPH_LOG_WARN("broker connect failed", {StringField("error", e.what()), IntField("retry_in_ms", delay.count()),
                                                 IntField("failures", connection_.ConsecutiveFailures())});
    return;
  }

  const auto reconnects_before = connection_.Reconnects();
  connection_.OnConnected(std::chrono::steady_clock::now());
  if (connection_.Reconnects() > reconnects_before) {
    counters_.reconnects++;
    observability::Metrics::Instance().RecordReconnect();
  }
  MESHGRAPH_LOG_INFO("broker connected", {StringField("topic", options_.topic)});
}

void Listener::PollOnce() {
  std::vector<InboundMessage> batch;
  try {
    transport_->Poll(options_.poll_timeout, batch);
  } catch (const util::TransientNetworkError& e) {
    transport_->Disconnect();
    auto delay = connection_.OnFailure(std::chrono::steady_clock::now());
    MESHGRAPH_LOG_WARN("broker connection lost", {StringField("error", e.what()), IntField("retry_in_ms", delay.count())});
  }

  // messages read before a failure are still processed
  for (auto& message : batch) {
    Dispatch(std::move(message));
  }

  const auto now = std::chrono::steady_clock::now();
  if (now - last_stats_ >= options_.stats_interval) {
    last_stats_ = now;
    LogStats();
  }
}

void Listener::WaitBackoff(std::chrono::milliseconds delay) {
  std::unique_lock lock(wait_mutex_);
  wait_cv_.wait_for(lock, delay, [&] { return stopping_.load(); });
}

void Listener::Run() {
  while (!stopping_) {
    Step();
  }

  StopWorkers();
  transport_->Disconnect();
  LogStats();
}

void Listener::Stop() {
  {
    std::lock_guard lock(wait_mutex_);
    stopping_ = true;
  }
  wait_cv_.notify_all();
}

void Listener::Drain() {
  if (queue_) queue_->WaitIdle();
}

void Listener::StopWorkers() {
  for (auto& worker : workers_) {
    worker->Stop();
  }
  workers_.clear();
}

// ------------------------------------------------------------------
// Event path
// ------------------------------------------------------------------

void Listener::Dispatch(InboundMessage message) {
  counters_.received++;
  observability::Metrics::Instance().RecordIngest("received");

  Envelope envelope{std::move(message.topic), std::move(message.payload), util::ToUnixSeconds(util::Now())};

  if (!queue_) {
    ProcessContained(envelope);
    return;
  }

  if (!queue_->TryEnqueue(std::move(envelope))) {
    counters_.lost++;
    observability::Metrics::Instance().RecordIngest("lost");
    MESHGRAPH_LOG_WARN("ingest queue full, envelope dropped", {IntField("capacity", options_.queue_capacity)});
  }
  observability::Metrics::Instance().SetQueueDepth(queue_->Size());
}

void Listener::ProcessContained(const Envelope& envelope) {
  try {
    Process(envelope);
  } catch (const std::exception& e) {
    counters_.lost++;
    observability::Metrics::Instance().RecordIngest("lost");
    MESHGRAPH_LOG_ERROR("envelope processing failed", {StringField("topic", envelope.topic), StringField("error", e.what())});
  }
}

/*
  Retries fn on StorageWriteError up to handoff_retries times. Returns
  nullopt and counts a loss when every attempt failed.
*/
template <typename Fn>
auto Listener::Handoff(const char* kind, Fn&& fn) -> std::optional<decltype(fn())> {
  std::string last_error;
  for (uint32_t attempt = 0; attempt <= options_.handoff_retries; ++attempt) {
    if (attempt > 0) counters_.handoff_retries++;
    try {
      return fn();
    } catch (const util::StorageWriteError& e) {
      last_error = e.what();
    }
  }

  counters_.lost++;
  observability::Metrics::Instance().RecordIngest("lost");
  MESHGRAPH_LOG_ERROR("event dropped after handoff retries", {StringField("kind", kind), StringField("error", last_error)});
  return std::nullopt;
}

void Listener::Process(const Envelope& envelope) {
  auto events = decoder_.Decode(envelope);

  if (events.empty() || std::holds_alternative<model::Unknown>(events.front())) {
    counters_.decode_errors++;
    observability::Metrics::Instance().RecordIngest("decode_error");
    const auto reason = events.empty() ? std::string("no events") : std::get<model::Unknown>(events.front()).reason;
    MESHGRAPH_LOG_DEBUG("envelope discarded", {StringField("topic", envelope.topic), StringField("reason", reason)});
    return;
  }

  counters_.decoded++;
  observability::Metrics::Instance().RecordIngest("decoded");

  auto message = std::get<model::Message>(events.front());
  relays_.Observe(message.from);
  message.physical_sender = relays_.PhysicalSender(message.from, message.relay_node, message.hop_count);

  auto inserted = Handoff("message", [&] { return store_->InsertMessage(message); });
  if (!inserted) return;
  if (!*inserted) {
    // re-delivery or a second gateway; derived events were stored the first time
    counters_.duplicates++;
    observability::Metrics::Instance().RecordIngest("duplicate");
    return;
  }
  counters_.stored++;
  observability::Metrics::Instance().RecordIngest("stored");

  for (std::size_t i = 1; i < events.size(); ++i) {
    std::visit(
        [&](const auto& event) {
          using T = std::decay_t<decltype(event)>;
          if constexpr (std::is_same_v<T, model::NodeInfoUpdate>) {
            Handoff("node", [&] {
              store_->UpsertNode(event);
              return true;
            });
          } else if constexpr (std::is_same_v<T, model::NeighborReport>) {
            Handoff("neighbor", [&] { return store_->InsertNeighborReport(event); });
          } else if constexpr (std::is_same_v<T, model::TracerouteRecord>) {
            Handoff("traceroute", [&] { return store_->InsertTraceroute(event); });
          }
        },
        events[i]);
  }
}

// ------------------------------------------------------------------
// Stats
// ------------------------------------------------------------------

IngestCounters Listener::Stats() const {
  IngestCounters c;
  c.received        = counters_.received.load();
  c.decoded         = counters_.decoded.load();
  c.decode_errors   = counters_.decode_errors.load();
  c.stored          = counters_.stored.load();
  c.duplicates      = counters_.duplicates.load();
  c.handoff_retries = counters_.handoff_retries.load();
  c.lost            = counters_.lost.load();
  c.reconnects      = counters_.reconnects.load();
  return c;
}

void Listener::LogStats() const {
  const auto c = Stats();
  MESHGRAPH_LOG_INFO("ingest stats", {StringField("state", ToString(connection_.State())),
                                      IntField("received", c.received),
                                      IntField("decoded", c.decoded),
                                      IntField("decode_errors", c.decode_errors),
                                      IntField("stored", c.stored),
                                      IntField("duplicates", c.duplicates),
                                      IntField("handoff_retries", c.handoff_retries),
                                      IntField("lost", c.lost),
                                      IntField("reconnects", c.reconnects)});
}

} // namespace meshgraph::ingest
