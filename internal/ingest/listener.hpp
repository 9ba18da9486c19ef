#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "broker_transport.hpp"
#include "connection_manager.hpp"
#include "decode_worker.hpp"
#include "envelope_decoder.hpp"
#include "relay_resolver.hpp"
#include "work_queue.hpp"

namespace meshgraph::store {
class EventStore;
}

namespace meshgraph::ingest {

struct ListenerOptions {
  std::string               topic{"msh/#"};
  BackoffPolicy             backoff;
  uint32_t                  workers         = 2; // 0 = decode inline on the listener thread
  std::size_t               queue_capacity  = 10000;
  uint32_t                  handoff_retries = 3;
  std::chrono::milliseconds poll_timeout{200};
  std::chrono::milliseconds stats_interval{60000};
  ChannelKeys               channel_keys;
};

struct IngestCounters {
  uint64_t received        = 0;
  uint64_t decoded         = 0;
  uint64_t decode_errors   = 0;
  uint64_t stored          = 0;
  uint64_t duplicates      = 0;
  uint64_t handoff_retries = 0;
  uint64_t lost            = 0;
  uint64_t reconnects      = 0;
};

/*
  Protocol listener.

  Owns one broker connection and its ConnectionManager, decodes inbound
  envelopes and hands the events to the EventStore. Per-event failures are
  counted, never propagated.

  Step() advances the connection state machine by one transition (or one
  poll while CONNECTED). Run() loops Step() until Stop().
*/
class Listener {
 public:
  Listener(std::unique_ptr<BrokerTransport> transport, std::shared_ptr<store::EventStore> store, ListenerOptions options);
  ~Listener();

  Listener(const Listener&)            = delete;
  Listener& operator=(const Listener&) = delete;

  void Step();

  void Run();

  // Thread-safe; interrupts a backoff wait.
  void Stop();

  // Waits for queued envelopes to be stored. Test and shutdown helper.
  void Drain();

  ConnectionState State() const {
    return connection_.State();
  }

  const ConnectionManager& Connection() const {
    return connection_;
  }

  IngestCounters Stats() const;

  void LogStats() const;

 private:
  void TryConnect();
  void PollOnce();
  void WaitBackoff(std::chrono::milliseconds delay);

  void Dispatch(InboundMessage message);
  void Process(const Envelope& envelope);
  void ProcessContained(const Envelope& envelope);

  template <typename Fn>
  auto Handoff(const char* kind, Fn&& fn) -> std::optional<decltype(fn())>;

  void StopWorkers();

  std::unique_ptr<BrokerTransport>  transport_;
  std::shared_ptr<store::EventStore> store_;
  ListenerOptions                   options_;

  ConnectionManager connection_;
  EnvelopeDecoder   decoder_;
  RelayResolver     relays_;

  std::shared_ptr<WorkQueue>                 queue_;
  std::vector<std::unique_ptr<DecodeWorker>> workers_;

  std::atomic<bool>       stopping_{false};
  std::mutex              wait_mutex_;
  std::condition_variable wait_cv_;

  std::chrono::steady_clock::time_point last_stats_;

  struct Counters {
    std::atomic<uint64_t> received{0};
    std::atomic<uint64_t> decoded{0};
    std::atomic<uint64_t> decode_errors{0};
    std::atomic<uint64_t> stored{0};
    std::atomic<uint64_t> duplicates{0};
    std::atomic<uint64_t> handoff_retries{0};
    std::atomic<uint64_t> lost{0};
    std::atomic<uint64_t> reconnects{0};
  } counters_;
};

} // namespace meshgraph::ingest
