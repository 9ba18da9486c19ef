#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace meshgraph::ingest {

struct InboundMessage {
  std::string topic;
  std::string payload;
};

/*
  Publish/subscribe broker connection as seen by the Listener.

  Every method may throw util::TransientNetworkError; the Listener turns that
  into a BACKOFF transition. Implementations are driven from one thread.
*/
class BrokerTransport {
 public:
  virtual ~BrokerTransport() = default;

  virtual void Connect() = 0;

  virtual void Subscribe(const std::string& topic_pattern) = 0;

  // Services the connection for up to timeout and appends whatever arrived.
  virtual void Poll(std::chrono::milliseconds timeout, std::vector<InboundMessage>& out) = 0;

  // Best effort; never throws.
  virtual void Disconnect() noexcept = 0;
};

} // namespace meshgraph::ingest
