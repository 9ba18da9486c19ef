#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>

namespace meshgraph::ingest {

enum class ConnectionState : std::uint8_t {
  kDisconnected = 0,
  kConnecting   = 1,
  kConnected    = 2,
  kBackoff      = 3,
};

std::string_view ToString(ConnectionState state);

struct BackoffPolicy {
  std::chrono::milliseconds min_delay{1000};
  std::chrono::milliseconds max_delay{60000};
  std::chrono::milliseconds stable_after{30000};
};

/*
  Reconnect state of one broker connection.

  DISCONNECTED -> CONNECTING -> CONNECTED -> BACKOFF -> CONNECTING ...

  The backoff delay doubles from min_delay per consecutive failure and is
  capped at max_delay. A connection that stayed up for stable_after resets the
  failure count. Time is passed in so callers and tests control the clock.
*/
class ConnectionManager {
 public:
  using TimePoint = std::chrono::steady_clock::time_point;

  explicit ConnectionManager(BackoffPolicy policy);

  ConnectionState State() const {
    return state_;
  }

  // DISCONNECTED or BACKOFF -> CONNECTING
  void BeginConnect();

  // CONNECTING -> CONNECTED
  void OnConnected(TimePoint now);

  // CONNECTING or CONNECTED -> BACKOFF; returns the delay to wait.
  std::chrono::milliseconds OnFailure(TimePoint now);

  std::chrono::milliseconds CurrentDelay() const {
    return delay_;
  }

  std::uint32_t ConsecutiveFailures() const {
    return failures_;
  }

  // Successful connects after the first one.
  std::uint64_t Reconnects() const {
    return reconnects_;
  }

 private:
  std::chrono::milliseconds NextDelay() const;

  BackoffPolicy             policy_;
  ConnectionState           state_ = ConnectionState::kDisconnected;
  std::uint32_t             failures_ = 0;
  std::chrono::milliseconds delay_{0};
  TimePoint                 connected_since_{};
  std::uint64_t             connects_ = 0;
  std::uint64_t             reconnects_ = 0;
};

} // namespace meshgraph::ingest
