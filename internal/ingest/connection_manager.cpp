#include "connection_manager.hpp"

#include <stdexcept>
#include <string>

namespace meshgraph::ingest {

std::string_view ToString(ConnectionState state) {
  switch (state) {
    case ConnectionState::kDisconnected:
      return "DISCONNECTED";
    case ConnectionState::kConnecting:
      return "CONNECTING";
    case ConnectionState::kConnected:
      return "CONNECTED";
    case ConnectionState::kBackoff:
      return "BACKOFF";
  }
  return "UNKNOWN";
}

static void RequireState(bool ok, ConnectionState from, std::string_view to) {
  if (!ok) {
    throw std::logic_error("invalid connection transition " + std::string(ToString(from)) + " -> " + std::string(to));
  }
}

ConnectionManager::ConnectionManager(BackoffPolicy policy) : policy_(policy) {
  if (policy_.min_delay.count() <= 0 || policy_.max_delay < policy_.min_delay) {
    throw std::invalid_argument("backoff policy requires 0 < min_delay <= max_delay");
  }
}

void ConnectionManager::BeginConnect() {
  RequireState(state_ == ConnectionState::kDisconnected || state_ == ConnectionState::kBackoff, state_, "CONNECTING");
  state_ = ConnectionState::kConnecting;
}

void ConnectionManager::OnConnected(TimePoint now) {
  RequireState(state_ == ConnectionState::kConnecting, state_, "CONNECTED");
  state_           = ConnectionState::kConnected;
  connected_since_ = now;
  if (connects_++ > 0) {
    ++reconnects_;
  }
}

std::chrono::milliseconds ConnectionManager::OnFailure(TimePoint now) {
  RequireState(state_ == ConnectionState::kConnecting || state_ == ConnectionState::kConnected, state_, "BACKOFF");

  if (state_ == ConnectionState::kConnected && now - connected_since_ >= policy_.stable_after) {
    failures_ = 0;
  }

  delay_ = NextDelay();
  if (failures_ < UINT32_MAX) {
    ++failures_;
  }
  state_ = ConnectionState::kBackoff;
  return delay_;
}

std::chrono::milliseconds ConnectionManager::NextDelay() const {
  auto delay = policy_.min_delay;
  for (std::uint32_t i = 0; i < failures_; ++i) {
    if (delay >= policy_.max_delay / 2) {
      return policy_.max_delay;
    }
    delay *= 2;
  }
  return delay < policy_.max_delay ? delay : policy_.max_delay;
}

} // namespace meshgraph::ingest
