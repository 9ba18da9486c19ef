#include "mosquitto_transport.hpp"

#include <mosquitto.h>

#include <mutex>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace meshgraph::ingest {

namespace {

std::once_flag g_lib_init;

void ThrowIf(int rc, const char* what) {
  if (rc != MOSQ_ERR_SUCCESS) {
    throw util::TransientNetworkError(std::string(what) + ": " + mosquitto_strerror(rc));
  }
}

} // namespace

MosquittoTransport::MosquittoTransport(BrokerSettings settings) : settings_(std::move(settings)) {
  std::call_once(g_lib_init, [] { mosquitto_lib_init(); });

  handle_ = mosquitto_new(settings_.client_id.empty() ? nullptr : settings_.client_id.c_str(), true, this);
  if (!handle_) {
    throw std::runtime_error("mosquitto_new failed");
  }
  mosquitto_message_callback_set(handle_, &MosquittoTransport::OnMessage);

  if (!settings_.username.empty()) {
    int rc = mosquitto_username_pw_set(handle_, settings_.username.c_str(),
                                       settings_.password.empty() ? nullptr : settings_.password.c_str());
    if (rc != MOSQ_ERR_SUCCESS) {
      mosquitto_destroy(handle_);
      throw util::ConfigurationError(std::string("broker credentials: ") + mosquitto_strerror(rc));
    }
  }

  if (settings_.tls) {
    const char* ca_file = settings_.tls_ca_file.empty() ? nullptr : settings_.tls_ca_file.c_str();
    int         rc      = ca_file ? mosquitto_tls_set(handle_, ca_file, nullptr, nullptr, nullptr, nullptr)
                                  : mosquitto_tls_set(handle_, nullptr, "/etc/ssl/certs", nullptr, nullptr, nullptr);
    if (rc != MOSQ_ERR_SUCCESS) {
      mosquitto_destroy(handle_);
      throw util::ConfigurationError(std::string("broker tls: ") + mosquitto_strerror(rc));
    }
  }
}

MosquittoTransport::~MosquittoTransport() {
  Disconnect();
  if (handle_) mosquitto_destroy(handle_);
}

void MosquittoTransport::Connect() {
  ThrowIf(mosquitto_connect(handle_, settings_.address.c_str(), static_cast<int>(settings_.port), settings_.keepalive_seconds),
          "connect");
  connected_ = true;
}

void MosquittoTransport::Subscribe(const std::string& topic_pattern) {
  ThrowIf(mosquitto_subscribe(handle_, nullptr, topic_pattern.c_str(), 0), "subscribe");
}

void MosquittoTransport::Poll(std::chrono::milliseconds timeout, std::vector<InboundMessage>& out) {
  const int rc = mosquitto_loop(handle_, static_cast<int>(timeout.count()), 1);

  // callbacks fire inside mosquitto_loop; hand over whatever arrived first
  for (auto& message : pending_) {
    out.push_back(std::move(message));
  }
  pending_.clear();

  if (rc != MOSQ_ERR_SUCCESS) {
    connected_ = false;
    ThrowIf(rc, "loop");
  }
}

void MosquittoTransport::Disconnect() noexcept {
  if (handle_ && connected_) {
    mosquitto_disconnect(handle_);
  }
  connected_ = false;
}

void MosquittoTransport::OnMessage(struct mosquitto*, void* self, const struct mosquitto_message* message) {
  auto* transport = static_cast<MosquittoTransport*>(self);
  InboundMessage inbound;
  inbound.topic = message->topic ? message->topic : "";
  if (message->payload && message->payloadlen > 0) {
    inbound.payload.assign(static_cast<const char*>(message->payload), static_cast<std::size_t>(message->payloadlen));
  }
  transport->pending_.push_back(std::move(inbound));
}

} // namespace meshgraph::ingest
