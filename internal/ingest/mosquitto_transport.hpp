#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "broker_transport.hpp"

struct mosquitto;
struct mosquitto_message;

namespace meshgraph::ingest {

struct BrokerSettings {
  std::string address{"localhost"};
  uint32_t    port = 1883;
  std::string client_id{"meshgraph-collector"};
  std::string username;
  std::string password;
  bool        tls = false;
  std::string tls_ca_file;
  int         keepalive_seconds = 60;
};

/*
  BrokerTransport over libmosquitto, driven synchronously with
  mosquitto_loop() from the Listener thread. Only compiled when
  MESHGRAPH_MQTT_MOSQUITTO is set.
*/
class MosquittoTransport final : public BrokerTransport {
 public:
  explicit MosquittoTransport(BrokerSettings settings);
  ~MosquittoTransport() override;

  MosquittoTransport(const MosquittoTransport&)            = delete;
  MosquittoTransport& operator=(const MosquittoTransport&) = delete;

  void Connect() override;
  void Subscribe(const std::string& topic_pattern) override;
  void Poll(std::chrono::milliseconds timeout, std::vector<InboundMessage>& out) override;
  void Disconnect() noexcept override;

 private:
  static void OnMessage(struct mosquitto* handle, void* self, const struct mosquitto_message* message);

  BrokerSettings              settings_;
  struct mosquitto*           handle_    = nullptr;
  bool                        connected_ = false;
  std::vector<InboundMessage> pending_;
};

} // namespace meshgraph::ingest
