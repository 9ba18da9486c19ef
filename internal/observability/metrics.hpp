#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace meshgraph::runtime::config {
class RuntimeConfig;
}

namespace meshgraph::observability {

/*
  OTLP metrics. Built only with ENABLE_OTEL; otherwise every call below is an
  inline no-op and InitializeMetrics() reports false.
*/

bool InitializeMetrics(const meshgraph::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

class Metrics {
 public:
  static Metrics& Instance();

  // outcome: received, decoded, decode_error, stored, duplicate, lost
  void RecordIngest(std::string_view outcome);
  void RecordReconnect();
  void SetQueueDepth(std::uint64_t depth);
  void ObserveStoreLatencyMs(std::string_view kind, double latency_ms);
  void ObserveExportDurationMs(std::string_view view, double duration_ms);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const meshgraph::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordIngest(std::string_view) {
}

inline void Metrics::RecordReconnect() {
}

inline void Metrics::SetQueueDepth(std::uint64_t) {
}

inline void Metrics::ObserveStoreLatencyMs(std::string_view, double) {
}

inline void Metrics::ObserveExportDurationMs(std::string_view, double) {
}
#endif

} // namespace meshgraph::observability
