#include "factory.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#if MESHGRAPH_MQTT_MOSQUITTO
#include "internal/ingest/mosquitto_transport.hpp"
#endif

namespace meshgraph::factory {

using meshgraph::runtime::config::RuntimeConfig;

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config, OpenMode mode) {
  const auto& path = config.database().path();

  if (mode == OpenMode::kMustExist && !std::filesystem::exists(path)) {
    throw util::StorageUnavailableError("database not found: " + path);
  }

  try {
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path);
    db::sql::RunMigrations(*sqlite_db, db::sql::SchemaMigrations());
    MESHGRAPH_LOG_INFO("database ready", {observability::StringField("path", path)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  } catch (const std::exception& e) {
    throw util::StorageUnavailableError("cannot open database " + path + ": " + e.what());
  }
}

std::shared_ptr<store::EventStore> BuildEventStore(const RuntimeConfig& config, OpenMode mode) {
  store::StoreOptions options;
  options.write_retries = config.database().write_retries();
  options.retry_backoff = util::ParseDuration(config.database().retry_backoff());
  return std::make_shared<store::EventStore>(BuildRepository(config, mode), options);
}

std::unique_ptr<ingest::BrokerTransport> BuildTransport(const RuntimeConfig& config) {
#if MESHGRAPH_MQTT_MOSQUITTO
  const auto& broker = config.broker();

  ingest::BrokerSettings settings;
  settings.address           = broker.address();
  settings.port              = broker.port();
  settings.client_id         = broker.client_id();
  settings.username          = broker.username();
  settings.password          = broker.password();
  settings.tls               = broker.tls();
  settings.tls_ca_file       = broker.tls_ca_file();
  settings.keepalive_seconds = static_cast<int>(
      std::chrono::duration_cast<std::chrono::seconds>(util::ParseDuration(broker.keepalive())).count());
  return std::make_unique<ingest::MosquittoTransport>(std::move(settings));
#else
  (void)config;
  throw util::ConfigurationError("mqtt transport requested but not enabled at build time");
#endif
}

ingest::ListenerOptions BuildListenerOptions(const RuntimeConfig& config) {
  ingest::ListenerOptions options;
  options.topic                 = config.broker().topic();
  options.backoff.min_delay     = util::ParseDuration(config.reconnect().min_delay());
  options.backoff.max_delay     = util::ParseDuration(config.reconnect().max_delay());
  options.backoff.stable_after  = util::ParseDuration(config.reconnect().stable_after());
  options.workers               = config.ingest().workers();
  options.queue_capacity        = config.ingest().queue_capacity();
  options.handoff_retries       = config.ingest().handoff_retries();
  options.stats_interval        = util::ParseDuration(config.ingest().stats_interval());
  options.channel_keys.default_psk = config.broker().default_channel_key();
  for (const auto& [channel, psk] : config.broker().channel_keys()) {
    options.channel_keys.psk_by_channel[channel] = psk;
  }
  return options;
}

std::unique_ptr<ingest::Listener> BuildListener(const RuntimeConfig& config, std::shared_ptr<store::EventStore> store) {
  return std::make_unique<ingest::Listener>(BuildTransport(config), std::move(store), BuildListenerOptions(config));
}

exporter::ExportPlan BuildExportPlan(const RuntimeConfig& config) {
  exporter::ExportPlan plan;
  plan.views = exporter::AllViews();
  for (const auto& window : config.export_().windows()) {
    plan.windows.push_back(util::ParseDuration(window));
  }
  for (auto days : config.export_().series_days()) {
    plan.series_days.push_back(days);
  }
  return plan;
}

} // namespace meshgraph::factory
