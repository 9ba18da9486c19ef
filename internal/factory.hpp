#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/exporter/exporter.hpp"
#include "internal/ingest/broker_transport.hpp"
#include "internal/ingest/listener.hpp"
#include "internal/store/event_store.hpp"

namespace meshgraph::factory {

/*
  Composition root.

  It is the ONLY place allowed to know concrete DB and broker types.
  Setup failures surface as StorageUnavailableError or ConfigurationError.
*/

enum class OpenMode {
  kCreate,       // collector: create the database if missing
  kMustExist,    // export: a missing database is an error
};

std::shared_ptr<db::Repository> BuildRepository(const meshgraph::runtime::config::RuntimeConfig& config, OpenMode mode);

std::shared_ptr<store::EventStore> BuildEventStore(const meshgraph::runtime::config::RuntimeConfig& config, OpenMode mode);

std::unique_ptr<ingest::BrokerTransport> BuildTransport(const meshgraph::runtime::config::RuntimeConfig& config);

ingest::ListenerOptions BuildListenerOptions(const meshgraph::runtime::config::RuntimeConfig& config);

std::unique_ptr<ingest::Listener> BuildListener(const meshgraph::runtime::config::RuntimeConfig& config,
                                                std::shared_ptr<store::EventStore>               store);

exporter::ExportPlan BuildExportPlan(const meshgraph::runtime::config::RuntimeConfig& config);

} // namespace meshgraph::factory
