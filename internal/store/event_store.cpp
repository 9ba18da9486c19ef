#include "event_store.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace meshgraph::store {

using db::ErrorCode;
using db::Result;

EventStore::EventStore(std::shared_ptr<db::Repository> repository, StoreOptions options)
    : repository_(std::move(repository)), options_(options) {
}

/*
  Runs fn(tx) -> Result inside a write transaction.

  OK commits and returns true. AlreadyExists commits whatever fn did before
  noticing and returns false. Retryable failures back off and run fn again
  on a fresh transaction.
*/
template <typename Fn>
bool EventStore::Write(std::string_view kind, Fn&& fn) {
  const auto started = std::chrono::steady_clock::now();
  auto       backoff = options_.retry_backoff;
  std::string last_error;

  for (uint32_t attempt = 0; attempt <= options_.write_retries; ++attempt) {
    if (attempt > 0) {
      MESHGRAPH_LOG_DEBUG("retrying store write", {observability::StringField("kind", kind),
                                                   observability::IntField("attempt", attempt),
                                                   observability::StringField("error", last_error)});
      std::this_thread::sleep_for(backoff);
      backoff *= 2;
    }

    std::lock_guard<std::mutex> lock(write_mutex_);

    std::unique_ptr<db::Transaction> tx;
    try {
      tx = repository_->Begin();
    } catch (const std::exception& e) {
      last_error = e.what();
      continue;
    }

    Result r = fn(*tx);
    if (!r && r.code != ErrorCode::AlreadyExists) {
      last_error = r.message;
      tx.reset(); // rolls back
      if (db::IsRetryable(r)) {
        continue;
      }
      throw util::StorageWriteError(std::string(kind) + ": " + r.message);
    }

    try {
      tx->Commit();
    } catch (const std::exception& e) {
      last_error = e.what();
      continue;
    }

    const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started);
    observability::Metrics::Instance().ObserveStoreLatencyMs(kind, elapsed.count());
    return r.code != ErrorCode::AlreadyExists;
  }

  throw util::StorageWriteError(std::string(kind) + ": retries exhausted: " + last_error);
}

Result EventStore::TouchAll(db::Transaction& tx, std::initializer_list<model::NodeNum> ids, int64_t seen) {
  for (auto id : ids) {
    if (!util::IsGraphNode(id)) continue;
    auto r = repository_->TouchNode(tx, id, seen);
    if (!r) return r;
  }
  return Result::Ok();
}

bool EventStore::InsertMessage(const model::Message& message) {
  return Write("message", [&](db::Transaction& tx) {
    auto r = repository_->InsertMessage(tx, message);
    if (!r) return r;
    return TouchAll(tx, {message.from, message.to, message.physical_sender}, message.timestamp);
  });
}

void EventStore::UpsertNode(const model::NodeInfoUpdate& update) {
  Write("node", [&](db::Transaction& tx) { return repository_->UpsertNode(tx, update); });
}

bool EventStore::InsertNeighborReport(const model::NeighborReport& report) {
  return Write("neighbor", [&](db::Transaction& tx) {
    auto r = repository_->InsertNeighborReport(tx, report);
    if (!r) return r;
    return TouchAll(tx, {report.reporter, report.neighbor}, report.timestamp);
  });
}

bool EventStore::InsertTraceroute(const model::TracerouteRecord& record) {
  return Write("traceroute", [&](db::Transaction& tx) {
    auto r = repository_->InsertTraceroute(tx, record);
    if (!r) return r;
    for (auto hop : record.hops) {
      auto touched = TouchAll(tx, {hop}, record.timestamp);
      if (!touched) return touched;
    }
    return Result::Ok();
  });
}

RangeSnapshot EventStore::QueryRange(const std::vector<EntityKind>& kinds, int64_t start, int64_t end) {
  auto wants = [&](EntityKind k) { return std::find(kinds.begin(), kinds.end(), k) != kinds.end(); };

  RangeSnapshot snapshot;
  try {
    auto tx = repository_->BeginRead();
    if (wants(EntityKind::kMessages)) snapshot.messages = repository_->ListMessages(*tx, start, end);
    if (wants(EntityKind::kNeighbors)) snapshot.neighbors = repository_->ListNeighborReports(*tx, start, end);
    if (wants(EntityKind::kTraceroutes)) snapshot.traceroutes = repository_->ListTraceroutes(*tx, start, end);
    if (wants(EntityKind::kNodes)) snapshot.nodes = repository_->ListNodes(*tx);
    if (wants(EntityKind::kHourlyCounts)) snapshot.hourly_counts = repository_->ListHourlyCounts(*tx, start, end);
    if (wants(EntityKind::kHourlySenders)) snapshot.hourly_senders = repository_->ListHourlySenders(*tx, start, end);
    tx->Commit();
  } catch (const util::StorageUnavailableError&) {
    throw;
  } catch (const std::exception& e) {
    throw util::StorageUnavailableError(std::string("range query failed: ") + e.what());
  }
  return snapshot;
}

Result EventStore::Rollup(db::Transaction& tx) {
  std::optional<int64_t> latest;
  try {
    latest = repository_->LatestRollupHour(tx);
  } catch (const std::exception& e) {
    return Result::Err(ErrorCode::InternalError, e.what());
  }
  // the newest hours may have been rolled up while still filling
  const int64_t since = latest ? *latest - kRollupLookback : 0;
  return repository_->RefreshRollups(tx, since);
}

void EventStore::RefreshRollups() {
  Write("rollup", [&](db::Transaction& tx) { return Rollup(tx); });
}

uint64_t EventStore::PurgeBefore(int64_t cutoff) {
  uint64_t deleted = 0;
  Write("purge", [&](db::Transaction& tx) {
    auto r = Rollup(tx);
    if (!r) return r;
    return repository_->PurgeBefore(tx, cutoff, deleted);
  });
  return deleted;
}

uint64_t EventStore::CountBefore(int64_t cutoff) {
  uint64_t rows = 0;
  try {
    auto tx = repository_->BeginRead();
    auto r  = repository_->CountBefore(*tx, cutoff, rows);
    if (!r) throw util::StorageUnavailableError("count failed: " + r.message);
    tx->Commit();
  } catch (const util::StorageUnavailableError&) {
    throw;
  } catch (const std::exception& e) {
    throw util::StorageUnavailableError(std::string("count failed: ") + e.what());
  }
  return rows;
}

void EventStore::Compact() {
  std::lock_guard<std::mutex> lock(write_mutex_);
  auto                        r = repository_->Compact();
  if (!r) throw util::StorageWriteError("vacuum: " + r.message);
  MESHGRAPH_LOG_INFO("database compacted");
}

} // namespace meshgraph::store
