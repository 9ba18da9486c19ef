#pragma once

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/events.hpp"
#include "internal/model/node.hpp"
#include "internal/model/rollup.hpp"

namespace meshgraph::store {

enum class EntityKind {
  kMessages,
  kNeighbors,
  kTraceroutes,
  kNodes,
  kHourlyCounts,
  kHourlySenders,
};

/*
  Rows read from one consistent snapshot. Kinds that were not requested are
  left empty. nodes is the whole directory, not windowed. Hourly rows are
  selected by their hour start.
*/
struct RangeSnapshot {
  std::vector<model::Message>          messages;
  std::vector<model::NeighborReport>   neighbors;
  std::vector<model::TracerouteRecord> traceroutes;
  std::vector<model::Node>             nodes;
  std::vector<model::HourlyTypeCount>  hourly_counts;
  std::vector<model::HourlySender>     hourly_senders;
};

struct StoreOptions {
  uint32_t                  write_retries = 3;
  std::chrono::milliseconds retry_backoff{50};
};

/*
  EventStore

  Single write path over a Repository.

  - one writer at a time (write_mutex_), each write in its own transaction
  - Busy/IOError results and failed BEGIN/COMMIT are retried write_retries
    times with doubling backoff, then StorageWriteError is thrown
  - inserts return false when the natural key already existed
  - every insert touches last_seen of the graph nodes it references
  - hourly rollups are refreshed before any message row is purged

  Reads do not take the write lock; each QueryRange runs in its own read
  transaction.
*/
class EventStore {
 public:
  EventStore(std::shared_ptr<db::Repository> repository, StoreOptions options = {});

  bool InsertMessage(const model::Message& message);
  void UpsertNode(const model::NodeInfoUpdate& update);
  bool InsertNeighborReport(const model::NeighborReport& report);
  bool InsertTraceroute(const model::TracerouteRecord& record);

  RangeSnapshot QueryRange(const std::vector<EntityKind>& kinds, int64_t start, int64_t end);

  // Rolls up the hours since the newest rolled-up hour minus kRollupLookback,
  // or the whole messages table on the first run.
  void RefreshRollups();

  // Refreshes rollups, then deletes event rows with timestamp < cutoff in the
  // same transaction. Returns rows removed.
  uint64_t PurgeBefore(int64_t cutoff);

  // Rows PurgeBefore(cutoff) would remove.
  uint64_t CountBefore(int64_t cutoff);

  // VACUUM; throws StorageWriteError on failure.
  void Compact();

  static constexpr int64_t kRollupLookback = 2 * 3600;

 private:
  template <typename Fn>
  bool Write(std::string_view kind, Fn&& fn);

  db::Result Rollup(db::Transaction& tx);

  db::Result TouchAll(db::Transaction& tx, std::initializer_list<model::NodeNum> ids, int64_t seen);

  std::shared_ptr<db::Repository> repository_;
  StoreOptions                    options_;
  std::mutex                      write_mutex_;
};

} // namespace meshgraph::store
