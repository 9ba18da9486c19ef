#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/model/events.hpp"
#include "internal/model/node.hpp"
#include "internal/model/rollup.hpp"

namespace meshgraph::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction obtained from Begin()
  - Callers serialize Begin() transactions; the repository does not
  - BeginRead() transactions may run concurrently with a writer and with
    each other
  - Inserts are idempotent on the natural key and return AlreadyExists
    instead of writing a second row

  Timestamps are unix seconds; range reads are inclusive on both ends and
  ordered by (timestamp, row id).
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual std::unique_ptr<Transaction> BeginRead() = 0;

  // ---------------------------------------------------------------------
  // Messages
  // ---------------------------------------------------------------------

  virtual Result InsertMessage(Transaction&, const model::Message&) = 0;

  virtual std::vector<model::Message> ListMessages(Transaction&, int64_t start, int64_t end) = 0;

  // ---------------------------------------------------------------------
  // Node directory
  // ---------------------------------------------------------------------

  virtual Result UpsertNode(Transaction&, const model::NodeInfoUpdate&) = 0;

  // Creates the node if missing and moves last_seen forward.
  virtual Result TouchNode(Transaction&, model::NodeNum id, int64_t seen) = 0;

  virtual std::optional<model::Node> GetNode(Transaction&, model::NodeNum id) = 0;

  virtual std::vector<model::Node> ListNodes(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Neighbor reports / traceroutes
  // ---------------------------------------------------------------------

  virtual Result InsertNeighborReport(Transaction&, const model::NeighborReport&) = 0;

  virtual std::vector<model::NeighborReport> ListNeighborReports(Transaction&, int64_t start, int64_t end) = 0;

  virtual Result InsertTraceroute(Transaction&, const model::TracerouteRecord&) = 0;

  virtual std::vector<model::TracerouteRecord> ListTraceroutes(Transaction&, int64_t start, int64_t end) = 0;

  // ---------------------------------------------------------------------
  // Hourly rollups
  // ---------------------------------------------------------------------

  // Start of the newest rolled-up hour, nullopt before the first rollup.
  virtual std::optional<int64_t> LatestRollupHour(Transaction&) = 0;

  // Recomputes the hourly rollups of every hour containing a message with
  // timestamp >= since. Hours before since are left untouched.
  virtual Result RefreshRollups(Transaction&, int64_t since) = 0;

  // Rows with start <= hour <= end, ordered by hour.
  virtual std::vector<model::HourlyTypeCount> ListHourlyCounts(Transaction&, int64_t start, int64_t end) = 0;

  virtual std::vector<model::HourlySender> ListHourlySenders(Transaction&, int64_t start, int64_t end) = 0;

  // ---------------------------------------------------------------------
  // Retention
  // ---------------------------------------------------------------------

  // Deletes event rows (messages, neighbor reports, traceroutes) older than
  // cutoff. Nodes and hourly rollups are kept.
  virtual Result PurgeBefore(Transaction&, int64_t cutoff, uint64_t& deleted) = 0;

  // Event rows PurgeBefore(cutoff) would delete.
  virtual Result CountBefore(Transaction&, int64_t cutoff, uint64_t& rows) = 0;

  // Reclaims free pages. Runs outside any transaction.
  virtual Result Compact() = 0;
};

} // namespace meshgraph::db
