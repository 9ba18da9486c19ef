#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace meshgraph::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;

  Result InsertMessage(Transaction&, const model::Message&) override;
  std::vector<model::Message> ListMessages(Transaction&, int64_t start, int64_t end) override;

  Result UpsertNode(Transaction&, const model::NodeInfoUpdate&) override;
  Result TouchNode(Transaction&, model::NodeNum id, int64_t seen) override;
  std::optional<model::Node> GetNode(Transaction&, model::NodeNum id) override;
  std::vector<model::Node> ListNodes(Transaction&) override;

  Result InsertNeighborReport(Transaction&, const model::NeighborReport&) override;
  std::vector<model::NeighborReport> ListNeighborReports(Transaction&, int64_t start, int64_t end) override;

  Result InsertTraceroute(Transaction&, const model::TracerouteRecord&) override;
  std::vector<model::TracerouteRecord> ListTraceroutes(Transaction&, int64_t start, int64_t end) override;

  std::optional<int64_t> LatestRollupHour(Transaction&) override;
  Result RefreshRollups(Transaction&, int64_t since) override;
  std::vector<model::HourlyTypeCount> ListHourlyCounts(Transaction&, int64_t start, int64_t end) override;
  std::vector<model::HourlySender> ListHourlySenders(Transaction&, int64_t start, int64_t end) override;

  Result PurgeBefore(Transaction&, int64_t cutoff, uint64_t& deleted) override;
  Result CountBefore(Transaction&, int64_t cutoff, uint64_t& rows) override;
  Result Compact() override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
