#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace meshgraph::testing {

using db::Repository;
using db::Result;
using db::Transaction;
using model::Message;
using model::NeighborReport;
using model::Node;
using model::NodeInfoUpdate;
using model::NodeNum;
using model::TracerouteRecord;

// Forwards to a real repository; lets a test fail message inserts on demand.
class HookedRepository final : public Repository {
 public:
  explicit HookedRepository(std::shared_ptr<Repository> inner) : inner_(std::move(inner)) {
  }

  std::function<std::optional<Result>()> before_insert_message;
  int                                    insert_message_calls = 0;

  std::unique_ptr<Transaction> Begin() override {
    return inner_->Begin();
  }
  std::unique_ptr<Transaction> BeginRead() override {
    return inner_->BeginRead();
  }

  Result InsertMessage(Transaction& tx, const Message& m) override {
    ++insert_message_calls;
    if (before_insert_message) {
      if (auto injected = before_insert_message()) return *injected;
    }
    return inner_->InsertMessage(tx, m);
  }
  std::vector<Message> ListMessages(Transaction& tx, int64_t start, int64_t end) override {
    return inner_->ListMessages(tx, start, end);
  }

  Result UpsertNode(Transaction& tx, const NodeInfoUpdate& u) override {
    return inner_->UpsertNode(tx, u);
  }
  Result TouchNode(Transaction& tx, NodeNum id, int64_t seen) override {
    return inner_->TouchNode(tx, id, seen);
  }
  std::optional<Node> GetNode(Transaction& tx, NodeNum id) override {
    return inner_->GetNode(tx, id);
  }
  std::vector<Node> ListNodes(Transaction& tx) override {
    return inner_->ListNodes(tx);
  }

  Result InsertNeighborReport(Transaction& tx, const NeighborReport& r) override {
    return inner_->InsertNeighborReport(tx, r);
  }
  std::vector<NeighborReport> ListNeighborReports(Transaction& tx, int64_t start, int64_t end) override {
    return inner_->ListNeighborReports(tx, start, end);
  }

  Result InsertTraceroute(Transaction& tx, const TracerouteRecord& r) override {
    return inner_->InsertTraceroute(tx, r);
  }
  std::vector<TracerouteRecord> ListTraceroutes(Transaction& tx, int64_t start, int64_t end) override {
    return inner_->ListTraceroutes(tx, start, end);
  }

  std::optional<int64_t> LatestRollupHour(Transaction& tx) override {
    return inner_->LatestRollupHour(tx);
  }
  Result RefreshRollups(Transaction& tx, int64_t since) override {
    return inner_->RefreshRollups(tx, since);
  }
  std::vector<model::HourlyTypeCount> ListHourlyCounts(Transaction& tx, int64_t start, int64_t end) override {
    return inner_->ListHourlyCounts(tx, start, end);
  }
  std::vector<model::HourlySender> ListHourlySenders(Transaction& tx, int64_t start, int64_t end) override {
    return inner_->ListHourlySenders(tx, start, end);
  }

  Result PurgeBefore(Transaction& tx, int64_t cutoff, uint64_t& deleted) override {
    return inner_->PurgeBefore(tx, cutoff, deleted);
  }
  Result CountBefore(Transaction& tx, int64_t cutoff, uint64_t& rows) override {
    return inner_->CountBefore(tx, cutoff, rows);
  }
  Result Compact() override {
    return inner_->Compact();
  }

 private:
  std::shared_ptr<Repository> inner_;
};

} // namespace meshgraph::testing
