#include "graph_builder.hpp"

#include <map>
#include <set>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace meshgraph::exporter {

std::string_view ToString(ViewKind view) {
  switch (view) {
    case ViewKind::kMessages:
      return "messages";
    case ViewKind::kPhysicalSenders:
      return "physical";
    case ViewKind::kNeighbors:
      return "neighbors";
    case ViewKind::kTraceroutes:
      return "traceroutes";
  }
  return "unknown";
}

std::optional<ViewKind> ParseViewKind(std::string_view name) {
  if (name == "messages") return ViewKind::kMessages;
  if (name == "physical" || name == "physicalSenders") return ViewKind::kPhysicalSenders;
  if (name == "neighbors") return ViewKind::kNeighbors;
  if (name == "traceroutes") return ViewKind::kTraceroutes;
  return std::nullopt;
}

std::vector<ViewKind> AllViews() {
  return {ViewKind::kMessages, ViewKind::kPhysicalSenders, ViewKind::kNeighbors, ViewKind::kTraceroutes};
}

RssiPolicy ParseRssiPolicy(std::string_view name) {
  if (name == "latest") return RssiPolicy::kLatest;
  if (name == "mean") return RssiPolicy::kMean;
  throw std::invalid_argument("unknown rssi policy '" + std::string(name) + "'");
}

namespace {

struct EdgeAccumulator {
  uint64_t              count = 0;
  double                rssi_sum = 0;
  uint64_t              rssi_n = 0;
  std::optional<double> rssi_latest;
  std::optional<double> snr_latest;
};

class Accumulator {
 public:
  explicit Accumulator(RssiPolicy policy) : policy_(policy) {
  }

  // Observations arrive in (timestamp, insertion) order, so the last value
  // seen for a pair is the latest.
  void Observe(util::NodeNum source, util::NodeNum target, std::optional<double> rssi, std::optional<double> snr) {
    if (util::IsGraphNode(source)) participants_.insert(source);
    if (util::IsGraphNode(target)) participants_.insert(target);
    if (!util::IsGraphNode(source) || !util::IsGraphNode(target) || source == target) return;

    auto& edge = edges_[{source, target}];
    edge.count++;
    if (rssi) {
      edge.rssi_sum += *rssi;
      edge.rssi_n++;
      edge.rssi_latest = rssi;
    }
    if (snr) edge.snr_latest = snr;
  }

  Graph Finish(ViewKind view, const std::vector<model::Node>& directory) const {
    std::unordered_map<util::NodeNum, const model::Node*> by_id;
    for (const auto& node : directory) by_id[node.id] = &node;

    std::map<util::NodeNum, uint32_t> connections;
    for (auto id : participants_) connections[id] = 0;

    Graph graph;
    graph.view = view;
    for (const auto& [key, acc] : edges_) {
      connections[key.first]++;
      connections[key.second]++;

      GraphEdge edge;
      edge.source = key.first;
      edge.target = key.second;
      edge.count  = acc.count;
      if (acc.rssi_n > 0) {
        edge.rssi = policy_ == RssiPolicy::kMean ? acc.rssi_sum / static_cast<double>(acc.rssi_n) : *acc.rssi_latest;
      }
      if (view == ViewKind::kNeighbors) edge.snr = acc.snr_latest;
      graph.edges.push_back(std::move(edge));
    }

    for (const auto& [id, count] : connections) {
      GraphNode node;
      node.id          = id;
      node.connections = count;
      node.label       = util::FormatNodeId(id);
      node.role        = std::string(model::ToString(model::NodeRole::kUnknown));

      auto it = by_id.find(id);
      if (it != by_id.end()) {
        if (it->second->short_name && !it->second->short_name->empty()) node.label = *it->second->short_name;
        node.role = std::string(model::ToString(it->second->role));
      }
      graph.nodes.push_back(std::move(node));
    }
    return graph;
  }

 private:
  RssiPolicy                                                     policy_;
  std::set<util::NodeNum>                                        participants_;
  std::map<std::pair<util::NodeNum, util::NodeNum>, EdgeAccumulator> edges_;
};

} // namespace

GraphBuilder::GraphBuilder(RssiPolicy policy) : policy_(policy) {
}

std::vector<store::EntityKind> GraphBuilder::RequiredKinds(ViewKind view) {
  switch (view) {
    case ViewKind::kMessages:
    case ViewKind::kPhysicalSenders:
      return {store::EntityKind::kMessages, store::EntityKind::kNodes};
    case ViewKind::kNeighbors:
      return {store::EntityKind::kNeighbors, store::EntityKind::kNodes};
    case ViewKind::kTraceroutes:
      return {store::EntityKind::kTraceroutes, store::EntityKind::kNodes};
  }
  return {store::EntityKind::kNodes};
}

Graph GraphBuilder::Build(ViewKind view, const store::RangeSnapshot& snapshot) const {
  Accumulator acc(policy_);

  switch (view) {
    case ViewKind::kMessages:
      for (const auto& m : snapshot.messages) acc.Observe(m.from, m.to, m.rssi, std::nullopt);
      break;

    case ViewKind::kPhysicalSenders:
      for (const auto& m : snapshot.messages) acc.Observe(m.physical_sender, m.to, m.rssi, std::nullopt);
      break;

    case ViewKind::kNeighbors:
      for (const auto& r : snapshot.neighbors) acc.Observe(r.reporter, r.neighbor, std::nullopt, r.snr);
      break;

    case ViewKind::kTraceroutes:
      for (const auto& t : snapshot.traceroutes) {
        if (t.hops.size() == 1) acc.Observe(t.hops[0], t.hops[0], std::nullopt, std::nullopt);
        for (std::size_t i = 1; i < t.hops.size(); ++i) {
          acc.Observe(t.hops[i - 1], t.hops[i], std::nullopt, std::nullopt);
        }
      }
      break;
  }

  return acc.Finish(view, snapshot.nodes);
}

} // namespace meshgraph::exporter
