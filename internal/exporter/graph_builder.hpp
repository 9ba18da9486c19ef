#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/store/event_store.hpp"
#include "internal/util/node_id.hpp"

namespace meshgraph::exporter {

enum class ViewKind {
  kMessages,
  kPhysicalSenders,
  kNeighbors,
  kTraceroutes,
};

// messages, physical, neighbors, traceroutes
std::string_view ToString(ViewKind view);

// Accepts the ToString names plus "physicalSenders".
std::optional<ViewKind> ParseViewKind(std::string_view name);

std::vector<ViewKind> AllViews();

enum class RssiPolicy {
  kLatest,
  kMean,
};

// Throws std::invalid_argument for anything but "latest"/"mean".
RssiPolicy ParseRssiPolicy(std::string_view name);

struct GraphNode {
  util::NodeNum id = 0;
  std::string   label;
  std::string   role;
  uint32_t      connections = 0;
};

struct GraphEdge {
  util::NodeNum         source = 0;
  util::NodeNum         target = 0;
  uint64_t              count  = 0;
  std::optional<double> rssi;
  std::optional<double> snr; // neighbor view only
};

/*
  Nodes sorted by id, edges by (source, target).
*/
struct Graph {
  ViewKind               view = ViewKind::kMessages;
  std::vector<GraphNode> nodes;
  std::vector<GraphEdge> edges;
};

/*
  Builds one graph view from a range snapshot.

  Nodes are every valid participant of the window's events, including ones
  without a valid edge. Edges are directed (source, target) pairs of valid,
  distinct ids. connections counts the distinct edges touching a node in
  either direction.
*/
class GraphBuilder {
 public:
  explicit GraphBuilder(RssiPolicy policy = RssiPolicy::kLatest);

  Graph Build(ViewKind view, const store::RangeSnapshot& snapshot) const;

  // Entity kinds Build() reads for a view (always includes the node directory).
  static std::vector<store::EntityKind> RequiredKinds(ViewKind view);

 private:
  RssiPolicy policy_;
};

} // namespace meshgraph::exporter
