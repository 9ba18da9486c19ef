#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "internal/model/role.hpp"
#include "internal/util/node_id.hpp"

namespace meshgraph::model {

using util::NodeNum;

/*
  One mesh packet as seen by a gateway.

  id is the mesh packet id and is the natural key: the same packet uplinked by
  several gateways, or re-delivered by the broker, is stored once.
*/
struct Message {
  uint32_t    id = 0;
  int64_t     timestamp = 0; // unix seconds, ingest time
  NodeNum     from = 0;
  NodeNum     to = 0;
  NodeNum     physical_sender = 0;
  std::string type;
  std::string topic;

  std::optional<double>  rssi;
  std::optional<double>  snr;
  std::optional<int32_t> hop_count;

  // Low byte of the relaying node as reported in the packet header (0 when
  // absent). Consumed by the listener to resolve physical_sender; not stored.
  uint32_t relay_node = 0;
};

struct NeighborReport {
  NodeNum               reporter = 0;
  NodeNum               neighbor = 0;
  std::optional<double> snr;
  int64_t               timestamp = 0;
};

/*
  Route a traceroute reply traversed. hops[0] is the origin and consecutive
  entries are directed edges.
*/
struct TracerouteRecord {
  uint32_t             packet_id = 0;
  NodeNum              origin = 0;
  std::vector<NodeNum> hops;
  int64_t              timestamp = 0;
};

/*
  Partial node directory update; absent fields leave the stored value alone.
*/
struct NodeInfoUpdate {
  NodeNum id = 0;

  std::optional<std::string> long_name;
  std::optional<std::string> short_name;
  std::optional<uint32_t>    hardware;
  std::optional<NodeRole>    role;
  std::optional<double>      latitude;
  std::optional<double>      longitude;

  int64_t timestamp = 0;
};

// Envelope that could not be decoded into anything above.
struct Unknown {
  std::string topic;
  std::string reason;
};

using Event = std::variant<Message, NeighborReport, TracerouteRecord, NodeInfoUpdate, Unknown>;

} // namespace meshgraph::model
