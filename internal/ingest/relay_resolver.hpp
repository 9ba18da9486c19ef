#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <unordered_set>

#include "internal/util/node_id.hpp"

namespace meshgraph::ingest {

/*
  Resolves the link-layer sender of relayed packets.

  Packet headers only carry the low byte of the last relaying node. The
  resolver remembers every node number it has seen and maps that byte back to
  a node only when exactly one known node ends in it. Thread-safe.
*/
class RelayResolver {
 public:
  void Observe(util::NodeNum id);

  // from when the packet was not relayed or the relay is ambiguous/unknown.
  util::NodeNum PhysicalSender(util::NodeNum from, uint32_t relay_byte, std::optional<int32_t> hop_count) const;

 private:
  mutable std::mutex                                      mutex_;
  std::unordered_set<util::NodeNum>                       known_;
  std::unordered_map<uint8_t, std::unordered_set<util::NodeNum>> by_low_byte_;
};

} // namespace meshgraph::ingest
