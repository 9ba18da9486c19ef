#include "relay_resolver.hpp"

namespace meshgraph::ingest {

void RelayResolver::Observe(util::NodeNum id) {
  if (!util::IsGraphNode(id)) return;

  std::lock_guard lock(mutex_);
  if (known_.insert(id).second) {
    by_low_byte_[static_cast<uint8_t>(id & 0xff)].insert(id);
  }
}

util::NodeNum RelayResolver::PhysicalSender(util::NodeNum from, uint32_t relay_byte, std::optional<int32_t> hop_count) const {
  // zero hops: heard directly
  if (relay_byte == 0 || (hop_count && *hop_count == 0)) return from;

  std::lock_guard lock(mutex_);
  auto it = by_low_byte_.find(static_cast<uint8_t>(relay_byte & 0xff));
  if (it == by_low_byte_.end() || it->second.size() != 1) return from;
  return *it->second.begin();
}

} // namespace meshgraph::ingest
