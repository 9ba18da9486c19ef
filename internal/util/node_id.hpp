#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace meshgraph::util {

using NodeNum = uint32_t;

inline constexpr NodeNum kBroadcastNode = 0xFFFFFFFFu;

// Node numbers 0 and 1 are reserved and the broadcast address is not a device.
constexpr bool IsGraphNode(NodeNum id) {
  return id >= 2 && id < kBroadcastNode;
}

// "!0a1b2c3d"
std::string FormatNodeId(NodeNum id);

// Accepts "!0a1b2c3d" (hex) or a decimal node number.
std::optional<NodeNum> ParseNodeId(const std::string& text);

} // namespace meshgraph::util
