#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace meshgraph::model {

enum class NodeRole : std::uint8_t {
  kUnknown      = 0,
  kClient       = 1,
  kRouter       = 2,
  kRouterClient = 3,
  kRepeater     = 4,
};

// Maps the device role number carried in NODEINFO (Config.DeviceConfig.Role).
// Client variants collapse onto kClient and ROUTER_LATE onto kRouter; every
// other role is kUnknown.
constexpr NodeRole FromDeviceRole(std::uint32_t role) {
  switch (role) {
    case 0:  // CLIENT
    case 1:  // CLIENT_MUTE
    case 8:  // CLIENT_HIDDEN
      return NodeRole::kClient;
    case 2:  // ROUTER
    case 11: // ROUTER_LATE
      return NodeRole::kRouter;
    case 3:
      return NodeRole::kRouterClient;
    case 4:
      return NodeRole::kRepeater;
    default:
      return NodeRole::kUnknown;
  }
}

std::string_view ToString(NodeRole role);

// Accepts the names ToString produces and the upstream enum names
// (CLIENT, ROUTER, ROUTER_CLIENT, REPEATER); anything else is kUnknown.
NodeRole RoleFromString(std::string_view name);

} // namespace meshgraph::model
