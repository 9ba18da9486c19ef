#include "role.hpp"

namespace meshgraph::model {

std::string_view ToString(NodeRole role) {
  switch (role) {
    case NodeRole::kClient:
      return "client";
    case NodeRole::kRouter:
      return "router";
    case NodeRole::kRouterClient:
      return "router-client";
    case NodeRole::kRepeater:
      return "repeater";
    case NodeRole::kUnknown:
      break;
  }
  return "unknown";
}

NodeRole RoleFromString(std::string_view name) {
  if (name == "client" || name == "CLIENT" || name == "CLIENT_MUTE" || name == "CLIENT_HIDDEN") return NodeRole::kClient;
  if (name == "router" || name == "ROUTER" || name == "ROUTER_LATE") return NodeRole::kRouter;
  if (name == "router-client" || name == "ROUTER_CLIENT") return NodeRole::kRouterClient;
  if (name == "repeater" || name == "REPEATER") return NodeRole::kRepeater;
  return NodeRole::kUnknown;
}

} // namespace meshgraph::model
