#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/role.hpp"
#include "internal/util/node_id.hpp"

namespace meshgraph::model {

/*
  Node directory row. Nodes are upserted, never deleted.
*/
struct Node {
  util::NodeNum id = 0;

  std::optional<std::string>   long_name;
  std::optional<std::string>   short_name;
  std::optional<std::uint32_t> hardware;

  NodeRole role = NodeRole::kUnknown;

  std::optional<int64_t> last_seen; // unix seconds
  std::optional<double>  latitude;
  std::optional<double>  longitude;
};

} // namespace meshgraph::model
