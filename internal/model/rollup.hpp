#pragma once

#include <cstdint>
#include <string>

#include "internal/util/node_id.hpp"

namespace meshgraph::model {

/*
  Hourly aggregates of the messages table.

  hour is the unix second of a UTC hour boundary. Rollup rows outlive the raw
  messages they were computed from, so series horizons longer than the
  retention period keep their history.
*/
struct HourlyTypeCount {
  int64_t     hour = 0;
  std::string type;
  uint64_t    count = 0;
};

// One distinct sender seen during an hour.
struct HourlySender {
  int64_t       hour     = 0;
  util::NodeNum node     = 0;
  bool          physical = false; // physical_sender rather than logical from
};

} // namespace meshgraph::model
