#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/model/role.hpp"
#include "internal/util/node_id.hpp"
#include "internal/util/time.hpp"

namespace {

using meshgraph::util::FromUnixSeconds;

void TestNodeIdFormatting() {
  assert(meshgraph::util::FormatNodeId(0x0a1b2c3d) == "!0a1b2c3d");
  assert(meshgraph::util::FormatNodeId(2) == "!00000002");

  assert(meshgraph::util::ParseNodeId("!0a1b2c3d") == 0x0a1b2c3du);
  assert(meshgraph::util::ParseNodeId("168701037") == 168701037u);
  assert(!meshgraph::util::ParseNodeId("!zz").has_value());
  assert(!meshgraph::util::ParseNodeId("").has_value());
  assert(!meshgraph::util::ParseNodeId("99999999999").has_value());
}

void TestGraphNodeRange() {
  assert(!meshgraph::util::IsGraphNode(0));
  assert(!meshgraph::util::IsGraphNode(1));
  assert(meshgraph::util::IsGraphNode(2));
  assert(meshgraph::util::IsGraphNode(0xFFFFFFFEu));
  assert(!meshgraph::util::IsGraphNode(meshgraph::util::kBroadcastNode));
}

void TestHourFlooringAndFormatting() {
  // 2024-03-09T16:07:12Z
  const auto tp = FromUnixSeconds(1710000432);
  assert(meshgraph::util::ToUnixSeconds(meshgraph::util::FloorToHour(tp)) == 1710000000);
  assert(meshgraph::util::FormatIso8601(meshgraph::util::FloorToHour(tp)) == "2024-03-09T16:00:00Z");
  assert(meshgraph::util::FormatCtime(tp) == "Sat Mar  9 16:07:12 UTC 2024");
}

void TestDurations() {
  using namespace std::chrono;
  assert(meshgraph::util::ParseDuration("500ms") == milliseconds(500));
  assert(meshgraph::util::ParseDuration("5s") == seconds(5));
  assert(meshgraph::util::ParseDuration("15min") == minutes(15));
  assert(meshgraph::util::ParseDuration("2m") == minutes(2));
  assert(meshgraph::util::ParseDuration("3h") == hours(3));
  assert(meshgraph::util::ParseDuration("1d") == hours(24));

  bool threw = false;
  try {
    (void)meshgraph::util::ParseDuration("fast");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)meshgraph::util::ParseDuration("10y");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  assert(meshgraph::util::DurationLabel(minutes(15)) == "15min");
  assert(meshgraph::util::DurationLabel(minutes(30)) == "30min");
  assert(meshgraph::util::DurationLabel(hours(1)) == "1h");
  assert(meshgraph::util::DurationLabel(hours(24)) == "24h");
  assert(meshgraph::util::DurationLabel(hours(48)) == "2d");
}

void TestRoleMapping() {
  using meshgraph::model::NodeRole;
  assert(meshgraph::model::FromDeviceRole(0) == NodeRole::kClient);
  assert(meshgraph::model::FromDeviceRole(2) == NodeRole::kRouter);
  assert(meshgraph::model::FromDeviceRole(3) == NodeRole::kRouterClient);
  assert(meshgraph::model::FromDeviceRole(4) == NodeRole::kRepeater);
  assert(meshgraph::model::FromDeviceRole(5) == NodeRole::kUnknown);

  assert(meshgraph::model::RoleFromString(meshgraph::model::ToString(NodeRole::kRouterClient)) == NodeRole::kRouterClient);
  assert(meshgraph::model::RoleFromString("ROUTER") == NodeRole::kRouter);
  assert(meshgraph::model::RoleFromString("TRACKER") == NodeRole::kUnknown);
}

} // namespace

int main() {
  TestNodeIdFormatting();
  TestGraphNodeRange();
  TestHourFlooringAndFormatting();
  TestDurations();
  TestRoleMapping();

  std::cout << "meshgraph_unit_util: pass\n";
  return 0;
}
