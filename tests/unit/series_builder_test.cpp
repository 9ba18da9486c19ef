#include "internal/exporter/series_builder.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using meshgraph::exporter::SeriesBuilder;
using meshgraph::model::HourlySender;
using meshgraph::model::HourlyTypeCount;
using meshgraph::util::FromUnixSeconds;
using meshgraph::util::ToUnixSeconds;

// 2024-03-09T16:07:12Z
constexpr int64_t kNow          = 1710000432;
constexpr int64_t kCurrentHour  = 1710000000;
constexpr int64_t kFirstBucket1 = kCurrentHour - 23 * 3600;

HourlyTypeCount Count(int64_t hour, const std::string& type, uint64_t count) {
  HourlyTypeCount c;
  c.hour  = hour;
  c.type  = type;
  c.count = count;
  return c;
}

HourlySender Sender(int64_t hour, uint32_t node, bool physical) {
  HourlySender s;
  s.hour     = hour;
  s.node     = node;
  s.physical = physical;
  return s;
}

void TestBucketsCoverHorizonWithoutGaps() {
  for (uint32_t days : {1u, 7u, 14u, 30u}) {
    auto buckets = SeriesBuilder::Buckets(FromUnixSeconds(kNow), days);
    assert(buckets.size() == days * 24);
    assert(ToUnixSeconds(buckets.back()) == kCurrentHour);
    for (std::size_t i = 1; i < buckets.size(); ++i) {
      assert(ToUnixSeconds(buckets[i]) - ToUnixSeconds(buckets[i - 1]) == 3600);
    }
  }

  auto [start, end] = SeriesBuilder::Range(FromUnixSeconds(kNow), 1);
  assert(start == kFirstBucket1);
  assert(end == kCurrentHour + 3599);

  bool threw = false;
  try {
    (void)SeriesBuilder::Buckets(FromUnixSeconds(kNow), 0);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestHourlyCountsAndPercentages() {
  std::vector<HourlyTypeCount> rows = {
      Count(kCurrentHour, "text", 2),
      Count(kCurrentHour - 3600, "position", 1),
      Count(kFirstBucket1, "telemetry", 1),
      Count(kFirstBucket1 - 3600, "telemetry", 5), // before the horizon
  };

  auto series = SeriesBuilder{}.BuildHourly(rows, FromUnixSeconds(kNow), 1);
  assert(series.buckets.size() == 24);
  assert(series.total == 4);
  assert((series.types == std::vector<std::string>{"position", "telemetry", "text"}));

  const auto& text = series.counts.at("text");
  assert(text.size() == 24);
  assert(text[23] == 2);
  assert(text[22] == 0);
  assert(series.counts.at("position")[22] == 1);
  assert(series.counts.at("telemetry")[0] == 1);

  assert(series.total_by_type.at("text") == 2);
  assert(series.percentage_by_type.at("text") == 50.0);
  assert(series.percentage_by_type.at("position") == 25.0);
}

void TestPercentagesRoundToTwoDecimals() {
  std::vector<HourlyTypeCount> rows = {Count(kCurrentHour, "text", 2), Count(kCurrentHour, "routing", 1)};

  auto series = SeriesBuilder{}.BuildHourly(rows, FromUnixSeconds(kNow), 1);
  assert(series.percentage_by_type.at("text") == 66.67);
  assert(series.percentage_by_type.at("routing") == 33.33);
}

void TestUnnamedTypeCountsAsUnknown() {
  auto series = SeriesBuilder{}.BuildHourly({Count(kCurrentHour, "", 3), Count(kCurrentHour, "text", 0)},
                                            FromUnixSeconds(kNow), 1);
  assert((series.types == std::vector<std::string>{"unknown"}));
  assert(series.counts.at("unknown")[23] == 3);
}

void TestEmptyHorizonIsZeroFilled() {
  auto hourly = SeriesBuilder{}.BuildHourly({}, FromUnixSeconds(kNow), 7);
  assert(hourly.buckets.size() == 168);
  assert(hourly.total == 0);
  assert(hourly.types.empty());

  auto senders = SeriesBuilder{}.BuildSenders({}, FromUnixSeconds(kNow), 7);
  assert(senders.unique_senders.size() == 168);
  for (auto v : senders.unique_senders) assert(v == 0);
  assert(senders.average_unique_senders == 0.0);
}

void TestUniqueSenders() {
  std::vector<HourlySender> rows = {
      Sender(kCurrentHour, 0x11, false), Sender(kCurrentHour, 0x12, false),
      Sender(kCurrentHour, 0x11, true),  Sender(kCurrentHour, 0x21, true),
      Sender(kCurrentHour - 3600, 0x11, false), Sender(kCurrentHour - 3600, 0x11, true),
  };

  auto series = SeriesBuilder{}.BuildSenders(rows, FromUnixSeconds(kNow), 1);
  assert(series.unique_senders[23] == 2);
  assert(series.unique_physical_senders[23] == 2);
  assert(series.unique_senders[22] == 1);
  assert(series.total_unique_senders == 2);
  assert(series.total_unique_physical_senders == 2);
  // (2 + 1) / 24 = 0.125
  assert(series.average_unique_senders == 0.13);
}

} // namespace

int main() {
  TestBucketsCoverHorizonWithoutGaps();
  TestHourlyCountsAndPercentages();
  TestPercentagesRoundToTwoDecimals();
  TestUnnamedTypeCountsAsUnknown();
  TestEmptyHorizonIsZeroFilled();
  TestUniqueSenders();

  std::cout << "meshgraph_unit_series_builder: pass\n";
  return 0;
}
