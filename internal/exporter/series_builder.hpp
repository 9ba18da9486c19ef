#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "internal/model/rollup.hpp"
#include "internal/util/time.hpp"

namespace meshgraph::exporter {

struct HourlySeries {
  std::vector<util::TimePoint>                 buckets; // bucket start, oldest first
  std::vector<std::string>                     types;   // sorted
  std::map<std::string, std::vector<uint64_t>> counts;  // per type, one entry per bucket
  uint64_t                                     total = 0;
  std::map<std::string, uint64_t>              total_by_type;
  std::map<std::string, double>                percentage_by_type; // of total, 2 decimals
};

struct SenderSeries {
  std::vector<util::TimePoint> buckets;
  std::vector<uint64_t>        unique_senders;
  std::vector<uint64_t>        unique_physical_senders;
  uint64_t                     total_unique_senders          = 0;
  uint64_t                     total_unique_physical_senders = 0;
  double                       average_unique_senders          = 0; // per bucket, 2 decimals
  double                       average_unique_physical_senders = 0;
};

/*
  Hourly series over a horizon of days.

  Buckets are UTC hours; the last one is the hour containing now, so a
  horizon has exactly days * 24 buckets. Empty buckets are zero, never
  omitted. Input is the hourly rollup; rows outside the horizon are ignored.
*/
class SeriesBuilder {
 public:
  static std::vector<util::TimePoint> Buckets(util::TimePoint now, uint32_t days);

  // Inclusive unix-second range covered by Buckets(now, days).
  static std::pair<int64_t, int64_t> Range(util::TimePoint now, uint32_t days);

  HourlySeries BuildHourly(const std::vector<model::HourlyTypeCount>& rows, util::TimePoint now, uint32_t days) const;

  SenderSeries BuildSenders(const std::vector<model::HourlySender>& rows, util::TimePoint now, uint32_t days) const;
};

} // namespace meshgraph::exporter
