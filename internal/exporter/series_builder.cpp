#include "series_builder.hpp"

#include <cmath>
#include <set>
#include <stdexcept>

namespace meshgraph::exporter {

namespace {

constexpr int64_t kHour = 3600;

double Round2(double v) {
  return std::round(v * 100.0) / 100.0;
}

// Bucket index of ts, or -1 when outside [first, first + n hours).
int64_t BucketIndex(int64_t ts, int64_t first, std::size_t n) {
  if (ts < first) return -1;
  const int64_t idx = (ts - first) / kHour;
  return idx < static_cast<int64_t>(n) ? idx : -1;
}

} // namespace

std::vector<util::TimePoint> SeriesBuilder::Buckets(util::TimePoint now, uint32_t days) {
  if (days == 0) {
    throw std::invalid_argument("series horizon must be at least one day");
  }

  const std::size_t n       = static_cast<std::size_t>(days) * 24;
  const int64_t     current = util::ToUnixSeconds(util::FloorToHour(now));

  std::vector<util::TimePoint> buckets;
  buckets.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    buckets.push_back(util::FromUnixSeconds(current - static_cast<int64_t>(n - 1 - i) * kHour));
  }
  return buckets;
}

std::pair<int64_t, int64_t> SeriesBuilder::Range(util::TimePoint now, uint32_t days) {
  const auto buckets = Buckets(now, days);
  return {util::ToUnixSeconds(buckets.front()), util::ToUnixSeconds(buckets.back()) + kHour - 1};
}

HourlySeries SeriesBuilder::BuildHourly(const std::vector<model::HourlyTypeCount>& rows, util::TimePoint now, uint32_t days) const {
  HourlySeries series;
  series.buckets = Buckets(now, days);

  const int64_t     first = util::ToUnixSeconds(series.buckets.front());
  const std::size_t n     = series.buckets.size();

  for (const auto& c : rows) {
    const int64_t idx = BucketIndex(c.hour, first, n);
    if (idx < 0 || c.count == 0) continue;

    const std::string& type = c.type.empty() ? std::string("unknown") : c.type;
    auto&              row  = series.counts[type];
    if (row.empty()) row.assign(n, 0);
    row[static_cast<std::size_t>(idx)] += c.count;
    series.total_by_type[type] += c.count;
    series.total += c.count;
  }

  for (const auto& [type, total] : series.total_by_type) {
    series.types.push_back(type);
    series.percentage_by_type[type] =
        series.total == 0 ? 0.0 : Round2(100.0 * static_cast<double>(total) / static_cast<double>(series.total));
  }
  return series;
}

SenderSeries SeriesBuilder::BuildSenders(const std::vector<model::HourlySender>& rows, util::TimePoint now, uint32_t days) const {
  SenderSeries series;
  series.buckets = Buckets(now, days);

  const int64_t     first = util::ToUnixSeconds(series.buckets.front());
  const std::size_t n     = series.buckets.size();

  std::vector<std::set<util::NodeNum>> senders(n);
  std::vector<std::set<util::NodeNum>> physical(n);
  std::set<util::NodeNum>              all_senders;
  std::set<util::NodeNum>              all_physical;

  for (const auto& s : rows) {
    const int64_t idx = BucketIndex(s.hour, first, n);
    if (idx < 0 || s.node == 0) continue;

    if (s.physical) {
      physical[static_cast<std::size_t>(idx)].insert(s.node);
      all_physical.insert(s.node);
    } else {
      senders[static_cast<std::size_t>(idx)].insert(s.node);
      all_senders.insert(s.node);
    }
  }

  uint64_t sum = 0;
  uint64_t sum_physical = 0;
  for (std::size_t i = 0; i < n; ++i) {
    series.unique_senders.push_back(senders[i].size());
    series.unique_physical_senders.push_back(physical[i].size());
    sum += senders[i].size();
    sum_physical += physical[i].size();
  }

  series.total_unique_senders            = all_senders.size();
  series.total_unique_physical_senders   = all_physical.size();
  series.average_unique_senders          = Round2(static_cast<double>(sum) / static_cast<double>(n));
  series.average_unique_physical_senders = Round2(static_cast<double>(sum_physical) / static_cast<double>(n));
  return series;
}

} // namespace meshgraph::exporter
