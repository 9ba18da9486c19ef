#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace meshgraph::util {

namespace {

std::tm ToUtc(TimePoint tp) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           out{};
  gmtime_r(&t, &out);
  return out;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

int64_t ToUnixSeconds(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixSeconds(int64_t seconds) {
  return TimePoint{} + std::chrono::seconds(seconds);
}

TimePoint FloorToHour(TimePoint tp) {
  const int64_t seconds = ToUnixSeconds(tp);
  int64_t       floored = seconds - (seconds % 3600);
  if (seconds < 0 && seconds % 3600 != 0) floored -= 3600;
  return FromUnixSeconds(floored);
}

std::string FormatIso8601(TimePoint tp) {
  const std::tm      utc = ToUtc(tp);
  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

std::string FormatCtime(TimePoint tp) {
  const std::tm      utc = ToUtc(tp);
  std::ostringstream out;
  out << std::put_time(&utc, "%a %b %e %H:%M:%S UTC %Y");
  return out.str();
}

std::chrono::milliseconds ParseDuration(const std::string& text) {
  std::size_t pos = 0;
  while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') ++pos;
  if (pos == 0) {
    throw std::invalid_argument("invalid duration '" + text + "'");
  }

  const int64_t     value = std::stoll(text.substr(0, pos));
  const std::string unit  = text.substr(pos);

  if (unit == "ms") return std::chrono::milliseconds(value);
  if (unit == "s") return std::chrono::seconds(value);
  if (unit == "m" || unit == "min") return std::chrono::minutes(value);
  if (unit == "h") return std::chrono::hours(value);
  if (unit == "d") return std::chrono::hours(24 * value);

  throw std::invalid_argument("invalid duration unit in '" + text + "'");
}

std::string DurationLabel(std::chrono::milliseconds duration) {
  using std::chrono::duration_cast;

  const auto minutes = duration_cast<std::chrono::minutes>(duration).count();
  if (minutes > 0 && minutes % (24 * 60) == 0 && minutes > 24 * 60) {
    return std::to_string(minutes / (24 * 60)) + "d";
  }
  if (minutes > 0 && minutes % 60 == 0) {
    return std::to_string(minutes / 60) + "h";
  }
  if (minutes > 0 && duration == std::chrono::minutes(minutes)) {
    return std::to_string(minutes) + "min";
  }
  return std::to_string(duration_cast<std::chrono::seconds>(duration).count()) + "s";
}

} // namespace meshgraph::util
