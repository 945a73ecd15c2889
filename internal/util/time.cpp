#include "time.hpp"

#include <google/protobuf/util/time_util.h>

#include <cctype>
#include <ctime>

namespace seat::util {

namespace {

std::string Strftime(TimePoint tp, const char* format) {
  const std::time_t secs = Clock::to_time_t(std::chrono::floor<std::chrono::seconds>(tp));
  std::tm           parts{};
  gmtime_r(&secs, &parts);

  char buffer[64];
  const auto written = std::strftime(buffer, sizeof(buffer), format, &parts);
  return std::string(buffer, written);
}

bool IsDigits(std::string_view value) {
  if (value.empty()) return false;
  for (char c : value) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

TimePoint SystemTimeSource::Now() const {
  return Clock::now();
}

TimePoint ManualTimeSource::Now() const {
  std::lock_guard lock(mutex_);
  return now_;
}

void ManualTimeSource::Set(TimePoint now) {
  std::lock_guard lock(mutex_);
  now_ = now;
}

void ManualTimeSource::Advance(Clock::duration delta) {
  std::lock_guard lock(mutex_);
  now_ += delta;
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::floor<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

std::int64_t ToUnixNanos(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixNanos(std::int64_t nanos) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds(nanos));
}

TimePoint MakeUtc(int year, int month, int day, int hour, int minute, int second) {
  std::tm parts{};
  parts.tm_year = year - 1900;
  parts.tm_mon  = month - 1;
  parts.tm_mday = day;
  parts.tm_hour = hour;
  parts.tm_min  = minute;
  parts.tm_sec  = second;
  return Clock::from_time_t(timegm(&parts));
}

std::string FormatRfc3339(TimePoint tp) {
  return google::protobuf::util::TimeUtil::ToString(ToProto(tp));
}

std::string FormatCompact(TimePoint tp) {
  return Strftime(tp, "%Y%m%d %H:%M:%S");
}

std::string FormatDate(TimePoint tp) {
  return Strftime(tp, "%Y-%m-%d");
}

std::string FormatIdStamp(TimePoint tp) {
  return Strftime(tp, "%Y%m%d-%H%M");
}

std::optional<TimePoint> ParseMinuteDateTime(std::string_view raw) {
  while (!raw.empty() && std::isspace(static_cast<unsigned char>(raw.front()))) raw.remove_prefix(1);
  while (!raw.empty() && std::isspace(static_cast<unsigned char>(raw.back()))) raw.remove_suffix(1);

  // YYYY-MM-DDTHH:MM
  if (raw.size() != 16) return std::nullopt;
  if (raw[4] != '-' || raw[7] != '-' || raw[13] != ':') return std::nullopt;
  if (raw[10] != 'T' && raw[10] != ' ') return std::nullopt;
  if (!IsDigits(raw.substr(0, 4)) || !IsDigits(raw.substr(5, 2)) || !IsDigits(raw.substr(8, 2)) || !IsDigits(raw.substr(11, 2)) ||
      !IsDigits(raw.substr(14, 2))) {
    return std::nullopt;
  }

  std::string rfc3339(raw);
  rfc3339[10] = 'T';
  rfc3339 += ":00Z";

  google::protobuf::Timestamp ts;
  if (!google::protobuf::util::TimeUtil::FromString(rfc3339, &ts)) {
    return std::nullopt;
  }
  return FromProto(ts);
}

} // namespace seat::util
