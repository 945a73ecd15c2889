#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "google/protobuf/timestamp.pb.h"

namespace seat::util {

/*
  Time utilities. Everything is UTC.

  Operations never call Clock::now() directly; they read a TimeSource so expiry
  logic can be driven with synthetic time.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

class TimeSource {
 public:
  virtual ~TimeSource() = default;

  virtual TimePoint Now() const = 0;
};

class SystemTimeSource final : public TimeSource {
 public:
  TimePoint Now() const override;
};

class ManualTimeSource final : public TimeSource {
 public:
  explicit ManualTimeSource(TimePoint start) : now_(start) {
  }

  TimePoint Now() const override;

  void Set(TimePoint now);
  void Advance(Clock::duration delta);

 private:
  mutable std::mutex mutex_;
  TimePoint          now_;
};

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

std::int64_t ToUnixNanos(TimePoint tp);
TimePoint    FromUnixNanos(std::int64_t nanos);

TimePoint MakeUtc(int year, int month, int day, int hour, int minute, int second = 0);

// RFC 3339, e.g. "2025-03-01T08:45:00Z" (fractional digits only when present).
std::string FormatRfc3339(TimePoint tp);

// "YYYYMMDD HH:MM:SS", the form matched by time substring searches.
std::string FormatCompact(TimePoint tp);

// "YYYY-MM-DD".
std::string FormatDate(TimePoint tp);

// "YYYYMMDD-HHMM", used in generated flight identifiers.
std::string FormatIdStamp(TimePoint tp);

// Accepts "YYYY-MM-DDTHH:MM" or "YYYY-MM-DD HH:MM".
std::optional<TimePoint> ParseMinuteDateTime(std::string_view raw);

} // namespace seat::util
