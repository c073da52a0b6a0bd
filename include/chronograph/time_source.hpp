#pragma once
#include <chrono>
#include <cstddef>
#include <vector>

namespace chronograph {

// Zone-less local wall-clock time, microsecond resolution.
using Duration = std::chrono::microseconds;
using Instant  = std::chrono::local_time<Duration>;

// Broken-down time of day of an Instant.
struct WallClock {
  int hour = 0;          // 0..23
  int minute = 0;        // 0..59
  int second = 0;        // 0..59
  int microsecond = 0;   // 0..999999
};

WallClock wall_clock_of(Instant t);

// Throws InvalidArgument on an invalid date or out-of-range time field.
Instant make_instant(int year, unsigned month, unsigned day,
                     int hour = 0, int minute = 0, int second = 0,
                     int microsecond = 0);

double total_seconds(Duration d);

// Supplies "now" to the engine.
class TimeSource {
public:
  virtual ~TimeSource() = default;
  virtual Instant now() const = 0;
};

// Local wall clock of this machine.
class SystemTimeSource final : public TimeSource {
public:
  Instant now() const override;
};

// Stands still until moved by hand.
class ManualTimeSource final : public TimeSource {
public:
  explicit ManualTimeSource(Instant start) : now_(start) {}

  Instant now() const override { return now_; }
  void set(Instant t) { now_ = t; }
  void advance(Duration d) { now_ += d; }

private:
  Instant now_;
};

// Replays a fixed list of readings, one per now() call; the last one repeats
// once the list is used up. Throws InvalidArgument on an empty list.
class ScriptedTimeSource final : public TimeSource {
public:
  explicit ScriptedTimeSource(std::vector<Instant> readings);

  Instant now() const override;
  std::size_t reads() const { return reads_; }

private:
  std::vector<Instant> readings_;
  mutable std::size_t reads_{0};
};

} // namespace chronograph
