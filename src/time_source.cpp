#include <chronograph/time_source.hpp>
#include <chronograph/errors.hpp>
#include <ctime>
#include <utility>

namespace chronograph {

using namespace std::chrono;

WallClock wall_clock_of(Instant t) {
  const auto midnight = std::chrono::floor<days>(t);
  const hh_mm_ss<Duration> hms{t - midnight};
  return WallClock{
    static_cast<int>(hms.hours().count()),
    static_cast<int>(hms.minutes().count()),
    static_cast<int>(hms.seconds().count()),
    static_cast<int>(hms.subseconds().count())
  };
}

Instant make_instant(int y, unsigned mo, unsigned d,
                     int hour, int minute, int second, int microsecond) {
  const year_month_day date{year{y}, month{mo}, day{d}};
  if (!date.ok()) throw InvalidArgument("invalid calendar date");
  if (hour < 0 || hour > 23) throw InvalidArgument("hour must be in 0..23");
  if (minute < 0 || minute > 59) throw InvalidArgument("minute must be in 0..59");
  if (second < 0 || second > 59) throw InvalidArgument("second must be in 0..59");
  if (microsecond < 0 || microsecond > 999999) throw InvalidArgument("microsecond must be in 0..999999");
  return local_days{date} + hours{hour} + minutes{minute} + seconds{second}
       + microseconds{microsecond};
}

double total_seconds(Duration d) {
  return duration<double>(d).count();
}

Instant SystemTimeSource::now() const {
  const auto stamp = time_point_cast<Duration>(system_clock::now());
  const auto whole = std::chrono::floor<seconds>(stamp);
  const std::time_t t = system_clock::to_time_t(whole);
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  const year_month_day date{year{tm.tm_year + 1900},
                            month{static_cast<unsigned>(tm.tm_mon + 1)},
                            day{static_cast<unsigned>(tm.tm_mday)}};
  return local_days{date} + hours{tm.tm_hour} + minutes{tm.tm_min}
       + seconds{tm.tm_sec} + (stamp - whole);
}

ScriptedTimeSource::ScriptedTimeSource(std::vector<Instant> readings)
  : readings_(std::move(readings)) {
  if (readings_.empty()) throw InvalidArgument("scripted time source needs at least one reading");
}

Instant ScriptedTimeSource::now() const {
  const std::size_t i = reads_ < readings_.size() ? reads_ : readings_.size() - 1;
  ++reads_;
  return readings_[i];
}

} // namespace chronograph
