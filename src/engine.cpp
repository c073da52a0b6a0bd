#include <chronograph/engine.hpp>
#include <chronograph/errors.hpp>
#include <cmath>
#include <utility>

namespace chronograph {

// Hand periods in the unit each hand is driven by.
static constexpr double kSecondsPeriod = 60.0;    // seconds
static constexpr double kMinutesPeriod = 60.0;    // minutes
static constexpr double kHoursPeriod   = 720.0;   // minutes (12h dial)

// Floor-modulo for reals: result in [0, m).
static double wrap(double x, double m) {
  double r = std::fmod(x, m);
  if (r < 0.0) r += m;
  if (r >= m) r -= m;
  return r;
}

static HandRing make_hand(const HandGeometry& g) {
  return HandRing(g.positions, g.degrees_per_step);
}

const char* mode_name(Mode m) {
  switch (m) {
    case Mode::Clock:     return "Clock";
    case Mode::Stopwatch: return "Stopwatch";
    default: return "Unknown";
  }
}

ChronographEngine::ChronographEngine(std::shared_ptr<TimeSource> source,
                                     const DialLayout& layout)
  : source_(source ? std::move(source) : std::make_shared<SystemTimeSource>()),
    seconds_(make_hand(layout.seconds)),
    minutes_(make_hand(layout.minutes)),
    hours_(make_hand(layout.hours)) {}

void ChronographEngine::set_time_source(std::shared_ptr<TimeSource> source) {
  if (!source) throw InvalidArgument("time source must not be null");
  source_ = std::move(source);
}

const HandRing& ChronographEngine::hand(Hand h) const {
  switch (h) {
    case Hand::Seconds: return seconds_;
    case Hand::Minutes: return minutes_;
    case Hand::Hours:   return hours_;
    default: throw InvalidArgument("unknown hand");
  }
}

void ChronographEngine::set_mode(Mode m) {
  if (m != Mode::Clock && m != Mode::Stopwatch) {
    throw InvalidArgument("unknown chronograph mode");
  }
  if (m == mode_) return;
  if (m == Mode::Clock) halt_stopwatch_();
  mode_ = m;
}

void ChronographEngine::halt_stopwatch_() {
  running_ = false;
  started_at_.reset();
}

void ChronographEngine::start_stopwatch() {
  if (mode_ == Mode::Clock) set_mode(Mode::Stopwatch);
  if (running_) return;
  running_ = true;
  started_at_ = source_->now();
}

void ChronographEngine::stop_stopwatch() {
  if (!running_) return;
  accumulated_ += source_->now() - *started_at_;
  halt_stopwatch_();
}

void ChronographEngine::reset_stopwatch() {
  accumulated_ = Duration::zero();
  if (running_) started_at_ = source_->now();
  else          started_at_.reset();
}

Duration ChronographEngine::stopwatch_elapsed() const {
  if (!running_) return accumulated_;
  return accumulated_ + (source_->now() - *started_at_);
}

// value is in the hand's drive unit, in [0, period). A hand with N stops over
// that period sits at floor(value * N / period) plus the leftover fraction.
double ChronographEngine::place_hand_(HandRing& ring, double value, double period) {
  const int n = ring.positions();
  const double scaled = value * (static_cast<double>(n) / period);
  int index = static_cast<int>(std::floor(scaled)) % n;
  if (index < 0) index += n;
  const double fraction = scaled - index;
  ring.move_to_index(index);
  return ring.angle_with_fraction(fraction);
}

Snapshot ChronographEngine::snapshot() {
  double seconds_float = 0.0;
  double minutes_float = 0.0;
  double total_minutes = 0.0;

  if (mode_ == Mode::Stopwatch) {
    const double elapsed = total_seconds(stopwatch_elapsed());
    const double minutes_total = elapsed / 60.0;
    seconds_float = wrap(elapsed, kSecondsPeriod);
    minutes_float = wrap(minutes_total, kMinutesPeriod);
    total_minutes = wrap(minutes_total, kHoursPeriod);
  } else {
    const WallClock now = wall_clock_of(source_->now());
    seconds_float = now.second + now.microsecond / 1'000'000.0;
    minutes_float = now.minute + seconds_float / 60.0;
    total_minutes = (now.hour % 12) * 60 + minutes_float;
  }

  Snapshot s{};
  s.seconds_angle = place_hand_(seconds_, seconds_float, kSecondsPeriod);
  s.minutes_angle = place_hand_(minutes_, minutes_float, kMinutesPeriod);
  s.hours_angle   = place_hand_(hours_, total_minutes, kHoursPeriod);
  return s;
}

} // namespace chronograph
