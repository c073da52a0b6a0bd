#pragma once
#include <memory>
#include <optional>
#include <chronograph/dial.hpp>
#include <chronograph/ring.hpp>
#include <chronograph/snapshot.hpp>
#include <chronograph/time_source.hpp>

namespace chronograph {

enum class Mode : int {
  Clock = 0,
  Stopwatch = 1
};

const char* mode_name(Mode m);

// Turns time-source readings (or stopwatch elapsed time) into hand angles.
// Single-threaded: the owner drives snapshot() and the controls from one
// scheduling context.
class ChronographEngine {
public:
  // A null source selects SystemTimeSource.
  explicit ChronographEngine(std::shared_ptr<TimeSource> source = nullptr,
                             const DialLayout& layout = DialLayout{});
  ChronographEngine(const ChronographEngine&) = delete;
  ChronographEngine& operator=(const ChronographEngine&) = delete;

  // Throws InvalidArgument on null.
  void set_time_source(std::shared_ptr<TimeSource> source);

  // One time-source read; all three hands see the same instant.
  Snapshot snapshot();

  Mode mode() const { return mode_; }
  // Throws InvalidArgument for a value outside Mode.
  void set_mode(Mode m);

  // Control surface
  void start_stopwatch();
  void stop_stopwatch();
  void reset_stopwatch();
  bool is_stopwatch_running() const { return running_; }
  Duration stopwatch_elapsed() const;

  Instant current_time() const { return source_->now(); }

  const HandRing& hand(Hand h) const;

private:
  double place_hand_(HandRing& ring, double value, double period);
  void halt_stopwatch_();

  std::shared_ptr<TimeSource> source_;
  HandRing seconds_;
  HandRing minutes_;
  HandRing hours_;

  Mode mode_{Mode::Clock};
  bool running_{false};
  Duration accumulated_{0};
  std::optional<Instant> started_at_;   // set iff running_
};

} // namespace chronograph
