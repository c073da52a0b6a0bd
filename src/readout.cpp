#include <chronograph/readout.hpp>
#include <chronograph/engine.hpp>
#include <algorithm>
#include <cstdio>

namespace chronograph {

std::string format_clock_readout(Instant t) {
  const WallClock wc = wall_clock_of(t);
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d", wc.hour, wc.minute, wc.second);
  return std::string(buf);
}

std::string format_stopwatch_readout(Duration elapsed) {
  if (elapsed < Duration::zero()) return "--:--:--.--";
  const long long us = elapsed.count();
  const long long total = us / 1'000'000;
  const long long hours = total / 3600;
  const int minutes = static_cast<int>((total % 3600) / 60);
  const int secs    = static_cast<int>(total % 60);
  const int centis  = std::min(static_cast<int>((us % 1'000'000) / 10'000), 99);
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%02lld:%02d:%02d.%02d", hours, minutes, secs, centis);
  return std::string(buf);
}

std::string readout(const ChronographEngine& engine) {
  if (engine.mode() == Mode::Clock) return format_clock_readout(engine.current_time());
  return format_stopwatch_readout(engine.stopwatch_elapsed());
}

ControlState control_state(const ChronographEngine& engine) {
  ControlState st{};
  if (engine.mode() == Mode::Clock) return st;

  const bool running = engine.is_stopwatch_running();
  const bool has_time = engine.stopwatch_elapsed() > Duration::zero();
  st.start_enabled = !running;
  st.stop_enabled  = running;
  st.reset_enabled = has_time;
  st.start_label   = has_time ? "Resume" : "Start";
  return st;
}

} // namespace chronograph
