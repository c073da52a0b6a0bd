#pragma once
#include <string>
#include <chronograph/time_source.hpp>

namespace chronograph {

class ChronographEngine;

// "HH:MM:SS", 24h.
std::string format_clock_readout(Instant t);

// "HH:MM:SS.cc". Hours do not wrap; centiseconds are truncated.
// Negative durations render as "--:--:--.--".
std::string format_stopwatch_readout(Duration elapsed);

// Digital text for the engine's current mode (one time-source read).
std::string readout(const ChronographEngine& engine);

// Which stopwatch controls a front end should offer right now.
struct ControlState {
  bool start_enabled = false;
  bool stop_enabled = false;
  bool reset_enabled = false;
  const char* start_label = "Start";   // "Resume" once time has accumulated
};

ControlState control_state(const ChronographEngine& engine);

} // namespace chronograph
