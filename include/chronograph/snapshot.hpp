#pragma once

namespace chronograph {

// Hand angles at one instant, in degrees clockwise from 12 o'clock.
struct Snapshot {
  double seconds_angle = 0.0;
  double minutes_angle = 0.0;
  double hours_angle = 0.0;
};

} // namespace chronograph
