#include <chronograph/ring.hpp>
#include <algorithm>
#include <vector>

namespace chronograph {

static int checked_positions(int positions) {
  if (positions <= 0) throw InvalidArgument("positions must be positive");
  return positions;
}

static std::vector<RingPosition> make_positions(int positions, double degrees_per_step) {
  std::vector<RingPosition> out;
  out.reserve(static_cast<std::size_t>(positions));
  for (int i = 0; i < positions; ++i) {
    out.push_back(RingPosition{i, i * degrees_per_step});
  }
  return out;
}

// Floor-modulo: result always in [0, n).
static int wrap_index(int value, int n) {
  const int r = value % n;
  return r < 0 ? r + n : r;
}

HandRing::HandRing(int positions, double degrees_per_step)
  : positions_(checked_positions(positions)),
    degrees_per_step_(degrees_per_step),
    ring_(make_positions(positions_, degrees_per_step)) {}

int HandRing::current_index() const {
  return ring_.current().index;
}

double HandRing::base_angle() const {
  return ring_.current().angle_degrees;
}

void HandRing::move_to_index(int target_index) {
  const int n = positions_;
  const int target  = wrap_index(target_index, n);
  const int current = current_index();
  const int forward  = wrap_index(target - current, n);
  const int backward = wrap_index(current - target, n);
  if (forward <= backward) {
    ring_.step_forward(static_cast<std::size_t>(forward));
    last_move_steps_ = forward;
  } else {
    ring_.step_backward(static_cast<std::size_t>(backward));
    last_move_steps_ = -backward;
  }
}

double HandRing::angle_with_fraction(double fraction) const {
  const double f = std::clamp(fraction, 0.0, 1.0);
  return base_angle() + f * degrees_per_step_;
}

} // namespace chronograph
