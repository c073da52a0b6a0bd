#pragma once
#include <cstddef>
#include <optional>
#include <chronograph/circular_list.hpp>
#include <chronograph/errors.hpp>

namespace chronograph {

// One discrete stop on a hand's dial.
struct RingPosition {
  int index = 0;
  double angle_degrees = 0.0;   // index * degrees_per_step
};

// Clock hand modelled as a ring of positions with a cursor.
class HandRing {
public:
  // Throws InvalidArgument when positions <= 0.
  HandRing(int positions, double degrees_per_step);

  int positions() const { return positions_; }
  double degrees_per_step() const { return degrees_per_step_; }

  int current_index() const;
  double base_angle() const;

  // Moves the cursor to target mod positions() along the shorter direction
  // (ties go forward).
  void move_to_index(int target_index);

  // Steps taken by the last move_to_index: > 0 forward, < 0 backward.
  int last_move_steps() const { return last_move_steps_; }

  // base_angle() plus fraction (clamped to [0,1]) of one step.
  double angle_with_fraction(double fraction) const;

  // Lookup by predicate; does not move the cursor.
  template <class Pred>
  std::optional<RingPosition> find(Pred pred) const {
    if (ring_.empty()) throw EmptyStructure("hand ring is empty");
    const auto slot = ring_.find(pred);
    if (!slot) return std::nullopt;
    return ring_.at(*slot);
  }

private:
  int positions_;
  double degrees_per_step_;
  CircularList<RingPosition> ring_;
  int last_move_steps_{0};
};

} // namespace chronograph
