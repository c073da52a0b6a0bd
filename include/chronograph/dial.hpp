#pragma once
#include <istream>
#include <optional>
#include <string>

namespace chronograph {

enum class Hand : int {
  Seconds = 0,
  Minutes = 1,
  Hours = 2,
  Count
};

struct HandGeometry {
  int positions = 0;              // discrete stops around the dial
  double degrees_per_step = 0.0;  // angle between two stops

  // n stops spread evenly over a full turn.
  static HandGeometry uniform(int n) { return HandGeometry{n, 360.0 / n}; }
};

// Resolution of each hand. Defaults: 60 s, 60 min, 12 h * 60 min.
struct DialLayout {
  HandGeometry seconds{60, 6.0};
  HandGeometry minutes{60, 6.0};
  HandGeometry hours{720, 0.5};

  const HandGeometry& geometry(Hand h) const;
  HandGeometry& geometry(Hand h);
};

const char* hand_name(Hand h);
std::optional<Hand> hand_by_name(const std::string& key);

// Stream-based CSV loader (test-friendly; no filesystem required).
// Rows are "hand,positions". Accepts an optional header row; ignores blank
// lines and lines starting with '#'. Whitespace around fields is trimmed.
// Invalid rows are skipped; hands without a row keep their default.
DialLayout dial_layout_from_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<DialLayout> load_dial_layout_csv(const std::string& path);

} // namespace chronograph
