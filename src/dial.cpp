#include <chronograph/dial.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace chronograph {

static std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return s;
}

static std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> cols;
  std::string cur;
  for (char c : line) {
    if (c == ',') { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

static bool is_header_row(const std::vector<std::string>& cols) {
  return cols.size() >= 2 && lower(cols[0]) == "hand";
}

static std::optional<int> to_int_safe(const std::string& s) {
  try {
    std::size_t idx = 0;
    const int v = std::stoi(s, &idx);
    if (idx != s.size()) return std::nullopt;
    return v;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

const HandGeometry& DialLayout::geometry(Hand h) const {
  switch (h) {
    case Hand::Seconds: return seconds;
    case Hand::Minutes: return minutes;
    default:            return hours;
  }
}

HandGeometry& DialLayout::geometry(Hand h) {
  switch (h) {
    case Hand::Seconds: return seconds;
    case Hand::Minutes: return minutes;
    default:            return hours;
  }
}

const char* hand_name(Hand h) {
  switch (h) {
    case Hand::Seconds: return "seconds";
    case Hand::Minutes: return "minutes";
    case Hand::Hours:   return "hours";
    default: return "unknown";
  }
}

std::optional<Hand> hand_by_name(const std::string& key) {
  const std::string k = lower(trim(key));
  if (k == "seconds") return Hand::Seconds;
  if (k == "minutes") return Hand::Minutes;
  if (k == "hours")   return Hand::Hours;
  return std::nullopt;
}

DialLayout dial_layout_from_csv_stream(std::istream& in) {
  DialLayout layout;
  std::string line;
  bool header_consumed = false;

  while (std::getline(in, line)) {
    const std::string raw = trim(line);
    if (raw.empty() || raw[0] == '#') continue;

    const auto cols = split_csv_line(raw);
    if (!header_consumed && is_header_row(cols)) {
      header_consumed = true;
      continue;
    }
    if (cols.size() < 2) continue;

    const auto hand = hand_by_name(cols[0]);
    const auto positions = to_int_safe(cols[1]);
    if (!hand || !positions || *positions <= 0) continue;

    layout.geometry(*hand) = HandGeometry::uniform(*positions);
  }
  return layout;
}

std::optional<DialLayout> load_dial_layout_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return dial_layout_from_csv_stream(f);
}

} // namespace chronograph
