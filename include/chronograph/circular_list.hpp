#pragma once
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>
#include <chronograph/errors.hpp>

namespace chronograph {

// Fixed circular sequence with one addressable cursor.
// Values live in a flat arena; next/prev are modular slot arithmetic.
template <class T>
class CircularList {
public:
  CircularList() = default;
  explicit CircularList(std::vector<T> values) : items_(std::move(values)) {}

  std::size_t size() const { return items_.size(); }
  bool empty() const { return items_.empty(); }

  // New value goes behind the tail (just before the head on the ring).
  void append(T value) { items_.push_back(std::move(value)); }

  const T& current() const {
    require_items_();
    return items_[cursor_];
  }

  std::size_t cursor() const {
    require_items_();
    return cursor_;
  }

  // Clockwise move; steps are taken modulo size().
  const T& step_forward(std::size_t steps = 1) {
    require_items_();
    const std::size_t n = items_.size();
    cursor_ = (cursor_ + steps % n) % n;
    return items_[cursor_];
  }

  // Counter-clockwise move; steps are taken modulo size().
  const T& step_backward(std::size_t steps = 1) {
    require_items_();
    const std::size_t n = items_.size();
    cursor_ = (cursor_ + n - steps % n) % n;
    return items_[cursor_];
  }

  void set_cursor(std::size_t slot) {
    require_items_();
    if (slot >= items_.size()) throw InvalidArgument("slot is not part of this ring");
    cursor_ = slot;
  }

  // First slot from the head whose value satisfies pred. Cursor is untouched.
  template <class Pred>
  std::optional<std::size_t> find(Pred pred) const {
    for (std::size_t i = 0; i < items_.size(); ++i) {
      if (pred(items_[i])) return i;
    }
    return std::nullopt;
  }

  const T& at(std::size_t slot) const { return items_.at(slot); }

  auto begin() const { return items_.begin(); }
  auto end() const { return items_.end(); }

private:
  void require_items_() const {
    if (items_.empty()) throw EmptyStructure("circular list is empty");
  }

  std::vector<T> items_;
  std::size_t cursor_{0};
};

} // namespace chronograph
