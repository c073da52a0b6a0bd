#pragma once
#include <stdexcept>

namespace chronograph {

// Caller broke a precondition (ring size, mode value, cursor slot, ...).
class InvalidArgument : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

// Cursor, step or lookup on a sequence with no positions.
class EmptyStructure : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

} // namespace chronograph
