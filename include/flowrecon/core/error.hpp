#pragma once

#include <stdexcept>
#include <string>

namespace flowrecon::core {

// Invalid configuration or arguments.
struct ValueError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// A snapshot or provisioning entry failed validation. Raised by the entry
// validators and converted into a Rejection for that single entry.
struct MalformedEntryError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Raised by TableStorage implementations when a row cannot be persisted.
struct WriteError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

} // namespace flowrecon::core
