#pragma once
#include <stdexcept>

namespace gb {

// Delivery to the printer (bridge or device) did not complete.
class PrinterError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace gb
