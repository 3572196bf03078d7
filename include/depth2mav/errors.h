#pragma once

#include <stdexcept>

namespace depth2mav {

// Bad startup configuration: invalid values, or hardware that does not match them.
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace depth2mav
