#pragma once

#include <cstdint>

namespace flow_control::io {

enum class CommandStatus : std::uint8_t {
  ok,
  rejected,
};

// Normalized valve opening: 0 is fully closed, 1 fully open.
class ValveActuator {
 public:
  virtual CommandStatus command(double position) = 0;
  virtual double last_position() const = 0;
  virtual const char* name() const = 0;
  virtual ~ValveActuator() = default;
};

}  // namespace flow_control::io
