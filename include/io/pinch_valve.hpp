#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "io/serial_port.hpp"
#include "io/valve_actuator.hpp"

namespace flow_control::io {

// Step position for a normalized opening, rounded to the nearest step.
std::uint32_t to_valve_steps(double position, std::uint32_t total_steps) noexcept;

// Absolute-move command understood by the stepper-driven pinch valve controller.
std::string format_valve_command(std::uint32_t steps);

class SerialPinchValve final : public ValveActuator {
 public:
  SerialPinchValve(std::unique_ptr<SerialPort> port, std::uint32_t total_steps, std::chrono::milliseconds timeout);

  CommandStatus command(double position) override;
  double last_position() const override { return last_position_; }
  const char* name() const override { return "serial"; }

 private:
  std::unique_ptr<SerialPort> port_;
  std::uint32_t total_steps_;
  std::chrono::milliseconds timeout_;
  double last_position_{0.0};
};

// Logs the command that would be sent. When given a downstream actuator the
// command is forwarded to it as well.
class DryRunValve final : public ValveActuator {
 public:
  DryRunValve(std::uint32_t total_steps, std::shared_ptr<ValveActuator> downstream = nullptr);

  CommandStatus command(double position) override;
  double last_position() const override;
  const char* name() const override { return "dry_run"; }

 private:
  std::uint32_t total_steps_;
  std::shared_ptr<ValveActuator> downstream_;
  double last_position_{0.0};
};

}  // namespace flow_control::io
