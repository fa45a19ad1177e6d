#include "io/pinch_valve.hpp"

#include <cmath>
#include <iostream>
#include <utility>

#include "core/math.hpp"

namespace flow_control::io {

std::uint32_t to_valve_steps(const double position, const std::uint32_t total_steps) noexcept {
  const double clamped = core::clamp01(position);
  return static_cast<std::uint32_t>(std::lround(clamped * static_cast<double>(total_steps)));
}

std::string format_valve_command(const std::uint32_t steps) {
  return "/1A" + std::to_string(steps) + "R\r\n";
}

SerialPinchValve::SerialPinchValve(std::unique_ptr<SerialPort> port, const std::uint32_t total_steps,
                                   const std::chrono::milliseconds timeout)
    : port_(std::move(port)), total_steps_(total_steps), timeout_(timeout) {}

CommandStatus SerialPinchValve::command(const double position) {
  if (!std::isfinite(position) || position < 0.0 || position > 1.0) {
    std::cerr << "[serial-valve] rejecting out-of-range command " << position << '\n';
    return CommandStatus::rejected;
  }

  const std::uint32_t steps = to_valve_steps(position, total_steps_);
  const IoStatus status = port_->write_all(format_valve_command(steps), timeout_);
  if (status != IoStatus::ok) {
    std::cerr << "[serial-valve] write failed ("
              << (status == IoStatus::timeout ? "timeout" : status == IoStatus::closed ? "link closed" : "io error")
              << ")\n";
    return CommandStatus::rejected;
  }

  last_position_ = static_cast<double>(steps) / static_cast<double>(total_steps_);
  return CommandStatus::ok;
}

DryRunValve::DryRunValve(const std::uint32_t total_steps, std::shared_ptr<ValveActuator> downstream)
    : total_steps_(total_steps), downstream_(std::move(downstream)) {}

CommandStatus DryRunValve::command(const double position) {
  if (!std::isfinite(position) || position < 0.0 || position > 1.0) {
    return CommandStatus::rejected;
  }

  std::string line = format_valve_command(to_valve_steps(position, total_steps_));
  line.resize(line.size() - 2);
  std::cerr << "[dry-run-valve] " << line << '\n';

  if (downstream_ != nullptr) {
    const CommandStatus status = downstream_->command(position);
    if (status != CommandStatus::ok) {
      return status;
    }
  }
  last_position_ = position;
  return CommandStatus::ok;
}

double DryRunValve::last_position() const {
  return downstream_ != nullptr ? downstream_->last_position() : last_position_;
}

}  // namespace flow_control::io
