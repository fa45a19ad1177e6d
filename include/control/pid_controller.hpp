#pragma once

#include "core/config.hpp"

namespace flow_control::control {

struct ControllerState {
  double integral{0.0};
  double previous_error{0.0};
  double previous_output{0.0};
  double last_update_s{0.0};
};

struct ControllerOutput {
  double output{0.0};
  double error{0.0};
  double proportional{0.0};
  double integral{0.0};
  double derivative{0.0};
  bool held{false};
};

// PID with clamp-based anti-windup, output range clamp and slew limiting.
// Gains and bounds are fixed at construction; a malformed LoopConfig throws
// std::invalid_argument.
class PIDController {
 public:
  explicit PIDController(const core::LoopConfig& config);

  // dt_s is the time elapsed since the previous update. An invalid estimate or
  // a non-positive dt freezes the controller and returns the last output.
  ControllerOutput update(double setpoint, double estimate, bool estimate_valid, double dt_s, double now_s = 0.0) noexcept;

  // Clears integral and derivative history and seeds the previous output with
  // the actuator's current position so the next update does not jump.
  void reset(double actuator_output) noexcept;

  [[nodiscard]] const ControllerState& state() const noexcept { return state_; }
  [[nodiscard]] double output_min() const noexcept { return output_min_; }
  [[nodiscard]] double output_max() const noexcept { return output_max_; }

 private:
  double kp_;
  double ki_;
  double kd_;
  double output_min_;
  double output_max_;
  double integral_min_;
  double integral_max_;
  double max_slew_per_s_;
  ControllerState state_{};
};

}  // namespace flow_control::control
