#include "control/pid_controller.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace flow_control::control {

PIDController::PIDController(const core::LoopConfig& config)
    : kp_(config.kp),
      ki_(config.ki),
      kd_(config.kd),
      output_min_(config.output_min),
      output_max_(config.output_max),
      integral_min_(config.integral_min),
      integral_max_(config.integral_max),
      max_slew_per_s_(config.max_output_slew_per_s) {
  if (const auto error = core::validate_loop_config(config)) {
    throw std::invalid_argument("invalid controller configuration: " + *error);
  }
  state_.previous_output = output_min_;
}

ControllerOutput PIDController::update(const double setpoint, const double estimate, const bool estimate_valid,
                                       const double dt_s, const double now_s) noexcept {
  ControllerOutput result{};
  result.output = state_.previous_output;

  if (!estimate_valid || !std::isfinite(estimate) || !std::isfinite(setpoint) || !(dt_s > 0.0)) {
    result.held = true;
    return result;
  }

  const double error = setpoint - estimate;

  state_.integral = std::clamp(state_.integral + (error * dt_s), integral_min_, integral_max_);

  result.error = error;
  result.proportional = kp_ * error;
  result.integral = ki_ * state_.integral;
  result.derivative = kd_ * (error - state_.previous_error) / dt_s;

  double output = result.proportional + result.integral + result.derivative;
  output = std::clamp(output, output_min_, output_max_);

  const double max_step = max_slew_per_s_ * dt_s;
  output = std::clamp(output, state_.previous_output - max_step, state_.previous_output + max_step);

  state_.previous_error = error;
  state_.previous_output = output;
  state_.last_update_s = now_s;

  result.output = output;
  return result;
}

void PIDController::reset(const double actuator_output) noexcept {
  state_.integral = 0.0;
  state_.previous_error = 0.0;
  state_.previous_output = std::clamp(actuator_output, output_min_, output_max_);
}

}  // namespace flow_control::control
