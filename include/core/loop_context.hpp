#pragma once

#include <atomic>
#include <mutex>

#include "model/flow_frame.hpp"

namespace flow_control::core {

// Single-value setpoint shared between operator surfaces and the control loop.
class SetpointChannel {
 public:
  explicit SetpointChannel(double initial = 0.0) noexcept : value_(initial) {}

  [[nodiscard]] double get() const noexcept { return value_.load(std::memory_order_acquire); }
  void set(double flow) noexcept { value_.store(flow, std::memory_order_release); }

 private:
  std::atomic<double> value_;
};

// Latest observation; the scheduler is the only writer.
class ObservationBoard {
 public:
  ObservationBoard() noexcept;

  void publish(const model::flow_observation& observation);
  [[nodiscard]] model::flow_observation snapshot() const;

 private:
  mutable std::mutex mutex_;
  model::flow_observation latest_;
};

// Everything the control loop shares with the outside world. Owned by the
// caller and passed to the scheduler by reference.
struct LoopContext {
  explicit LoopContext(double initial_setpoint = 0.0) noexcept : setpoint(initial_setpoint) {}

  // Consumed by the scheduler at the start of the next tick. Safe to call from a signal handler.
  void request_controller_reset() noexcept { controller_reset_requested.store(true); }

  SetpointChannel setpoint;
  ObservationBoard observations;
  std::atomic<bool> controller_reset_requested{false};
};

}  // namespace flow_control::core
