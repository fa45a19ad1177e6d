#pragma once

#include <functional>

#include "io/valve_actuator.hpp"
#include "io/weight_source.hpp"

namespace flow_control::io {

// Reservoir, valve and scale in one object: the receiving vessel gains
// opening * max_flow_rate mass per second.
class SimulatedRig final : public WeightSampleSource, public ValveActuator {
 public:
  using Clock = std::function<double()>;

  explicit SimulatedRig(double max_flow_rate, Clock clock = {});

  ReadResult read() override;
  CommandStatus command(double position) override;
  double last_position() const override { return opening_; }
  const char* name() const override { return "simulated"; }

  [[nodiscard]] double mass() const noexcept { return mass_; }

 private:
  void advance(double now_s) noexcept;

  double max_flow_rate_;
  Clock clock_;
  double opening_{0.0};
  double mass_{0.0};
  double last_time_s_{0.0};
  bool started_{false};
};

}  // namespace flow_control::io
