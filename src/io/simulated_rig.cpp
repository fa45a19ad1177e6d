#include "io/simulated_rig.hpp"

#include <cmath>
#include <utility>

#include "core/timestamp.hpp"

namespace flow_control::io {

SimulatedRig::SimulatedRig(const double max_flow_rate, Clock clock)
    : max_flow_rate_(max_flow_rate), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = core::monotonic_now_s;
  }
}

void SimulatedRig::advance(const double now_s) noexcept {
  if (!started_) {
    last_time_s_ = now_s;
    started_ = true;
    return;
  }
  if (now_s > last_time_s_) {
    mass_ += opening_ * max_flow_rate_ * (now_s - last_time_s_);
    last_time_s_ = now_s;
  }
}

ReadResult SimulatedRig::read() {
  const double now_s = clock_();
  advance(now_s);

  ReadResult result{};
  result.status = ReadStatus::fresh;
  result.sample = {now_s, mass_};
  return result;
}

CommandStatus SimulatedRig::command(const double position) {
  if (!std::isfinite(position) || position < 0.0 || position > 1.0) {
    return CommandStatus::rejected;
  }
  advance(clock_());
  opening_ = position;
  return CommandStatus::ok;
}

}  // namespace flow_control::io
