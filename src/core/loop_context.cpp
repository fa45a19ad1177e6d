#include "core/loop_context.hpp"

namespace flow_control::core {

ObservationBoard::ObservationBoard() noexcept : latest_{} {
  latest_.state = model::loop_state::STOPPED;
}

void ObservationBoard::publish(const model::flow_observation& observation) {
  const std::lock_guard<std::mutex> lock(mutex_);
  latest_ = observation;
}

model::flow_observation ObservationBoard::snapshot() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return latest_;
}

}  // namespace flow_control::core
