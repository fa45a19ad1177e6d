#pragma once

#include <memory>

#include "core/config.hpp"
#include "io/valve_actuator.hpp"
#include "io/weight_source.hpp"

namespace flow_control::io {

struct Backends {
  std::shared_ptr<WeightSampleSource> source;
  std::shared_ptr<ValveActuator> valve;
};

// Builds the configured source/valve pair. A simulated source can only be
// driven by the simulated or dry-run valve. Throws std::runtime_error when a
// device cannot be opened or the combination is unsupported.
Backends make_backends(const core::AppConfig& config);

}  // namespace flow_control::io
