#include "io/backends.hpp"

#include <iostream>
#include <stdexcept>

#include "io/file_source.hpp"
#include "io/pinch_valve.hpp"
#include "io/serial_port.hpp"
#include "io/serial_scale.hpp"
#include "io/simulated_rig.hpp"

namespace flow_control::io {

Backends make_backends(const core::AppConfig& config) {
  Backends backends{};
  std::shared_ptr<SimulatedRig> rig;

  switch (config.source.kind) {
    case core::SourceKind::simulated:
      rig = std::make_shared<SimulatedRig>(config.simulation.max_flow_rate);
      backends.source = rig;
      break;
    case core::SourceKind::file:
      backends.source = std::make_shared<FileWeightSource>(config.source.path);
      break;
    case core::SourceKind::serial:
      backends.source = std::make_shared<SerialScaleSource>(
          std::make_unique<SerialPort>(config.source.path, config.source.baud), config.source.read_timeout);
      break;
  }

  switch (config.valve.kind) {
    case core::ValveKind::simulated:
      if (rig == nullptr) {
        throw std::runtime_error("io.valve simulated requires io.source simulated");
      }
      backends.valve = rig;
      break;
    case core::ValveKind::dry_run:
      backends.valve = std::make_shared<DryRunValve>(config.valve.steps, rig);
      break;
    case core::ValveKind::serial:
      if (rig != nullptr) {
        throw std::runtime_error("io.source simulated cannot be driven by a serial valve");
      }
      backends.valve = std::make_shared<SerialPinchValve>(
          std::make_unique<SerialPort>(config.valve.port, config.valve.baud), config.valve.steps,
          config.valve.command_timeout);
      break;
  }

  std::cerr << "[io] weight source=" << backends.source->name() << " valve=" << backends.valve->name() << '\n';
  return backends;
}

}  // namespace flow_control::io
