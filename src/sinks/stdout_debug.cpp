#include "sinks/stdout_debug.hpp"

#include <cmath>
#include <cstdio>
#include <string>

namespace flow_control::sinks {
namespace {

// JSON has no NaN or infinity.
nlohmann::json finite_or_null(const double value) {
  return std::isfinite(value) ? nlohmann::json(value) : nlohmann::json(nullptr);
}

}  // namespace

nlohmann::json observation_to_json(const model::flow_observation& observation) {
  return nlohmann::json{
      {"tick", observation.tick},
      {"timestamp_s", finite_or_null(observation.timestamp_s)},
      {"raw_flow", finite_or_null(observation.raw_rate)},
      {"estimated_flow", finite_or_null(observation.estimated_flow)},
      {"valid", observation.valid},
      {"setpoint", finite_or_null(observation.setpoint)},
      {"controller_output", finite_or_null(observation.controller_output)},
      {"commanded_position", finite_or_null(observation.commanded_position)},
      {"loop_state", model::to_string(observation.state)},
      {"health",
       {{"compute_time_ms", observation.health.compute_time_ms},
        {"missed_ticks", observation.health.missed_ticks},
        {"stale_ticks", observation.health.stale_ticks}}},
  };
}

bool StdoutDebugSink::publish(const model::flow_observation& observation) const {
  int written = 0;
  if (json_) {
    const std::string line = observation_to_json(observation).dump();
    written = std::printf("%s\n", line.c_str());
  } else {
    written = std::printf("[flow] tick=%llu state=%s setpoint=%.2f flow=%.2f%s valve=%.3f output=%.2f\n",
                          static_cast<unsigned long long>(observation.tick), model::to_string(observation.state),
                          observation.setpoint, observation.estimated_flow, observation.valid ? "" : " (held)",
                          observation.commanded_position, observation.controller_output);
  }
  std::fflush(stdout);
  return written >= 0;
}

}  // namespace flow_control::sinks
