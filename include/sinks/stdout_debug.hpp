#pragma once

#include <nlohmann/json.hpp>

#include "model/flow_frame.hpp"

namespace flow_control::sinks {

nlohmann::json observation_to_json(const model::flow_observation& observation);

class StdoutDebugSink {
 public:
  explicit StdoutDebugSink(bool json = false) : json_(json) {}

  bool publish(const model::flow_observation& observation) const;

 private:
  bool json_;
};

}  // namespace flow_control::sinks
