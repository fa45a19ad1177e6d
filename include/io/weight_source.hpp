#pragma once

#include <string>

#include "model/flow_frame.hpp"

namespace flow_control::io {

enum class ReadStatus : std::uint8_t {
  fresh,
  stale,
  hard_failure,
};

struct ReadResult {
  ReadStatus status{ReadStatus::stale};
  model::weight_sample sample{};
  std::string error{};
};

// Pull access to the newest scale reading. read() is bounded in time: a
// backend that cannot answer within its timeout reports stale.
class WeightSampleSource {
 public:
  virtual ReadResult read() = 0;
  virtual const char* name() const = 0;
  virtual ~WeightSampleSource() = default;
};

}  // namespace flow_control::io
