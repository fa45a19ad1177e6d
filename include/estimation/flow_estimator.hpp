#pragma once

#include "core/config.hpp"
#include "model/flow_frame.hpp"

namespace flow_control::estimation {

// Differentiates successive scale readings into a mass flow rate and smooths it
// with a single-pole low-pass filter. Value type: copying snapshots all state.
class FlowEstimator {
 public:
  explicit FlowEstimator(core::EstimatorConfig config = {});

  // Feeds one reading. Readings that do not advance time by at least min_dt_s
  // leave the state untouched and return the previous estimate marked invalid.
  model::flow_estimate update(const model::weight_sample& sample) noexcept;

  // No new reading this tick.
  model::flow_estimate hold() noexcept;

  void reset() noexcept;

  [[nodiscard]] const model::flow_estimate& last() const noexcept { return estimate_; }

 private:
  core::EstimatorConfig config_;
  model::weight_sample last_sample_{};
  bool has_sample_{false};
  bool has_filtered_{false};
  model::flow_estimate estimate_{};
};

}  // namespace flow_control::estimation
