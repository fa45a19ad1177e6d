#include "estimation/flow_estimator.hpp"

#include <cmath>

namespace flow_control::estimation {

FlowEstimator::FlowEstimator(const core::EstimatorConfig config) : config_(config) {}

model::flow_estimate FlowEstimator::update(const model::weight_sample& sample) noexcept {
  if (!has_sample_) {
    last_sample_ = sample;
    has_sample_ = true;
    estimate_.timestamp_s = sample.timestamp_s;
    estimate_.valid = false;
    return estimate_;
  }

  const double dt = sample.timestamp_s - last_sample_.timestamp_s;
  if (std::fabs(dt) > config_.max_staleness_s) {
    // Sensor stalled, or its clock restarted; restart differencing from this reading.
    last_sample_ = sample;
    estimate_.timestamp_s = sample.timestamp_s;
    estimate_.valid = false;
    return estimate_;
  }

  if (dt <= config_.min_dt_s) {
    return hold();
  }

  const double raw_rate = (sample.mass - last_sample_.mass) / dt;
  if (!has_filtered_) {
    estimate_.rate = raw_rate;
    has_filtered_ = true;
  } else {
    const double alpha = dt / (config_.filter_tau_s + dt);
    estimate_.rate += alpha * (raw_rate - estimate_.rate);
  }

  last_sample_ = sample;
  estimate_.timestamp_s = sample.timestamp_s;
  estimate_.raw_rate = raw_rate;
  estimate_.valid = true;
  return estimate_;
}

model::flow_estimate FlowEstimator::hold() noexcept {
  estimate_.valid = false;
  return estimate_;
}

void FlowEstimator::reset() noexcept {
  last_sample_ = {};
  has_sample_ = false;
  has_filtered_ = false;
  estimate_ = {};
}

}  // namespace flow_control::estimation
