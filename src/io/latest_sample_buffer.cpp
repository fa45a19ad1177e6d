#include "io/latest_sample_buffer.hpp"

#include <utility>

namespace flow_control::io {

void LatestSampleBuffer::push(const model::weight_sample& sample) {
  {
    const std::lock_guard<std::mutex> lock(mutex_);
    latest_ = sample;
    ++sequence_;
  }
  changed_.notify_all();
}

void LatestSampleBuffer::fail(std::string reason) {
  {
    const std::lock_guard<std::mutex> lock(mutex_);
    failed_ = true;
    failure_ = std::move(reason);
  }
  changed_.notify_all();
}

ReadResult LatestSampleBuffer::pull(const std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  changed_.wait_for(lock, timeout, [this]() { return failed_ || sequence_ != consumed_sequence_; });

  ReadResult result{};
  if (failed_) {
    result.status = ReadStatus::hard_failure;
    result.error = failure_;
    return result;
  }

  if (sequence_ == consumed_sequence_) {
    result.status = ReadStatus::stale;
    return result;
  }

  consumed_sequence_ = sequence_;
  result.status = ReadStatus::fresh;
  result.sample = latest_;
  return result;
}

}  // namespace flow_control::io
