#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>

#include "io/weight_source.hpp"

namespace flow_control::io {

// Keeps only the newest sample pushed by an asynchronous producer and hands
// it out behind the pull contract of WeightSampleSource.
class LatestSampleBuffer {
 public:
  void push(const model::weight_sample& sample);
  void fail(std::string reason);

  // Waits up to timeout for a sample newer than the one returned previously.
  ReadResult pull(std::chrono::milliseconds timeout);

 private:
  std::mutex mutex_;
  std::condition_variable changed_;
  model::weight_sample latest_{};
  std::uint64_t sequence_{0};
  std::uint64_t consumed_sequence_{0};
  bool failed_{false};
  std::string failure_{};
};

}  // namespace flow_control::io
