#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "io/latest_sample_buffer.hpp"
#include "io/serial_port.hpp"
#include "io/weight_source.hpp"

namespace flow_control::io {

// Scale that streams ASCII weight lines over a serial link. A reader thread
// parses lines as they arrive; read() returns the newest one.
class SerialScaleSource final : public WeightSampleSource {
 public:
  using Clock = std::function<double()>;

  SerialScaleSource(std::unique_ptr<SerialPort> port, std::chrono::milliseconds read_timeout, Clock clock = {});
  ~SerialScaleSource() override;

  SerialScaleSource(const SerialScaleSource&) = delete;
  SerialScaleSource& operator=(const SerialScaleSource&) = delete;

  ReadResult read() override;
  const char* name() const override { return "serial"; }

 private:
  void reader_loop();

  std::unique_ptr<SerialPort> port_;
  std::chrono::milliseconds read_timeout_;
  Clock clock_;
  LatestSampleBuffer buffer_{};
  std::atomic<bool> stop_requested_{false};
  std::thread reader_;
};

// Extracts the first number from a scale line such as "ST,GS,+  12.34 g".
std::optional<double> parse_weight(const std::string& line);

}  // namespace flow_control::io
