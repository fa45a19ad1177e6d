#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

#include "io/weight_source.hpp"

namespace flow_control::io {

// Tails a text log of scale readings, one per line: "<timestamp_s> <mass>",
// or a bare "<mass>" which is stamped with the time it was read.
class FileWeightSource final : public WeightSampleSource {
 public:
  using Clock = std::function<double()>;

  explicit FileWeightSource(std::string path, Clock clock = {});

  ReadResult read() override;
  const char* name() const override { return "file"; }

 private:
  static constexpr std::size_t kReadBufferSize = 256;

  std::string path_;
  Clock clock_;
  long offset_{0};
};

// Parses one reading line; nullopt when the line holds no usable number.
std::optional<model::weight_sample> parse_sample_line(const std::string& line, double fallback_timestamp_s);

}  // namespace flow_control::io
