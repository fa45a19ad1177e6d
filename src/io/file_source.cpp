#include "io/file_source.hpp"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <utility>

#include "core/timestamp.hpp"

namespace flow_control::io {

std::optional<model::weight_sample> parse_sample_line(const std::string& line, const double fallback_timestamp_s) {
  const char* cursor = line.c_str();
  char* end = nullptr;

  errno = 0;
  const double first = std::strtod(cursor, &end);
  if (end == cursor || errno != 0 || !std::isfinite(first)) {
    return std::nullopt;
  }

  cursor = end;
  errno = 0;
  const double second = std::strtod(cursor, &end);
  if (end == cursor) {
    return model::weight_sample{fallback_timestamp_s, first};
  }
  if (errno != 0 || !std::isfinite(second)) {
    return std::nullopt;
  }
  return model::weight_sample{first, second};
}

FileWeightSource::FileWeightSource(std::string path, Clock clock) : path_(std::move(path)), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = core::monotonic_now_s;
  }
}

ReadResult FileWeightSource::read() {
  ReadResult result{};

  std::FILE* file = std::fopen(path_.c_str(), "r");
  if (file == nullptr) {
    result.status = ReadStatus::hard_failure;
    result.error = "unable to open " + path_ + ": " + std::strerror(errno);
    return result;
  }

  if (std::fseek(file, 0L, SEEK_END) == 0 && std::ftell(file) < offset_) {
    // Truncated or replaced; start over.
    offset_ = 0;
  }
  if (std::fseek(file, offset_, SEEK_SET) != 0) {
    std::fclose(file);
    result.status = ReadStatus::hard_failure;
    result.error = "seek failed on " + path_;
    return result;
  }

  const double now_s = clock_();
  std::optional<model::weight_sample> latest;
  char buffer[kReadBufferSize];
  std::string line;
  while (std::fgets(buffer, sizeof(buffer), file) != nullptr) {
    line.append(buffer);
    if (line.empty() || line.back() != '\n') {
      continue;
    }

    offset_ = std::ftell(file);
    line.pop_back();
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
      line.clear();
      continue;
    }

    const auto sample = parse_sample_line(line, now_s);
    if (!sample.has_value()) {
      std::fclose(file);
      result.status = ReadStatus::hard_failure;
      result.error = "unparsable reading in " + path_ + ": '" + line + "'";
      return result;
    }
    latest = sample;
    line.clear();
  }
  std::fclose(file);

  if (!latest.has_value()) {
    result.status = ReadStatus::stale;
    return result;
  }

  result.status = ReadStatus::fresh;
  result.sample = *latest;
  return result;
}

}  // namespace flow_control::io
