#include "io/serial_scale.hpp"

#include <array>
#include <iostream>
#include <utility>

#include "core/timestamp.hpp"

namespace flow_control::io {
namespace {
constexpr std::chrono::milliseconds kPollInterval{100};
constexpr std::size_t kMaxLineLength = 128;
}  // namespace

std::optional<double> parse_weight(const std::string& line) {
  std::string number;
  bool seen_digit = false;
  bool seen_dot = false;

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (c >= '0' && c <= '9') {
      number.push_back(c);
      seen_digit = true;
    } else if (c == '.' && !seen_dot && !number.empty()) {
      number.push_back(c);
      seen_dot = true;
    } else if (seen_digit) {
      break;
    } else if ((c == '+' || c == '-') && i + 1 < line.size()) {
      number.assign(1, c);
      seen_dot = false;
    } else if (c != ' ') {
      number.clear();
      seen_dot = false;
    }
  }

  if (!seen_digit) {
    return std::nullopt;
  }
  try {
    return std::stod(number);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

SerialScaleSource::SerialScaleSource(std::unique_ptr<SerialPort> port, const std::chrono::milliseconds read_timeout,
                                     Clock clock)
    : port_(std::move(port)), read_timeout_(read_timeout), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = core::monotonic_now_s;
  }
  reader_ = std::thread([this]() { reader_loop(); });
}

SerialScaleSource::~SerialScaleSource() {
  stop_requested_.store(true);
  if (reader_.joinable()) {
    reader_.join();
  }
}

ReadResult SerialScaleSource::read() { return buffer_.pull(read_timeout_); }

void SerialScaleSource::reader_loop() {
  std::array<char, 64> chunk{};
  std::string line;
  bool warned_garbage = false;

  while (!stop_requested_.load()) {
    std::size_t received = 0;
    const IoStatus status = port_->read_some(chunk.data(), chunk.size(), received, kPollInterval);
    if (status == IoStatus::timeout) {
      continue;
    }
    if (status != IoStatus::ok) {
      std::cerr << "[serial-scale] link lost\n";
      buffer_.fail(status == IoStatus::closed ? "scale link closed" : "scale read error");
      return;
    }

    for (std::size_t i = 0; i < received; ++i) {
      const char c = chunk[i];
      if (c != '\n' && c != '\r') {
        if (line.size() < kMaxLineLength) {
          line.push_back(c);
        }
        continue;
      }
      if (line.empty()) {
        continue;
      }

      const auto weight = parse_weight(line);
      if (weight.has_value()) {
        buffer_.push({clock_(), *weight});
        warned_garbage = false;
      } else if (!warned_garbage) {
        std::cerr << "[serial-scale] ignoring unparsable line '" << line << "'\n";
        warned_garbage = true;
      }
      line.clear();
    }
  }
}

}  // namespace flow_control::io
