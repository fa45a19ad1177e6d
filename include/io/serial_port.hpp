#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace flow_control::io {

enum class IoStatus : std::uint8_t {
  ok,
  timeout,
  closed,
  error,
};

// Owns a file descriptor for a tty configured raw 8N1, or any descriptor
// handed in by the caller (pipes in tests).
class SerialPort {
 public:
  SerialPort(const std::string& device, int baud);
  explicit SerialPort(int fd, bool owns_fd = true) noexcept;
  ~SerialPort();

  SerialPort(const SerialPort&) = delete;
  SerialPort& operator=(const SerialPort&) = delete;

  IoStatus write_all(const std::string& data, std::chrono::milliseconds timeout) noexcept;
  IoStatus read_some(char* buffer, std::size_t capacity, std::size_t& received,
                     std::chrono::milliseconds timeout) noexcept;

  [[nodiscard]] int fd() const noexcept { return fd_; }

 private:
  int fd_{-1};
  bool owns_fd_{true};
};

}  // namespace flow_control::io
