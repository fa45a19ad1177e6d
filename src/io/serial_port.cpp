#include "io/serial_port.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

namespace flow_control::io {
namespace {

speed_t to_speed(const int baud) {
  switch (baud) {
    case 9600:
      return B9600;
    case 19200:
      return B19200;
    case 38400:
      return B38400;
    case 57600:
      return B57600;
    case 115200:
      return B115200;
    default:
      throw std::runtime_error("unsupported baud rate " + std::to_string(baud));
  }
}

int remaining_ms(const std::chrono::steady_clock::time_point deadline) {
  const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
  return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

}  // namespace

SerialPort::SerialPort(const std::string& device, const int baud) {
  const speed_t speed = to_speed(baud);

  fd_ = ::open(device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd_ < 0) {
    throw std::runtime_error("failed to open " + device + ": " + std::strerror(errno));
  }

  termios tty{};
  if (tcgetattr(fd_, &tty) != 0) {
    const std::string reason = std::strerror(errno);
    ::close(fd_);
    throw std::runtime_error("tcgetattr failed on " + device + ": " + reason);
  }
  cfmakeraw(&tty);
  cfsetispeed(&tty, speed);
  cfsetospeed(&tty, speed);
  tty.c_cflag |= (CLOCAL | CREAD);
  tty.c_cflag &= ~PARENB;
  tty.c_cflag &= ~CSTOPB;
  tty.c_cflag &= ~CSIZE;
  tty.c_cflag |= CS8;
  tty.c_cc[VTIME] = 0;
  tty.c_cc[VMIN] = 0;
  if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
    const std::string reason = std::strerror(errno);
    ::close(fd_);
    throw std::runtime_error("tcsetattr failed on " + device + ": " + reason);
  }
}

SerialPort::SerialPort(const int fd, const bool owns_fd) noexcept : fd_(fd), owns_fd_(owns_fd) {
  const int flags = ::fcntl(fd_, F_GETFL, 0);
  if (flags >= 0) {
    ::fcntl(fd_, F_SETFL, flags | O_NONBLOCK);
  }
}

SerialPort::~SerialPort() {
  if (owns_fd_ && fd_ >= 0) {
    ::close(fd_);
  }
}

IoStatus SerialPort::write_all(const std::string& data, const std::chrono::milliseconds timeout) noexcept {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::size_t written = 0;

  while (written < data.size()) {
    pollfd pfd{fd_, POLLOUT, 0};
    const int ready = ::poll(&pfd, 1, remaining_ms(deadline));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      return IoStatus::error;
    }
    if (ready == 0) {
      return IoStatus::timeout;
    }
    if ((pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0) {
      return IoStatus::closed;
    }

    const ssize_t n = ::write(fd_, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EAGAIN || errno == EINTR) {
        continue;
      }
      return errno == EPIPE ? IoStatus::closed : IoStatus::error;
    }
    written += static_cast<std::size_t>(n);
  }

  return IoStatus::ok;
}

IoStatus SerialPort::read_some(char* buffer, const std::size_t capacity, std::size_t& received,
                               const std::chrono::milliseconds timeout) noexcept {
  received = 0;

  pollfd pfd{fd_, POLLIN, 0};
  int ready = 0;
  do {
    ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  } while (ready < 0 && errno == EINTR);

  if (ready < 0) {
    return IoStatus::error;
  }
  if (ready == 0) {
    return IoStatus::timeout;
  }
  if ((pfd.revents & POLLNVAL) != 0 || (pfd.revents & POLLERR) != 0) {
    return IoStatus::error;
  }

  const ssize_t n = ::read(fd_, buffer, capacity);
  if (n < 0) {
    return (errno == EAGAIN || errno == EINTR) ? IoStatus::timeout : IoStatus::error;
  }
  if (n == 0) {
    // POLLIN with nothing to read is end of stream.
    return (pfd.revents & POLLHUP) != 0 ? IoStatus::closed : IoStatus::timeout;
  }

  received = static_cast<std::size_t>(n);
  return IoStatus::ok;
}

}  // namespace flow_control::io
