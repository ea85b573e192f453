/* @file SerialChannel.cpp
 * @brief IO abstraction layer that wraps ttyUSBx - handles file descriptor, raw byte io, timeouts and RAII - POSIX compliant
 *
 * © 2025 Spectackler contributors — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cstddef>
#include <cstring> // for strerror
#include <iostream>
#include <utility>

// Linux headers
#include <errno.h> // Error integer and strerror() function
#include <fcntl.h> // Contains file controls like O_RDWR
#include <poll.h>
#include <unistd.h> // write(), read(), close()

// spectackler headers
#include "io/SerialChannel.hpp"

using namespace spectackler::io;

namespace {
  // poll() slice so a stop request is noticed without waiting out the whole read timeout
  constexpr int kStopCheckSliceMs = 20;
} // namespace

std::optional<speed_t> spectackler::io::baudFromInt(long baud) {
  switch (baud) {
  case 1200:
    return B1200;
  case 2400:
    return B2400;
  case 4800:
    return B4800;
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
    return std::nullopt;
  }
}

SerialChannel::~SerialChannel() { close(); }

SerialChannel::SerialChannel(SerialChannel&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), rx_buffer_(std::move(other.rx_buffer_)),
      timeout_(other.timeout_) {}

SerialChannel& SerialChannel::operator=(SerialChannel&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
    rx_buffer_ = std::move(other.rx_buffer_);
    timeout_ = other.timeout_;
  }
  return *this;
}

bool SerialChannel::open(const SerialConfig& config) {
  // open non-blocking, dont become ctrl-TTY
  fd_ = ::open(config.port.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd_ < 0) {
    std::cerr << "Error " << errno << " from open(" << config.port << "): " << strerror(errno)
              << "\n";
    return false;
  }

  // fetch current attrs
  struct termios tty;
  if (tcgetattr(fd_, &tty) != 0) {
    std::cerr << "Error " << errno << " from tcgetattr: " << strerror(errno) << "\n";
    close();
    return false;
  }

  cfmakeraw(&tty);
  tty.c_cflag &= ~CSIZE;
  tty.c_cflag |= CS8;
  tty.c_cflag &= ~CRTSCTS;
  tty.c_cflag |= CREAD | CLOCAL;
  tty.c_iflag &= ~(IXON | IXOFF | IXANY);

  switch (config.parity) {
  case Parity::None:
    tty.c_cflag &= ~(PARENB | PARODD);
    break;
  case Parity::Even:
    tty.c_cflag |= PARENB;
    tty.c_cflag &= ~PARODD;
    break;
  case Parity::Odd:
    tty.c_cflag |= PARENB | PARODD;
    break;
  }

  cfsetispeed(&tty, config.baud);
  cfsetospeed(&tty, config.baud);

  if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
    std::cerr << "Error " << errno << " from tcsetattr: " << strerror(errno) << "\n";
    close();
    return false;
  }

  timeout_ = config.readTimeout;
  rx_buffer_.clear();
  return true;
}

bool SerialChannel::write(const Bytes& data) {

  if (fd_ < 0) {
    return false;
  }

  // POSIX write loop (required if the tty blocks for instance)
  std::size_t total = 0;
  while (total < data.size()) {
    ssize_t written = ::write(fd_, data.data() + total, data.size() - total);
    if (written > 0) {
      total += static_cast<std::size_t>(written);
    } else if (written == -1 && errno == EINTR) {
      continue; // try again
    } else if (written == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      pollfd pfd{ fd_, POLLOUT, 0 };
      ::poll(&pfd, 1, kStopCheckSliceMs);
      continue;
    } else {
      std::cerr << "Error: " << errno << " from write: " << strerror(errno) << "\n";
      return false;
    }
  }

  return true;
}

// -------------------------------------------------------------------
// SerialChannel::fill
// Waits for input until the deadline, appending to the internal buffer.
// Returns false on timeout, disconnect, error or stop request.
// -------------------------------------------------------------------
bool SerialChannel::fill(std::chrono::steady_clock::time_point deadline,
                         const std::stop_token& stop) {
  if (fd_ < 0)
    return false;

  std::uint8_t temp[256];
  pollfd pfd{ fd_, POLLIN, 0 };

  while (std::chrono::steady_clock::now() < deadline) {
    if (stop.stop_requested())
      return false;

    auto ms_left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    int ms = std::min(static_cast<int>(ms_left.count()), kStopCheckSliceMs);

    int rc = ::poll(&pfd, 1, std::max(ms, 0));
    if (rc == -1) {
      if (errno == EINTR)
        continue; // interrupted → retry
      std::cerr << "poll: " << strerror(errno) << '\n';
      return false;
    }
    if (rc == 0)
      continue; // slice elapsed, re-check stop + deadline

    if (pfd.revents & POLLIN) {
      ssize_t n = ::read(fd_, temp, sizeof(temp));
      if (n > 0) {
        rx_buffer_.insert(rx_buffer_.end(), temp, temp + n);
        return true;
      } else if (n == 0) { // EOF / disconnect
        close();
        return false;
      } else if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        continue; // transient → retry
      } else {
        std::cerr << "read: " << strerror(errno) << '\n';
        return false;
      }
    }
    if (pfd.revents & (POLLHUP | POLLERR)) {
      close();
      return false;
    }
  }
  return false; // timeout
}

std::optional<Bytes> SerialChannel::read(std::size_t count, std::stop_token stop) {
  const auto deadline = std::chrono::steady_clock::now() + timeout_;

  while (rx_buffer_.size() < count) {
    if (!fill(deadline, stop))
      return std::nullopt; // timeout/partial
  }

  Bytes out(rx_buffer_.begin(), rx_buffer_.begin() + static_cast<std::ptrdiff_t>(count));
  rx_buffer_.erase(rx_buffer_.begin(), rx_buffer_.begin() + static_cast<std::ptrdiff_t>(count));
  return out;
}

std::optional<Bytes> SerialChannel::readUntil(std::uint8_t terminator, std::stop_token stop) {
  const auto deadline = std::chrono::steady_clock::now() + timeout_;

  for (;;) {
    auto pos = std::find(rx_buffer_.begin(), rx_buffer_.end(), terminator);
    if (pos != rx_buffer_.end()) {
      Bytes line(rx_buffer_.begin(), pos + 1);
      rx_buffer_.erase(rx_buffer_.begin(), pos + 1);
      return line;
    }
    if (!fill(deadline, stop))
      return std::nullopt;
  }
}

void SerialChannel::flushInput() {
  rx_buffer_.clear();
  if (fd_ >= 0)
    tcflush(fd_, TCIFLUSH);
}

void SerialChannel::drain() {
  rx_buffer_.clear();
  if (fd_ >= 0)
    tcflush(fd_, TCIOFLUSH);
}

void SerialChannel::close() {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
}
