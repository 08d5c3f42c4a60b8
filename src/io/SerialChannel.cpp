/* @file SerialChannel.cpp
 * @brief IO abstraction layer over a tty - file descriptor, framing, line io and RAII - POSIX compliant
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstring> // for strerror
#include <iostream>
#include <utility>

// Linux headers
#include <errno.h>
#include <fcntl.h> // O_RDWR ...
#include <poll.h>
#include <unistd.h> // write(), read(), close()

// Wayfinder headers
#include "io/SerialChannel.hpp"

using namespace wayfinder::io;

std::optional<speed_t> wayfinder::io::toSpeed(unsigned int baud) {
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
  case 230400:
    return B230400;
  default:
    return std::nullopt;
  }
}

SerialChannel::~SerialChannel() { close(); }

SerialChannel::SerialChannel(SerialChannel&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), rx_buffer_(std::move(other.rx_buffer_)),
      discarding_(std::exchange(other.discarding_, false)) {}

SerialChannel& SerialChannel::operator=(SerialChannel&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
    rx_buffer_ = std::move(other.rx_buffer_);
    discarding_ = std::exchange(other.discarding_, false);
  }
  return *this;
}

bool SerialChannel::open(const std::string& dev, unsigned int baud) {
  const auto speed = toSpeed(baud);
  if (!speed) {
    std::cerr << "Error: unsupported baud rate " << baud << " for " << dev << "\n";
    return false;
  }

  close();
  // open non-blocking, dont become ctrl-TTY
  fd_ = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd_ < 0) {
    std::cerr << "Error " << errno << " from open(" << dev << "): " << strerror(errno) << "\n";
    return false;
  }

  struct termios tty;
  if (tcgetattr(fd_, &tty) != 0) {
    std::cerr << "Error " << errno << " from tcgetattr: " << strerror(errno) << "\n";
    close();
    return false;
  }

  cfmakeraw(&tty);
  tty.c_cflag &= ~CSIZE;
  tty.c_cflag |= CS8 | CREAD | CLOCAL;
  tty.c_cflag &= ~CRTSCTS;
  tty.c_iflag &= ~(IXON | IXOFF | IXANY);

  cfsetispeed(&tty, *speed);
  cfsetospeed(&tty, *speed);

  if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
    std::cerr << "Error " << errno << " from tcsetattr: " << strerror(errno) << "\n";
    close();
    return false;
  }
  return true;
}

bool SerialChannel::writeLine(const std::string& line) {
  if (fd_ < 0)
    return false;

  std::string out = line;
  if (!out.ends_with("\r\n"))
    out += "\r\n";

  std::size_t total = 0;
  while (total < out.size()) {
    ssize_t written = ::write(fd_, out.data() + total, out.size() - total);
    if (written > 0) {
      total += static_cast<std::size_t>(written);
    } else if (written == -1 && errno == EINTR) {
      continue;
    } else if (written == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      pollfd pfd{ fd_, POLLOUT, 0 };
      if (::poll(&pfd, 1, 100) < 0 && errno != EINTR) {
        std::cerr << "Error " << errno << " from poll: " << strerror(errno) << "\n";
        return false;
      }
    } else {
      std::cerr << "Error " << errno << " from write: " << strerror(errno) << "\n";
      return false;
    }
  }
  return true;
}

// -------------------------------------------------------------------
// SerialChannel::readLine
// Returns std::nullopt on timeout, disconnect, or error.
// -------------------------------------------------------------------
std::optional<std::string> SerialChannel::readLine(std::chrono::milliseconds timeout) {
  if (fd_ < 0)
    return std::nullopt;

  if (auto line = takeLine())
    return line;

  char temp[256];
  pollfd pfd{ fd_, POLLIN, 0 };
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  while (std::chrono::steady_clock::now() < deadline) {
    auto ms_left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());

    int rc = ::poll(&pfd, 1, static_cast<int>(ms_left.count()));
    if (rc == -1) {
      if (errno == EINTR)
        continue;
      std::cerr << "poll: " << strerror(errno) << '\n';
      return std::nullopt;
    }
    if (rc == 0)
      break; // timeout

    if (pfd.revents & (POLLHUP | POLLERR)) {
      close();
      return std::nullopt;
    }

    if (pfd.revents & POLLIN) {
      ssize_t n = ::read(fd_, temp, sizeof(temp));
      if (n > 0) {
        rx_buffer_.append(temp, static_cast<std::size_t>(n));
      } else if (n == 0) { // EOF / disconnect
        close();
        return std::nullopt;
      } else if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        continue;
      } else {
        std::cerr << "read: " << strerror(errno) << '\n';
        return std::nullopt;
      }

      if (auto line = takeLine())
        return line;
    }
  }
  return std::nullopt; // timeout/partial
}

std::optional<std::string> SerialChannel::takeLine() {
  while (true) {
    const auto pos = rx_buffer_.find('\n');
    if (pos == std::string::npos) {
      if (rx_buffer_.size() > kMaxLineBytes) {
        std::cerr << "[SerialChannel] line exceeds " << kMaxLineBytes << " bytes, discarded\n";
        rx_buffer_.clear();
        discarding_ = true;
      }
      return std::nullopt;
    }

    std::string line = rx_buffer_.substr(0, pos);
    rx_buffer_.erase(0, pos + 1);
    if (std::exchange(discarding_, false))
      continue; // tail of the oversized line
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    return line;
  }
}

void SerialChannel::close() {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
  rx_buffer_.clear();
  discarding_ = false;
}
