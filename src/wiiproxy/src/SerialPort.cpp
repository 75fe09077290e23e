#include "wiiproxy/SerialPort.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <termios.h>
#include <sys/select.h>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <thread>

#include <rclcpp/rclcpp.hpp>

namespace wiiproxy {

namespace {
rclcpp::Logger logger() { return rclcpp::get_logger("wiiproxy.serial"); }
}

SerialPort::SerialPort(const std::string& device, int baud)
: dev_(device), baud_(baud) {}

SerialPort::~SerialPort() { close(); }

bool SerialPort::open() {
  if (fd_ >= 0) return true;
  fd_ = ::open(dev_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd_ < 0) {
    RCLCPP_ERROR(logger(), "open(%s) failed: %s", dev_.c_str(), std::strerror(errno));
    return false;
  }

  termios tio{};
  if (tcgetattr(fd_, &tio) != 0) {
    RCLCPP_ERROR(logger(), "tcgetattr(%s) failed: %s", dev_.c_str(), std::strerror(errno));
    ::close(fd_); fd_ = -1;
    return false;
  }

  cfmakeraw(&tio);
  tio.c_cflag |= (CLOCAL | CREAD);
  tio.c_cflag &= ~CRTSCTS;
  tio.c_cc[VMIN] = 0;
  tio.c_cc[VTIME] = 0;

  speed_t spd = B115200;
  switch (baud_) {
    case 9600: spd = B9600; break;
    case 19200: spd = B19200; break;
    case 38400: spd = B38400; break;
    case 57600: spd = B57600; break;
    case 115200: spd = B115200; break;
    case 230400: spd = B230400; break;
    case 460800: spd = B460800; break;
    case 921600: spd = B921600; break;
    default:
      RCLCPP_WARN(logger(), "Unsupported baud %d, using 115200", baud_);
      spd = B115200;
      break;
  }

  cfsetispeed(&tio, spd);
  cfsetospeed(&tio, spd);

  if (tcsetattr(fd_, TCSANOW, &tio) != 0) {
    RCLCPP_ERROR(logger(), "tcsetattr(%s) failed: %s", dev_.c_str(), std::strerror(errno));
    ::close(fd_); fd_ = -1;
    return false;
  }

  // Drain any junk bytes
  drainInput(0.15);
  RCLCPP_INFO(logger(), "Opened %s @ %d", dev_.c_str(), baud_);
  return true;
}

void SerialPort::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

bool SerialPort::isOpen() const { return fd_ >= 0; }

Status SerialPort::write(const uint8_t* data, size_t n, size_t& written) {
  written = 0;
  if (fd_ < 0) return Status::IoError;
  while (written < n) {
    ssize_t w = ::write(fd_, data + written, n - written);
    if (w < 0) {
      if (errno == EAGAIN || errno == EINTR) continue;
      RCLCPP_ERROR(logger(), "write(%s) failed: %s", dev_.c_str(), std::strerror(errno));
      return Status::IoError;
    }
    written += (size_t)w;
  }
  return Status::Ok;
}

Status SerialPort::read(uint8_t* buf, size_t max, double timeout_s, size_t& received) {
  received = 0;
  if (fd_ < 0) return Status::IoError;

  fd_set rfds;
  FD_ZERO(&rfds);
  FD_SET(fd_, &rfds);

  if (timeout_s < 0) timeout_s = 0;
  timeval tv{};
  tv.tv_sec  = (int)timeout_s;
  tv.tv_usec = (int)((timeout_s - (int)timeout_s) * 1e6);

  int ret = select(fd_ + 1, &rfds, nullptr, nullptr, &tv);
  if (ret == 0) return Status::Ok;
  if (ret < 0) {
    if (errno == EINTR) return Status::Ok;
    RCLCPP_ERROR(logger(), "select(%s) failed: %s", dev_.c_str(), std::strerror(errno));
    return Status::IoError;
  }
  ssize_t r = ::read(fd_, buf, max);
  if (r < 0) {
    if (errno == EAGAIN || errno == EINTR) return Status::Ok;
    RCLCPP_ERROR(logger(), "read(%s) failed: %s", dev_.c_str(), std::strerror(errno));
    return Status::IoError;
  }
  if (r == 0) {
    // readable but no data: the device went away
    RCLCPP_ERROR(logger(), "%s closed by peer", dev_.c_str());
    return Status::IoError;
  }
  received = (size_t)r;
  return Status::Ok;
}

void SerialPort::drainInput(double seconds) {
  auto t0 = std::chrono::steady_clock::now();
  uint8_t tmp[256];
  while (std::chrono::steady_clock::now() - t0 < std::chrono::duration<double>(seconds)) {
    ssize_t r = ::read(fd_, tmp, sizeof(tmp));
    if (r <= 0) {
      // sleep a tiny bit to avoid busy loop
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
  }
  tcflush(fd_, TCIFLUSH);
}

} // namespace wiiproxy
