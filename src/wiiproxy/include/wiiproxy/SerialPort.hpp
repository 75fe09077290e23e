#pragma once
#include <string>

#include "wiiproxy/Transport.hpp"

namespace wiiproxy {

// POSIX serial port in raw 8N1 mode.
class SerialPort : public Transport {
public:
  SerialPort(const std::string& device, int baud);
  ~SerialPort() override;

  bool open() override;
  void close() override;
  bool isOpen() const override;

  Status write(const uint8_t* data, size_t n, size_t& written) override;
  Status read(uint8_t* buf, size_t max, double timeout_s, size_t& received) override;

  const std::string& device() const { return dev_; }
  int baud() const { return baud_; }

private:
  void drainInput(double seconds);

  std::string dev_;
  int baud_;
  int fd_ = -1;
};

} // namespace wiiproxy
