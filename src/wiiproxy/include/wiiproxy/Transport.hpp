#pragma once
#include <cstddef>
#include <cstdint>

#include "wiiproxy/MSPStatus.hpp"

namespace wiiproxy {

// Byte-stream provider the engine talks through. Implementations report failures as
// Status::IoError; a read that times out without data is Ok with received == 0.
class Transport {
public:
  virtual ~Transport() {}

  virtual bool open() = 0;
  virtual void close() = 0;
  virtual bool isOpen() const = 0;

  // Writes up to n bytes; 'written' receives the count actually written.
  virtual Status write(const uint8_t* data, size_t n, size_t& written) = 0;

  // Waits at most timeout_s for data and reads up to max bytes (may return fewer, or none).
  virtual Status read(uint8_t* buf, size_t max, double timeout_s, size_t& received) = 0;
};

} // namespace wiiproxy
