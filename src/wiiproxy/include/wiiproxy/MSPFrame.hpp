#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "wiiproxy/MSPStatus.hpp"

// MSP v1 framing: $M<  size cmd payload checksum
namespace wiiproxy {

constexpr uint8_t kPreamble1 = '$';
constexpr uint8_t kPreamble2 = 'M';
constexpr uint8_t kDirToFirmware = '<';
constexpr uint8_t kDirFromFirmware = '>';
constexpr uint8_t kDirError = '!';

// XOR of size, cmd and every payload byte
uint8_t checksumV1(uint8_t size, uint8_t cmd, const uint8_t* p, size_t n);

// Builds a complete frame. PayloadTooLarge when the payload exceeds 255 bytes.
Status buildFrame(uint8_t cmd, const std::vector<uint8_t>& payload, std::vector<uint8_t>& out,
                  uint8_t direction = kDirToFirmware);

struct FrameEvent {
  enum class Kind : uint8_t {
    FrameReady,     // checksum-valid frame
    ChecksumError,  // frame dropped, checksum mismatch
    ErrorReply,     // checksum-valid '!' frame: firmware refused cmd
  };
  Kind kind;
  uint8_t cmd;
  std::vector<uint8_t> payload;

  bool operator==(const FrameEvent& o) const {
    return kind == o.kind && cmd == o.cmd && payload == o.payload;
  }
};

// Incremental MSP v1 decoder. Bytes may be fed in chunks of any size; the state carries
// over between calls, so feeding a stream piecewise yields the same events as feeding it
// in one piece. Unexpected preamble/direction bytes resynchronize instead of failing.
class Deframer {
public:
  enum class State : uint8_t {
    AwaitPreamble1, AwaitPreamble2, AwaitDirection, AwaitLength,
    AwaitCommand, AwaitPayload, AwaitChecksum,
  };

  struct Counters {
    uint64_t frames = 0;
    uint64_t checksum_errors = 0;
    uint64_t error_replies = 0;
    uint64_t discarded_bytes = 0;
  };

  explicit Deframer(uint8_t direction = kDirFromFirmware) : direction_(direction) {}

  // Appends the events produced by 'n' bytes to 'events'
  void feed(const uint8_t* data, size_t n, std::vector<FrameEvent>& events);
  std::vector<FrameEvent> feed(const std::vector<uint8_t>& bytes);

  void reset();
  State state() const { return state_; }
  const Counters& counters() const { return counters_; }

private:
  void feedByte(uint8_t b, std::vector<FrameEvent>& events);
  void finish(uint8_t received, std::vector<FrameEvent>& events);

  uint8_t direction_;
  State state_ = State::AwaitPreamble1;
  bool error_frame_ = false;
  uint8_t size_ = 0;
  uint8_t cmd_ = 0;
  uint8_t cksum_ = 0;
  std::vector<uint8_t> payload_;
  Counters counters_;
};

} // namespace wiiproxy
