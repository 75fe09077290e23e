#include "wiiproxy/MSPFrame.hpp"

#include <utility>

namespace wiiproxy {

uint8_t checksumV1(uint8_t size, uint8_t cmd, const uint8_t* p, size_t n) {
  uint8_t c = size ^ cmd;
  for (size_t i = 0; i < n; ++i) c ^= p[i];
  return c;
}

Status buildFrame(uint8_t cmd, const std::vector<uint8_t>& payload, std::vector<uint8_t>& out,
                  uint8_t direction) {
  if (payload.size() > 255) return Status::PayloadTooLarge;
  const uint8_t size = static_cast<uint8_t>(payload.size());
  std::vector<uint8_t> buf;
  buf.reserve(3 + 2 + payload.size() + 1);
  buf.push_back(kPreamble1); buf.push_back(kPreamble2); buf.push_back(direction);
  buf.push_back(size); buf.push_back(cmd);
  buf.insert(buf.end(), payload.begin(), payload.end());
  buf.push_back(checksumV1(size, cmd, payload.data(), payload.size()));
  out = std::move(buf);
  return Status::Ok;
}

void Deframer::reset() {
  state_ = State::AwaitPreamble1;
  error_frame_ = false;
  size_ = cmd_ = cksum_ = 0;
  payload_.clear();
}

std::vector<FrameEvent> Deframer::feed(const std::vector<uint8_t>& bytes) {
  std::vector<FrameEvent> events;
  feed(bytes.data(), bytes.size(), events);
  return events;
}

void Deframer::feed(const uint8_t* data, size_t n, std::vector<FrameEvent>& events) {
  for (size_t i = 0; i < n; ++i) feedByte(data[i], events);
}

void Deframer::feedByte(uint8_t b, std::vector<FrameEvent>& events) {
  switch (state_) {
    case State::AwaitPreamble1:
      if (b == kPreamble1) state_ = State::AwaitPreamble2;
      else ++counters_.discarded_bytes;
      break;
    case State::AwaitPreamble2:
      if (b == kPreamble2) {
        state_ = State::AwaitDirection;
      } else {
        // the rejected byte may itself start the next frame
        ++counters_.discarded_bytes;
        state_ = State::AwaitPreamble1;
        feedByte(b, events);
      }
      break;
    case State::AwaitDirection:
      if (b == direction_ || b == kDirError) {
        error_frame_ = (b == kDirError);
        state_ = State::AwaitLength;
      } else {
        counters_.discarded_bytes += 2;
        state_ = State::AwaitPreamble1;
        feedByte(b, events);
      }
      break;
    case State::AwaitLength:
      size_ = b; cksum_ = b; payload_.clear();
      state_ = State::AwaitCommand;
      break;
    case State::AwaitCommand:
      cmd_ = b; cksum_ ^= b;
      state_ = (size_ == 0) ? State::AwaitChecksum : State::AwaitPayload;
      break;
    case State::AwaitPayload:
      payload_.push_back(b); cksum_ ^= b;
      if (payload_.size() == size_) state_ = State::AwaitChecksum;
      break;
    case State::AwaitChecksum:
      finish(b, events);
      break;
  }
}

void Deframer::finish(uint8_t received, std::vector<FrameEvent>& events) {
  FrameEvent ev;
  ev.cmd = cmd_;
  if (received != cksum_) {
    ev.kind = FrameEvent::Kind::ChecksumError;
    ++counters_.checksum_errors;
  } else if (error_frame_) {
    ev.kind = FrameEvent::Kind::ErrorReply;
    ++counters_.error_replies;
  } else {
    ev.kind = FrameEvent::Kind::FrameReady;
    ev.payload = std::move(payload_);
    ++counters_.frames;
  }
  events.push_back(std::move(ev));
  reset();
}

} // namespace wiiproxy
