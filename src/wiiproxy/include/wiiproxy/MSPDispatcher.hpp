#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <vector>

#include "wiiproxy/MSPCodec.hpp"
#include "wiiproxy/MSPCommands.hpp"
#include "wiiproxy/MSPFrame.hpp"
#include "wiiproxy/MSPStatus.hpp"
#include "wiiproxy/Transport.hpp"

namespace wiiproxy {

struct DispatcherConfig {
  // consecutive checksum errors tolerated while waiting; one more is TransportDesync
  size_t desync_threshold = 8;
  size_t read_chunk_size = 64;
  // After a timeout or cancel, the first reply for that code inside this window is treated
  // as possibly late: a waiting request holds it and prefers a second reply (0 = off).
  double stale_reply_window_s = 0.5;
  // feed input already waiting on the transport through the deframer before each write
  bool drain_before_submit = true;
  // minimum spacing between two frame writes; negative values are treated as 0
  double write_delay_s = 0.0;
};

// Longest wait awaitResponse honours; larger, infinite or NaN timeouts are clamped.
constexpr double kMaxTimeoutS = 3600.0;

// Correlates requests with replies over one transport. Not thread-safe: Session serializes.
class Dispatcher {
public:
  explicit Dispatcher(Transport& transport, const DispatcherConfig& cfg = DispatcherConfig());

  // submit + awaitResponse
  Status request(uint8_t cmd, const std::vector<uint8_t>& payload,
                 std::vector<uint8_t>& out, double timeout_s);

  // Typed request: encodes 'req' with the registry schema of 'cmd', decodes the reply into 'resp'.
  template <class Req, class Resp>
  Status request(uint8_t cmd, const Req& req, Resp& resp, double timeout_s) {
    const CommandDescriptor* desc = lookupCommand(cmd);
    if (!desc) return Status::UnknownCommand;
    std::vector<uint8_t> payload;
    Status st = encode(*desc, req, payload);
    if (st != Status::Ok) return st;
    std::vector<uint8_t> raw;
    st = request(cmd, payload, raw, timeout_s);
    if (st != Status::Ok) return st;
    return decode(*desc, raw, resp);
  }

  // Writes the request and registers it as pending. RequestAlreadyInFlight (nothing written)
  // if 'cmd' is already pending.
  Status submit(uint8_t cmd, const std::vector<uint8_t>& payload);

  // Reads until the reply for a pending 'cmd' arrives or timeout_s elapses. The pending
  // request is removed whatever the outcome. A reply that may belong to an earlier timed-out
  // request is held; it is returned at the deadline unless a second reply replaces it.
  Status awaitResponse(uint8_t cmd, std::vector<uint8_t>& out, double timeout_s);

  // Writes a frame without expecting a reply (MultiWii does not ack MSP_SET_RAW_RC).
  Status post(uint8_t cmd, const std::vector<uint8_t>& payload);

  void cancel(uint8_t cmd);
  void cancelAll();
  // drops pending requests, tombstones and any partial frame
  void reset();

  bool isPending(uint8_t cmd) const { return pending_.count(cmd) != 0; }
  size_t pendingCount() const { return pending_.size(); }
  size_t consecutiveChecksumErrors() const { return consecutive_checksum_errors_; }
  const Deframer::Counters& counters() const { return deframer_.counters(); }
  const DispatcherConfig& config() const { return cfg_; }

private:
  using Clock = std::chrono::steady_clock;

  struct PendingRequest {
    uint8_t cmd = 0;
    Clock::time_point submitted_at;
    bool resolved = false;
    bool has_provisional = false;
    Status result = Status::Ok;
    std::vector<uint8_t> payload;
  };

  Status writeFrame(uint8_t cmd, const std::vector<uint8_t>& payload);
  void paceWrite();
  Status drainInput();
  // Routes events to pending requests. Returns true when the checksum error run
  // has exceeded the desync threshold.
  bool dispatch(std::vector<FrameEvent>& events);
  bool consumeTombstone(uint8_t cmd);
  void tombstone(uint8_t cmd);

  Transport& transport_;
  DispatcherConfig cfg_;
  Deframer deframer_;
  std::vector<uint8_t> rx_buf_;
  std::map<uint8_t, PendingRequest> pending_;
  std::map<uint8_t, Clock::time_point> stale_;
  size_t consecutive_checksum_errors_ = 0;
  Clock::time_point last_write_;
  bool has_written_ = false;
};

} // namespace wiiproxy
