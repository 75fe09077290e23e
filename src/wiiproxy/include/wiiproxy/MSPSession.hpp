#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include "wiiproxy/MSPCodec.hpp"
#include "wiiproxy/MSPCommands.hpp"
#include "wiiproxy/MSPDispatcher.hpp"
#include "wiiproxy/MSPMessages.hpp"
#include "wiiproxy/MSPStatus.hpp"
#include "wiiproxy/Transport.hpp"

namespace wiiproxy {

struct SessionConfig {
  DispatcherConfig dispatcher;
  double default_timeout_s = 0.5;
};

// The engine a facade talks to. Owns the transport and the dispatcher; every public call
// takes the same lock, so concurrent callers queue and never interleave frames on the wire.
class Session {
public:
  explicit Session(std::unique_ptr<Transport> transport, const SessionConfig& cfg = SessionConfig());
  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  // Idempotent. IoError if the transport cannot be opened.
  Status open();
  // Idempotent. Cancels pending requests and closes the transport.
  void close();
  bool isOpen() const;

  // Raw exchange, payload bytes in and out.
  Status request(uint8_t cmd, const std::vector<uint8_t>& payload, std::vector<uint8_t>& out,
                 double timeout_s);

  // GET: empty request, typed reply.
  template <class Resp>
  Status get(uint8_t cmd, Resp& out) { return get(cmd, out, cfg_.default_timeout_s); }
  template <class Resp>
  Status get(uint8_t cmd, Resp& out, double timeout_s) {
    return query(cmd, Empty(), out, timeout_s);
  }

  // SET: typed request, empty ack.
  template <class Req>
  Status set(uint8_t cmd, const Req& value) { return set(cmd, value, cfg_.default_timeout_s); }
  template <class Req>
  Status set(uint8_t cmd, const Req& value, double timeout_s) {
    Empty ack;
    return query(cmd, value, ack, timeout_s);
  }

  // Typed request and typed reply (MSP_WP).
  template <class Req, class Resp>
  Status query(uint8_t cmd, const Req& req, Resp& out, double timeout_s) {
    std::lock_guard<std::mutex> lk(io_mtx_);
    if (!open_) return Status::SessionClosed;
    return dispatcher_.request(cmd, req, out, timeout_s);
  }

  // Parameterless action (calibration, EEPROM write, ...).
  Status action(uint8_t cmd) { return action(cmd, cfg_.default_timeout_s); }
  Status action(uint8_t cmd, double timeout_s) { return set(cmd, Empty(), timeout_s); }

  // Fire and forget: typed request, no reply awaited.
  template <class Req>
  Status send(uint8_t cmd, const Req& value) {
    const CommandDescriptor* desc = lookupCommand(cmd);
    if (!desc) return Status::UnknownCommand;
    std::vector<uint8_t> payload;
    Status st = encode(*desc, value, payload);
    if (st != Status::Ok) return st;
    std::lock_guard<std::mutex> lk(io_mtx_);
    if (!open_) return Status::SessionClosed;
    return dispatcher_.post(cmd, payload);
  }

  const SessionConfig& config() const { return cfg_; }
  Deframer::Counters counters() const;

private:
  std::unique_ptr<Transport> transport_;
  SessionConfig cfg_;
  Dispatcher dispatcher_;
  bool open_ = false;
  mutable std::mutex io_mtx_;
};

} // namespace wiiproxy
