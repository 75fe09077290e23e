#include "wiiproxy/MSPDispatcher.hpp"

#include <thread>
#include <utility>

#include <rclcpp/rclcpp.hpp>

namespace wiiproxy {

namespace {
rclcpp::Logger logger() { return rclcpp::get_logger("wiiproxy.dispatcher"); }

// upper bound on reads per drain so a chattering link cannot stall a submit
constexpr int kMaxDrainReads = 32;
}

Dispatcher::Dispatcher(Transport& transport, const DispatcherConfig& cfg)
: transport_(transport), cfg_(cfg), rx_buf_(cfg.read_chunk_size ? cfg.read_chunk_size : 64) {
  if (!(cfg_.write_delay_s >= 0.0 && cfg_.write_delay_s <= kMaxTimeoutS)) {
    RCLCPP_WARN(logger(), "write delay %f s out of range, using 0", cfg_.write_delay_s);
    cfg_.write_delay_s = 0.0;
  }
}

Status Dispatcher::request(uint8_t cmd, const std::vector<uint8_t>& payload,
                           std::vector<uint8_t>& out, double timeout_s) {
  Status st = submit(cmd, payload);
  if (st != Status::Ok) return st;
  return awaitResponse(cmd, out, timeout_s);
}

Status Dispatcher::submit(uint8_t cmd, const std::vector<uint8_t>& payload) {
  if (pending_.count(cmd)) {
    RCLCPP_WARN(logger(), "%s (%d) already in flight", commandName(cmd), cmd);
    return Status::RequestAlreadyInFlight;
  }

  if (cfg_.drain_before_submit) {
    Status st = drainInput();
    if (st != Status::Ok) return st;
  }
  consecutive_checksum_errors_ = 0;

  Status st = writeFrame(cmd, payload);
  if (st != Status::Ok) return st;

  PendingRequest p;
  p.cmd = cmd;
  p.submitted_at = Clock::now();
  pending_.emplace(cmd, std::move(p));
  return Status::Ok;
}

Status Dispatcher::awaitResponse(uint8_t cmd, std::vector<uint8_t>& out, double timeout_s) {
  if (!pending_.count(cmd)) return Status::NoPendingRequest;

  // NaN fails both comparisons
  if (!(timeout_s > 0.0)) timeout_s = 0.0;
  else if (timeout_s > kMaxTimeoutS) timeout_s = kMaxTimeoutS;

  const auto deadline = Clock::now() +
      std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(timeout_s));
  std::vector<FrameEvent> events;

  while (true) {
    auto it = pending_.find(cmd);
    if (it->second.resolved) {
      const Status result = it->second.result;
      out = std::move(it->second.payload);
      pending_.erase(it);
      if (result == Status::CommandRejected)
        RCLCPP_WARN(logger(), "%s (%d) rejected by firmware", commandName(cmd), cmd);
      return result;
    }

    const auto now = Clock::now();
    if (now >= deadline) {
      if (it->second.has_provisional) {
        // no second reply came, so the held one was this request's own
        const Status result = it->second.result;
        out = std::move(it->second.payload);
        pending_.erase(it);
        RCLCPP_DEBUG(logger(), "%s (%d) answered by the held reply", commandName(cmd), cmd);
        if (result == Status::CommandRejected)
          RCLCPP_WARN(logger(), "%s (%d) rejected by firmware", commandName(cmd), cmd);
        return result;
      }
      pending_.erase(it);
      tombstone(cmd);
      RCLCPP_WARN(logger(), "%s (%d) timed out after %.3f s", commandName(cmd), cmd, timeout_s);
      return Status::Timeout;
    }

    const double remaining = std::chrono::duration<double>(deadline - now).count();
    size_t got = 0;
    Status st = transport_.read(rx_buf_.data(), rx_buf_.size(), remaining, got);
    if (st != Status::Ok) {
      pending_.erase(cmd);
      RCLCPP_ERROR(logger(), "transport read failed while waiting for %s: %s",
                   commandName(cmd), statusToString(st));
      return st;
    }
    if (got == 0) continue;

    events.clear();
    deframer_.feed(rx_buf_.data(), got, events);
    if (dispatch(events)) {
      pending_.erase(cmd);
      RCLCPP_ERROR(logger(), "%zu consecutive checksum errors while waiting for %s, link desynchronized",
                   consecutive_checksum_errors_, commandName(cmd));
      consecutive_checksum_errors_ = 0;
      deframer_.reset();
      return Status::TransportDesync;
    }
  }
}

Status Dispatcher::post(uint8_t cmd, const std::vector<uint8_t>& payload) {
  if (pending_.count(cmd)) return Status::RequestAlreadyInFlight;
  return writeFrame(cmd, payload);
}

void Dispatcher::cancel(uint8_t cmd) {
  if (pending_.erase(cmd)) tombstone(cmd);
}

void Dispatcher::cancelAll() {
  for (const auto& kv : pending_) tombstone(kv.first);
  pending_.clear();
}

void Dispatcher::reset() {
  pending_.clear();
  stale_.clear();
  deframer_.reset();
  consecutive_checksum_errors_ = 0;
}

Status Dispatcher::writeFrame(uint8_t cmd, const std::vector<uint8_t>& payload) {
  std::vector<uint8_t> frame;
  Status st = buildFrame(cmd, payload, frame);
  if (st != Status::Ok) return st;

  paceWrite();
  size_t off = 0;
  while (off < frame.size()) {
    size_t written = 0;
    st = transport_.write(frame.data() + off, frame.size() - off, written);
    if (st != Status::Ok) {
      RCLCPP_ERROR(logger(), "transport write failed for %s: %s", commandName(cmd), statusToString(st));
      return st;
    }
    if (written == 0) {
      RCLCPP_ERROR(logger(), "transport accepted no bytes for %s", commandName(cmd));
      return Status::IoError;
    }
    off += written;
  }
  last_write_ = Clock::now();
  has_written_ = true;
  RCLCPP_DEBUG(logger(), "sent %s (%d), %zu payload bytes", commandName(cmd), cmd, payload.size());
  return Status::Ok;
}

void Dispatcher::paceWrite() {
  if (!has_written_ || cfg_.write_delay_s <= 0.0) return;
  std::this_thread::sleep_until(last_write_ +
      std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(cfg_.write_delay_s)));
}

Status Dispatcher::drainInput() {
  std::vector<FrameEvent> events;
  for (int i = 0; i < kMaxDrainReads; ++i) {
    size_t got = 0;
    Status st = transport_.read(rx_buf_.data(), rx_buf_.size(), 0.0, got);
    if (st != Status::Ok) return st;
    if (got == 0) break;
    events.clear();
    deframer_.feed(rx_buf_.data(), got, events);
    dispatch(events);
  }
  return Status::Ok;
}

bool Dispatcher::dispatch(std::vector<FrameEvent>& events) {
  bool desync = false;
  for (auto& ev : events) {
    if (ev.kind == FrameEvent::Kind::ChecksumError) {
      ++consecutive_checksum_errors_;
      RCLCPP_WARN(logger(), "checksum error on frame for cmd %d (%zu in a row)",
                  ev.cmd, consecutive_checksum_errors_);
      if (consecutive_checksum_errors_ > cfg_.desync_threshold) desync = true;
      continue;
    }
    consecutive_checksum_errors_ = 0;

    auto it = pending_.find(ev.cmd);
    const bool waiting = it != pending_.end() && !it->second.resolved;
    const bool maybe_late = consumeTombstone(ev.cmd);
    if (!waiting) {
      RCLCPP_DEBUG(logger(), "dropping %s %s (%d), %zu bytes", maybe_late ? "late" : "unsolicited",
                   commandName(ev.cmd), ev.cmd, ev.payload.size());
      continue;
    }

    PendingRequest& p = it->second;
    if (ev.kind == FrameEvent::Kind::ErrorReply) {
      p.result = Status::CommandRejected;
      p.payload.clear();
    } else {
      p.result = Status::Ok;
      p.payload = std::move(ev.payload);
    }
    if (maybe_late) {
      // may answer the earlier timed-out request; a later reply replaces it
      p.has_provisional = true;
      RCLCPP_DEBUG(logger(), "holding possibly late reply for %s", commandName(ev.cmd));
      continue;
    }
    p.resolved = true;
  }
  return desync;
}

bool Dispatcher::consumeTombstone(uint8_t cmd) {
  auto it = stale_.find(cmd);
  if (it == stale_.end()) return false;
  const bool live = Clock::now() < it->second;
  stale_.erase(it);
  return live;
}

void Dispatcher::tombstone(uint8_t cmd) {
  if (cfg_.stale_reply_window_s <= 0) return;
  stale_[cmd] = Clock::now() +
      std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(cfg_.stale_reply_window_s));
}

} // namespace wiiproxy
