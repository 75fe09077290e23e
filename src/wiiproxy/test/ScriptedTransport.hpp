#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <deque>
#include <functional>
#include <thread>
#include <vector>

#include "wiiproxy/MSPFrame.hpp"
#include "wiiproxy/Transport.hpp"

namespace wiiproxy {
namespace test {

inline std::vector<uint8_t> reply(uint8_t cmd, const std::vector<uint8_t>& payload) {
  std::vector<uint8_t> f;
  buildFrame(cmd, payload, f, kDirFromFirmware);
  return f;
}

inline std::vector<uint8_t> corrupted(uint8_t cmd, const std::vector<uint8_t>& payload) {
  std::vector<uint8_t> f = reply(cmd, payload);
  f.back() ^= 0x5A;
  return f;
}

// In-memory transport: reads hand out queued chunks in order, writes are recorded.
class ScriptedTransport : public Transport {
public:
  bool open() override {
    ++open_calls;
    if (fail_open) return false;
    open_ = true;
    return true;
  }
  void close() override {
    ++close_calls;
    open_ = false;
  }
  bool isOpen() const override { return open_; }

  Status write(const uint8_t* data, size_t n, size_t& written) override {
    Guard g(*this);
    written = 0;
    if (fail_write) return Status::IoError;
    tx.insert(tx.end(), data, data + n);
    ++writes;
    written = n;
    if (on_write) on_write(std::vector<uint8_t>(data, data + n));
    return Status::Ok;
  }

  Status read(uint8_t* buf, size_t max, double timeout_s, size_t& received) override {
    Guard g(*this);
    received = 0;
    ++reads;
    if (fail_read) return Status::IoError;
    if (chunks.empty()) {
      if (timeout_s > 0)
        std::this_thread::sleep_for(std::chrono::duration<double>(std::min(timeout_s, 0.002)));
      return Status::Ok;
    }
    std::vector<uint8_t>& front = chunks.front();
    received = std::min(max, front.size());
    std::memcpy(buf, front.data(), received);
    if (received == front.size()) chunks.pop_front();
    else front.erase(front.begin(), front.begin() + received);
    return Status::Ok;
  }

  void push(const std::vector<uint8_t>& bytes) { chunks.push_back(bytes); }

  std::deque<std::vector<uint8_t>> chunks;
  std::vector<uint8_t> tx;
  std::function<void(const std::vector<uint8_t>&)> on_write;
  bool fail_open = false;
  bool fail_write = false;
  bool fail_read = false;
  int open_calls = 0;
  int close_calls = 0;
  int writes = 0;
  int reads = 0;
  std::atomic<int> max_concurrency{0};

private:
  // records how many callers are inside the transport at once
  struct Guard {
    explicit Guard(ScriptedTransport& t) : t_(t) {
      const int now = ++t_.active_;
      int prev = t_.max_concurrency.load();
      while (now > prev && !t_.max_concurrency.compare_exchange_weak(prev, now)) {}
    }
    ~Guard() { --t_.active_; }
    ScriptedTransport& t_;
  };

  bool open_ = false;
  std::atomic<int> active_{0};
};

} // namespace test
} // namespace wiiproxy
