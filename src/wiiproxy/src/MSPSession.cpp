#include "wiiproxy/MSPSession.hpp"

#include <stdexcept>
#include <utility>

#include <rclcpp/rclcpp.hpp>

namespace wiiproxy {

namespace {
rclcpp::Logger logger() { return rclcpp::get_logger("wiiproxy.session"); }

Transport& checked(const std::unique_ptr<Transport>& t) {
  if (!t) throw std::invalid_argument("Session requires a transport");
  return *t;
}
}

Session::Session(std::unique_ptr<Transport> transport, const SessionConfig& cfg)
: transport_(std::move(transport)), cfg_(cfg), dispatcher_(checked(transport_), cfg.dispatcher) {}

Session::~Session() { close(); }

Status Session::open() {
  std::lock_guard<std::mutex> lk(io_mtx_);
  if (open_) return Status::Ok;
  if (!transport_->open()) {
    RCLCPP_ERROR(logger(), "transport failed to open");
    return Status::IoError;
  }
  dispatcher_.reset();
  open_ = true;
  RCLCPP_INFO(logger(), "session opened");
  return Status::Ok;
}

void Session::close() {
  std::lock_guard<std::mutex> lk(io_mtx_);
  if (!open_) return;
  if (dispatcher_.pendingCount())
    RCLCPP_WARN(logger(), "closing with %zu pending request(s)", dispatcher_.pendingCount());
  dispatcher_.reset();
  transport_->close();
  open_ = false;
  RCLCPP_INFO(logger(), "session closed");
}

bool Session::isOpen() const {
  std::lock_guard<std::mutex> lk(io_mtx_);
  return open_;
}

Status Session::request(uint8_t cmd, const std::vector<uint8_t>& payload,
                        std::vector<uint8_t>& out, double timeout_s) {
  std::lock_guard<std::mutex> lk(io_mtx_);
  if (!open_) return Status::SessionClosed;
  return dispatcher_.request(cmd, payload, out, timeout_s);
}

Deframer::Counters Session::counters() const {
  std::lock_guard<std::mutex> lk(io_mtx_);
  return dispatcher_.counters();
}

} // namespace wiiproxy
