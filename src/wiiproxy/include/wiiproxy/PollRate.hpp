#pragma once
#include <chrono>
#include <cmath>

namespace wiiproxy {

// Rates a millisecond wall timer can honour
constexpr double kMinPollHz = 0.001;
constexpr double kMaxPollHz = 1000.0;

// Timer period for a polling rate in Hz. False for NaN, infinite or out-of-range rates.
inline bool pollPeriod(double hz, std::chrono::milliseconds& period) {
  if (!std::isfinite(hz) || hz < kMinPollHz || hz > kMaxPollHz) return false;
  period = std::chrono::milliseconds(std::llround(1000.0 / hz));
  return true;
}

} // namespace wiiproxy
