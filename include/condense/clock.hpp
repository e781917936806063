#pragma once

#include <chrono>
#include <cstdint>

namespace condense {

/**
 * Injectable monotonic clock.
 * The pipeline reads time only through this interface so deadlines can be
 * driven deterministically in tests.
 */
class Clock {
 public:
  virtual ~Clock() = default;
  virtual uint64_t NowMicros() const = 0;
};

/** Steady clock (default behavior). */
class RealClock : public Clock {
 public:
  uint64_t NowMicros() const override {
    using namespace std::chrono;
    return static_cast<uint64_t>(
        duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count());
  }
};

}  // namespace condense
