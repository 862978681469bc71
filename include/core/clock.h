#pragma once

#include <stdint.h>

#include <atomic>
#include <chrono>
#include <thread>

// Monotonic millisecond tick, wraps like the firmware millis().
inline uint32_t millis_now() {
  using namespace std::chrono;
  return static_cast<uint32_t>(
    duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

inline void delay_ms(uint32_t ms) {
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

// Sleeps in short slices; returns false as soon as `cancel` is set.
inline bool delay_ms_cancellable(uint32_t ms, const std::atomic<bool>* cancel) {
  constexpr uint32_t SLICE_MS = 25;
  uint32_t slept = 0;
  while (slept < ms) {
    if (cancel && cancel->load()) return false;
    const uint32_t step = (ms - slept) < SLICE_MS ? (ms - slept) : SLICE_MS;
    delay_ms(step);
    slept += step;
  }
  return !(cancel && cancel->load());
}
