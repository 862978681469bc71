#pragma once

#include <stdint.h>

#include <atomic>

#include "core/clock.h"
#include "core/device.h"
#include "core/log.h"

// Polls `read` every period_ms and hands each result to `callback`. A failed read is
// reported as an invalid Reading and polling continues. Stops when `cancel` is set or
// `duration_s` (> 0) has elapsed.
template <typename ReadFn, typename Callback>
void run_monitor(uint32_t period_ms, float duration_s, const std::atomic<bool>* cancel,
                 ReadFn read, Callback callback) {
  const uint32_t start_ms = millis_now();
  const uint32_t duration_ms = duration_s > 0 ? static_cast<uint32_t>(duration_s * 1000.0f) : 0;

  while (true) {
    Reading reading;
    Fault fault;
    if (!read(reading, &fault)) {
      LOGD("monitor", "read failed: %s", fault.detail.c_str());
      reading = Reading{};
    }
    callback(reading);

    if (cancel && cancel->load()) break;
    if (duration_ms > 0 && millis_now() - start_ms >= duration_ms) break;

    if (!delay_ms_cancellable(period_ms, cancel)) return;
  }
}
