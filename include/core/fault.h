#pragma once

#include <stdint.h>
#include <string>

enum class FaultKind : uint8_t {
  NONE = 0,
  CONNECTIVITY = 1,   // transport exhausted retries, PQI check failed
  CONFIGURATION = 2,  // bad port/channel/valve, uncalibrated sensor
  SCRIPT = 3          // a compiled script line failed
};

struct Fault {
  FaultKind kind {FaultKind::NONE};
  const char* reason {""};  // short machine-readable string
  std::string detail;       // human-readable message

  bool ok() const { return kind == FaultKind::NONE; }
  void clear() {
    kind = FaultKind::NONE;
    reason = "";
    detail.clear();
  }
};

inline const char* to_str(FaultKind kind) {
  switch (kind) {
    case FaultKind::NONE: return "NONE";
    case FaultKind::CONNECTIVITY: return "CONNECTIVITY";
    case FaultKind::CONFIGURATION: return "CONFIGURATION";
    case FaultKind::SCRIPT: return "SCRIPT";
    default: return "UNKNOWN";
  }
}

// Fills *fault (when non-null) and returns false so call sites can `return raise_fault(...)`.
bool raise_fault(Fault* fault, FaultKind kind, const char* reason, const char* fmt, ...)
  __attribute__((format(printf, 4, 5)));
