#pragma once

#include <stddef.h>
#include <stdint.h>

#include <mutex>

enum class HealthStatus : uint8_t {
  UNCONFIGURED = 0,
  MISSING      = 1,
  OK           = 2,
  DEGRADED     = 3,
  STALE        = 4,
  ERROR        = 5
};

enum class Severity : uint8_t { INFO = 0, WARN = 1, CRIT = 2 };

inline const char* to_str(HealthStatus status) {
  switch (status) {
    case HealthStatus::UNCONFIGURED: return "UNCONFIGURED";
    case HealthStatus::MISSING: return "MISSING";
    case HealthStatus::OK: return "OK";
    case HealthStatus::DEGRADED: return "DEGRADED";
    case HealthStatus::STALE: return "STALE";
    case HealthStatus::ERROR: return "ERROR";
    default: return "UNKNOWN";
  }
}

struct HealthReport {
  HealthStatus status {HealthStatus::UNCONFIGURED};
  Severity severity {Severity::INFO};
  bool expected {false};   // is the component part of this bench?
  bool required {false};   // must be OK for a run to make progress?
  const char* reason {""}; // short machine-readable string
  uint32_t since_ms {0};   // when this status started
  uint32_t last_ok_ms {0}; // last successful check
};

class IHealthComponent {
public:
  virtual ~IHealthComponent() = default;
  virtual const char* name() const = 0;

  virtual void configure(bool expected, bool required) = 0;

  // Called once when the session comes up.
  virtual bool probe(uint32_t now_ms) = 0;

  // Called every monitor period. True if the check succeeded.
  virtual bool tick(uint32_t now_ms) = 0;

  // How long without success before considered STALE (0 disables stale logic)
  virtual uint32_t stale_timeout_ms() const = 0;

  virtual HealthReport report() const = 0;
};

struct SystemHealth {
  HealthStatus system_state {HealthStatus::OK};
  bool degraded {false};
  bool run_allowed {true};   // false: a required component (the gateway link) is down
  uint16_t warn_count {0};
  uint16_t crit_count {0};
};

// Aggregates component reports into one bench-level verdict. Safe to read from any
// task while the link monitor evaluates.
class HealthManager {
public:
  static constexpr size_t MAX_COMPONENTS = 12;  // gateway + 8 ports + spare

  bool add(IHealthComponent* c);

  // Forgets every component. Returns once no tick is in progress, so the caller may
  // then destroy them.
  void clear();

  // Ticks every expected component, then evaluates.
  void tick_all(uint32_t now_ms);

  // Only evaluates reports and applies stale logic; does not tick components.
  void evaluate(uint32_t now_ms);

  SystemHealth system_health() const;

  size_t count() const;
  IHealthComponent* component(size_t i) const;

  // Last status with the stale window applied.
  static HealthStatus effective_status(const IHealthComponent& c, uint32_t now_ms);

private:
  static bool is_bad(HealthStatus s);
  void evaluate_locked(uint32_t now_ms);

  mutable std::mutex table_mutex_;  // comps_, n_; held across ticks
  IHealthComponent* comps_[MAX_COMPONENTS] {};
  size_t n_ {0};
  mutable std::mutex mutex_;        // sys_
  SystemHealth sys_ {};
};
