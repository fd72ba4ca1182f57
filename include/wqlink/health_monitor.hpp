/**
 * @file health_monitor.hpp
 * @brief HealthMonitor - liveness accounting and forced-reconnect decisions.
 *
 * @details
 * Two kinds of failure:
 *   - **Liveness** (no status line in time, unparseable status line, connect
 *     window elapsed): the peer may be gone. These count up
 *     `consecutive_timeouts`; reaching the threshold schedules a forced
 *     reconnect.
 *   - **Protocol** (answered with 4xx/5xx, or any other status): the peer is
 *     alive and talking. The counter resets; the caller reports the error.
 *
 * @par Escalation sequence (threshold N)
 * @code
 *   tick k      : N-th liveness failure  -> record() returns Escalate
 *   tick k+1    : recover(conn)          -> discard(), counter = 0, no send
 *   tick k+2    : normal tick            -> ensure_connection() opens fresh
 * @endcode
 */
#ifndef WQLINK_HEALTH_MONITOR_HPP
#define WQLINK_HEALTH_MONITOR_HPP

#include <stdint.h>
#include <optional>
#include "wqlink/uplink_connection.hpp"

namespace wqlink {

/// Classified result of one tick's uplink attempt.
enum class CycleResult : uint8_t {
  Accepted = 0,    ///< 200
  Ignored,         ///< 202
  Answered,        ///< any other status below 400
  Rejected,        ///< >= 400
  Timeout,         ///< no status line in the response window
  Malformed,       ///< status line present but unparseable (counts as Timeout)
  ConnectFailure,  ///< connect window elapsed (counts as Timeout)
  WriteFailure,    ///< write failed; connection already discarded
  LinkDown,        ///< no network association; nothing attempted
};

/// Stable lowercase token ("accepted", "connect_failure", ...).
const char* to_string(CycleResult r);

/// Map a parsed status code (or its absence) to a CycleResult.
CycleResult classify(const std::optional<uint16_t>& status_code, bool malformed);

/// Timeout, Malformed and ConnectFailure: the ones that count toward escalation.
bool is_liveness_failure(CycleResult r);

/// Peer produced a parseable status line.
bool is_answered(CycleResult r);

struct HealthCounters {
  uint8_t  consecutive_timeouts{0};
  uint32_t last_success_ms{0};                 ///< last 200 (or the start baseline)
  bool     has_success{false};
};

enum class HealthVerdict : uint8_t {
  Healthy = 0,   ///< counter at zero
  Degraded,      ///< counter incremented, below threshold
  Escalate,      ///< threshold reached; recover() on the next tick
  Unchanged,     ///< result does not touch the counters
};

class HealthMonitor {
public:
  explicit HealthMonitor(uint8_t max_consecutive_timeouts);

  /// Baseline timestamps at loop start, so "time since success" is meaningful.
  void start(uint32_t now_ms);

  /// Apply one cycle result. Must not be called while recovery is pending.
  HealthVerdict record(CycleResult result, uint32_t now_ms);

  /// Threshold reached and not yet acted on.
  bool recovery_pending() const { return recovery_pending_; }

  /**
   * @brief Perform the forced reconnect if one is pending.
   * @details Calls `connection.discard()` and resets the counter to zero.
   * @retval true  A discard happened (the caller must not send this tick).
   * @retval false Nothing pending.
   */
  bool recover(UplinkConnection& connection);

  /// No 200 for at least `threshold_ms` (0 disables).
  bool stale(uint32_t now_ms, uint32_t threshold_ms) const;

  const HealthCounters& counters() const { return counters_; }
  uint8_t max_consecutive_timeouts() const { return max_timeouts_; }

private:
  uint8_t        max_timeouts_;
  HealthCounters counters_{};
  bool           recovery_pending_{false};
};

} // namespace wqlink

#endif // WQLINK_HEALTH_MONITOR_HPP
