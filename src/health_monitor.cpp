// -----------------------------------------------------------------------------
// health_monitor.cpp - consecutive-timeout accounting and escalation
//
// API & escalation sequence:
//   see include/wqlink/health_monitor.hpp
// -----------------------------------------------------------------------------
#include "wqlink/health_monitor.hpp"
#include "wqlink/clock.hpp"

namespace wqlink {

const char* to_string(CycleResult r) {
  switch (r) {
    case CycleResult::Accepted:       return "accepted";
    case CycleResult::Ignored:        return "ignored";
    case CycleResult::Answered:       return "answered";
    case CycleResult::Rejected:       return "rejected";
    case CycleResult::Timeout:        return "timeout";
    case CycleResult::Malformed:      return "malformed";
    case CycleResult::ConnectFailure: return "connect_failure";
    case CycleResult::WriteFailure:   return "write_failure";
    case CycleResult::LinkDown:       return "link_down";
  }
  return "unknown";
}

CycleResult classify(const std::optional<uint16_t>& status_code, bool malformed) {
  if (!status_code) return malformed ? CycleResult::Malformed : CycleResult::Timeout;
  const uint16_t code = *status_code;
  if (code == 200) return CycleResult::Accepted;
  if (code == 202) return CycleResult::Ignored;
  if (code >= 400) return CycleResult::Rejected;
  return CycleResult::Answered;
}

bool is_liveness_failure(CycleResult r) {
  return r == CycleResult::Timeout
      || r == CycleResult::Malformed
      || r == CycleResult::ConnectFailure;
}

bool is_answered(CycleResult r) {
  return r == CycleResult::Accepted
      || r == CycleResult::Ignored
      || r == CycleResult::Answered
      || r == CycleResult::Rejected;
}

HealthMonitor::HealthMonitor(uint8_t max_consecutive_timeouts)
: max_timeouts_(max_consecutive_timeouts == 0 ? 1 : max_consecutive_timeouts) {}

void HealthMonitor::start(uint32_t now_ms) {
  counters_ = HealthCounters{};
  counters_.last_success_ms = now_ms;
  recovery_pending_ = false;
}

// -----------------------------------------------------------------------------
// record()
// POLICY:
//   - Any answered exchange resets the counter (peer is alive).
//   - Only 200 moves last_success_ms.
//   - Liveness failures count; the N-th one schedules recovery.
//   - WriteFailure / LinkDown leave counters alone.
// -----------------------------------------------------------------------------
HealthVerdict HealthMonitor::record(CycleResult result, uint32_t now_ms) {
  if (is_answered(result)) {
    counters_.consecutive_timeouts = 0;
    if (result == CycleResult::Accepted) {
      counters_.last_success_ms = now_ms;
      counters_.has_success     = true;
    }
    return HealthVerdict::Healthy;
  }

  if (!is_liveness_failure(result)) return HealthVerdict::Unchanged;

  if (counters_.consecutive_timeouts < max_timeouts_) ++counters_.consecutive_timeouts;
  if (counters_.consecutive_timeouts >= max_timeouts_) {
    recovery_pending_ = true;
    return HealthVerdict::Escalate;
  }
  return HealthVerdict::Degraded;
}

bool HealthMonitor::recover(UplinkConnection& connection) {
  if (!recovery_pending_) return false;
  connection.discard();
  counters_.consecutive_timeouts = 0;
  recovery_pending_ = false;
  return true;
}

bool HealthMonitor::stale(uint32_t now_ms, uint32_t threshold_ms) const {
  if (threshold_ms == 0) return false;
  return elapsed_ms(now_ms, counters_.last_success_ms) >= threshold_ms;
}

} // namespace wqlink
