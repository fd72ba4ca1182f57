// -----------------------------------------------------------------------------
// events.cpp - event names, severities and the per-kind throttle
//
// API & throttle table:
//   see include/wqlink/events.hpp
// -----------------------------------------------------------------------------
#include "wqlink/events.hpp"
#include "wqlink/clock.hpp"

namespace wqlink {

const char* to_string(EventKind kind) {
  switch (kind) {
    case EventKind::Reading:           return "reading";
    case EventKind::LinkWaiting:       return "link_waiting";
    case EventKind::Connected:         return "connected";
    case EventKind::Reconnected:       return "reconnected";
    case EventKind::Renewed:           return "renewed";
    case EventKind::PeerClosed:        return "peer_closed";
    case EventKind::ConnectFailed:     return "connect_failed";
    case EventKind::Sent:              return "sent";
    case EventKind::Ignored:           return "ignored";
    case EventKind::UnexpectedStatus:  return "unexpected_status";
    case EventKind::ServerError:       return "server_error";
    case EventKind::Timeout:           return "timeout";
    case EventKind::MalformedResponse: return "malformed_response";
    case EventKind::WriteFailed:       return "write_failed";
    case EventKind::TransportDropped:  return "transport_dropped";
    case EventKind::Escalation:        return "escalation";
    case EventKind::ForcedReconnect:   return "forced_reconnect";
    case EventKind::Stale:             return "stale";
  }
  return "unknown";
}

const char* to_string(Severity severity) {
  switch (severity) {
    case Severity::Info:  return "info";
    case Severity::Warn:  return "warn";
    case Severity::Error: return "error";
  }
  return "unknown";
}

Severity severity_of(EventKind kind) {
  switch (kind) {
    case EventKind::Reading:
    case EventKind::Connected:
    case EventKind::Reconnected:
    case EventKind::Renewed:
    case EventKind::Sent:
    case EventKind::Ignored:
      return Severity::Info;
    case EventKind::LinkWaiting:
    case EventKind::PeerClosed:
    case EventKind::UnexpectedStatus:
    case EventKind::Stale:
      return Severity::Warn;
    default:
      return Severity::Error;
  }
}

EventThrottle::EventThrottle(uint32_t report_interval_ms, uint32_t reading_report_ms)
: report_interval_ms_(report_interval_ms), reading_report_ms_(reading_report_ms) {}

uint32_t EventThrottle::interval_for(EventKind kind) const {
  switch (kind) {
    case EventKind::Reading:
      return reading_report_ms_;
    case EventKind::Sent:
    case EventKind::Ignored:
    case EventKind::LinkWaiting:
    case EventKind::Stale:
      return report_interval_ms_;
    default:
      return 0;
  }
}

// POLICY: the first occurrence of a kind always passes; after that one per interval.
bool EventThrottle::admit(EventKind kind, uint32_t now_ms, uint32_t& suppressed_out) {
  suppressed_out = 0;
  const size_t i = static_cast<size_t>(kind);
  const uint32_t interval = interval_for(kind);
  if (interval == 0) return true;

  if (seen_[i] && elapsed_ms(now_ms, last_ms_[i]) < interval) {
    ++suppressed_[i];
    return false;
  }
  seen_[i]       = true;
  last_ms_[i]    = now_ms;
  suppressed_out = suppressed_[i];
  suppressed_[i] = 0;
  return true;
}

} // namespace wqlink
