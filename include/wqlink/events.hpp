/**
 * @file events.hpp
 * @brief Discrete per-tick outcome events and their rate limiter.
 *
 * @details
 * The uplink core never prints. Every state transition and failure becomes
 * an `Event` in the core's bounded outbox; whoever drives the loop drains it
 * with Uplink::get_event() and decides where it goes (console, JSON lines,
 * a metrics counter).
 *
 * @par Rate limiting
 * Routine confirmations and warnings repeat every tick on a steady link, so
 * they pass through EventThrottle: at most one per interval per kind, with
 * the number of swallowed repeats carried on the next one that gets through.
 * Errors and connection-state transitions are never throttled.
 *
 * | kind               | severity | throttled by          |
 * |--------------------|----------|-----------------------|
 * | Reading            | info     | reading_report_ms     |
 * | Sent               | info     | report_interval_ms    |
 * | Ignored            | info     | report_interval_ms    |
 * | LinkWaiting        | warn     | report_interval_ms    |
 * | Stale              | warn     | report_interval_ms    |
 * | Connected, Reconnected, Renewed | info | never        |
 * | PeerClosed, UnexpectedStatus    | warn | never        |
 * | everything else    | error    | never                 |
 */
#ifndef WQLINK_EVENTS_HPP
#define WQLINK_EVENTS_HPP

#include <stdint.h>
#include <stddef.h>

namespace wqlink {

enum class EventKind : uint8_t {
  Reading = 0,        ///< a reading was sampled (carries values)
  LinkWaiting,        ///< network association down; nothing attempted
  Connected,          ///< fresh connection opened
  Reconnected,        ///< first connection after a forced discard
  Renewed,            ///< idle keep-alive connection refreshed
  PeerClosed,         ///< collector closed the idle connection; reopened
  ConnectFailed,      ///< connect window elapsed without success
  Sent,               ///< 200: stored
  Ignored,            ///< 202: accepted, data ignored by the collector's mode
  UnexpectedStatus,   ///< answered with a status outside the contract
  ServerError,        ///< >= 400: rejected
  Timeout,            ///< no status line inside the response window
  MalformedResponse,  ///< status line present but unparseable
  WriteFailed,        ///< request could not be written; connection discarded
  TransportDropped,   ///< connection died while reading; discarded
  Escalation,         ///< consecutive-timeout threshold reached
  ForcedReconnect,    ///< recovery tick: connection discarded, counters reset
  Stale,              ///< no 200 for stale_warning_ms
};

static constexpr size_t EVENT_KIND_COUNT = static_cast<size_t>(EventKind::Stale) + 1;

enum class Severity : uint8_t { Info = 0, Warn = 1, Error = 2 };

/// One reportable occurrence. Fields that do not apply stay zero.
struct Event {
  EventKind kind{EventKind::Reading};
  Severity  severity{Severity::Info};
  uint32_t  at_ms{0};                 ///< monotonic time of the occurrence
  uint16_t  status{0};                ///< HTTP status, when one was parsed
  uint32_t  elapsed_ms{0};            ///< wait for the response / connect
  uint8_t   consecutive_timeouts{0};  ///< counter value after the event
  uint32_t  suppressed{0};            ///< same-kind events swallowed since the last one
  float     turbidity{0.0f};          ///< Reading only
  float     ph{0.0f};                 ///< Reading only
  float     conductivity{0.0f};       ///< Reading only
};

/// Stable lowercase token for logs ("sent", "server_error", ...).
const char* to_string(EventKind kind);
const char* to_string(Severity severity);

Severity severity_of(EventKind kind);

/**
 * @class EventThrottle
 * @brief Per-kind "at most once per interval" gate.
 */
class EventThrottle {
public:
  EventThrottle(uint32_t report_interval_ms, uint32_t reading_report_ms);

  /**
   * @brief Decide whether an event of `kind` at `now_ms` should be emitted.
   * @param suppressed_out Repeats swallowed since the last admitted one
   *        (set only when admitted, zero otherwise).
   * @retval true  Emit it.
   * @retval false Swallow it (counted for the next admitted one).
   */
  bool admit(EventKind kind, uint32_t now_ms, uint32_t& suppressed_out);

  /// Interval applied to `kind`; 0 means never throttled.
  uint32_t interval_for(EventKind kind) const;

private:
  uint32_t report_interval_ms_;
  uint32_t reading_report_ms_;
  uint32_t last_ms_[EVENT_KIND_COUNT]{};
  bool     seen_[EVENT_KIND_COUNT]{};
  uint32_t suppressed_[EVENT_KIND_COUNT]{};
};

} // namespace wqlink

#endif // WQLINK_EVENTS_HPP
