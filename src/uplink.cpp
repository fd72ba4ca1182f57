// -----------------------------------------------------------------------------
// uplink.cpp - Implementation of the wqlink control loop
//
// This file contains the *implementation details* for the Uplink class
// declared in `uplink.hpp`.
//
// API & operational model:
//   see include/wqlink/uplink.hpp
//
// Scenario tests:
//   see tests/test_uplink_flows.cpp
// -----------------------------------------------------------------------------
#include "wqlink/uplink.hpp"

namespace wqlink {

// ---------- public ----------

Uplink::Uplink(const Config& cfg, adc::IAnalogInput& analog, transport::ITransport& transport,
               ILinkStatus& link, IClock& clock)
: cfg_(cfg),
  link_(link),
  clock_(clock),
  sampler_(analog, clock, cfg.sampler, cfg.channels),
  connection_(transport, clock, cfg.endpoint, connection_policy(cfg)),
  pipeline_(connection_, clock, pipeline_policy(cfg)),
  health_(cfg.max_consecutive_timeouts),
  throttle_(cfg.report_interval_ms, cfg.reading_report_ms) {}

// tick() - gate on the sample interval, then run one cycle.
bool Uplink::tick(uint32_t now_ms) {
  if (tick_count_ == 0) {
    health_.start(now_ms);                          // baseline for "time since success"
  } else if (elapsed_ms(now_ms, last_cycle_ms_) < cfg_.sample_interval_ms) {
    return false;                                   // not due
  }

  last_cycle_ms_ = now_ms;
  ++tick_count_;
  ++stats_.cycles;
  run_cycle(now_ms);
  return true;
}

bool Uplink::get_event(Event& out) {
  if (outbox_.empty()) return false;
  out = outbox_.front();
  outbox_.pop_front();
  return true;
}

void Uplink::shutdown() {
  connection_.discard();
}

// ---------- private: the cycle ----------

// -----------------------------------------------------------------------------
// run_cycle()
// ORDER:
//   stale check -> link -> recovery -> sample/encode -> connect -> send ->
//   receive -> health.
// POLICY:
//   - Link down: report and attempt nothing; counters untouched.
//   - Recovery pending: this tick only discards and resets; no sample, no send.
//   - Keep-alive off: close right after the exchange.
// -----------------------------------------------------------------------------
void Uplink::run_cycle(uint32_t now_ms) {
  if (health_.stale(now_ms, cfg_.stale_warning_ms)) {
    emit(make_event(EventKind::Stale));
  }

  if (!link_.link_up()) {
    ++stats_.link_waits;
    last_result_ = CycleResult::LinkDown;
    emit(make_event(EventKind::LinkWaiting));
    return;
  }

  if (health_.recover(connection_)) {
    ++stats_.forced_reconnects;
    reconnect_pending_ = true;
    emit(make_event(EventKind::ForcedReconnect));
    return;
  }

  last_reading_ = sampler_.read(now_ms);
  has_reading_  = true;
  {
    Event ev = make_event(EventKind::Reading);
    ev.turbidity    = last_reading_.turbidity_ntu;
    ev.ph           = last_reading_.ph;
    ev.conductivity = last_reading_.conductivity_us_cm;
    emit(ev);
  }
  const std::optional<codec::Body> body = codec::encode(last_reading_);
  if (!body) return;                                // calibrated values always fit

  if (!report_ensure(connection_.ensure_connection(clock_.now_ms()))) return;

  if (!pipeline_.send(*body)) {
    ++stats_.write_failures;
    last_result_ = CycleResult::WriteFailure;
    health_.record(CycleResult::WriteFailure, clock_.now_ms());
    emit(make_event(EventKind::WriteFailed));
    return;
  }
  ++stats_.requests;

  finish_exchange(pipeline_.receive(cfg_.request_timeout_ms));

  if (!cfg_.keep_alive) connection_.discard();
}

// report_ensure() - one event per connection transition; Failed ends the tick.
bool Uplink::report_ensure(EnsureResult result) {
  switch (result) {
    case EnsureResult::Reused:
      return true;

    case EnsureResult::Opened:
      // keep-alive off reopens every tick; that is routine, not news
      if (reconnect_pending_) {
        emit(make_event(EventKind::Reconnected));
      } else if (cfg_.keep_alive || connection_.open_count() == 1) {
        emit(make_event(EventKind::Connected));
      }
      reconnect_pending_ = false;
      return true;

    case EnsureResult::Renewed:
      ++stats_.renewals;
      reconnect_pending_ = false;
      emit(make_event(EventKind::Renewed));
      return true;

    case EnsureResult::PeerClosed:
      reconnect_pending_ = false;
      emit(make_event(EventKind::PeerClosed));
      return true;

    case EnsureResult::Failed:
      break;
  }

  ++stats_.connect_failures;
  last_result_ = CycleResult::ConnectFailure;
  const HealthVerdict verdict = health_.record(CycleResult::ConnectFailure, clock_.now_ms());
  Event ev = make_event(EventKind::ConnectFailed);
  ev.elapsed_ms = connection_.last_connect_ms();
  emit(ev);
  report_verdict(verdict);
  return false;
}

void Uplink::finish_exchange(const Outcome& outcome) {
  const CycleResult result = classify(outcome.status_code, outcome.malformed);
  last_result_ = result;

  EventKind kind = EventKind::Timeout;
  switch (result) {
    case CycleResult::Accepted:  ++stats_.accepted;       kind = EventKind::Sent;              break;
    case CycleResult::Ignored:   ++stats_.ignored;        kind = EventKind::Ignored;           break;
    case CycleResult::Answered:  ++stats_.answered_other; kind = EventKind::UnexpectedStatus;  break;
    case CycleResult::Rejected:  ++stats_.rejected;       kind = EventKind::ServerError;       break;
    case CycleResult::Malformed: ++stats_.malformed;      kind = EventKind::MalformedResponse; break;
    default:                     ++stats_.timeouts;       kind = EventKind::Timeout;           break;
  }

  const HealthVerdict verdict = health_.record(result, clock_.now_ms());

  Event ev = make_event(kind);
  ev.status     = outcome.status_code ? *outcome.status_code : 0;
  ev.elapsed_ms = outcome.elapsed_ms;
  emit(ev);
  report_verdict(verdict);

  if (outcome.transport_dead) {
    ++stats_.transport_drops;
    emit(make_event(EventKind::TransportDropped));
  }
}

// report_verdict() - Escalation always follows the failure event that caused it.
void Uplink::report_verdict(HealthVerdict verdict) {
  if (verdict == HealthVerdict::Escalate) emit(make_event(EventKind::Escalation));
}

// ---------- private: events ----------

Event Uplink::make_event(EventKind kind) const {
  Event ev;
  ev.kind     = kind;
  ev.severity = severity_of(kind);
  ev.at_ms    = clock_.now_ms();
  ev.consecutive_timeouts = health_.counters().consecutive_timeouts;
  return ev;
}

// emit() - throttle, then queue; a full outbox drops and counts.
void Uplink::emit(Event ev) {
  uint32_t suppressed = 0;
  if (!throttle_.admit(ev.kind, ev.at_ms, suppressed)) return;
  ev.suppressed = suppressed;
  if (outbox_.full()) {
    ++stats_.events_dropped;
    return;
  }
  outbox_.push_back(ev);
}

} // namespace wqlink
