// -----------------------------------------------------------------------------
// uplink_connection.cpp - connection lifecycle and keep-alive policy
//
// API & policy overview:
//   see include/wqlink/uplink_connection.hpp
//
// NOTE: every transport call in the project happens in this file. The guarded
// I/O helpers are the only way RequestPipeline reaches the socket.
// -----------------------------------------------------------------------------
#include "wqlink/uplink_connection.hpp"

namespace wqlink {

using transport::RxResult;
using transport::TxResult;

ConnectionPolicy connection_policy(const Config& cfg) {
  ConnectionPolicy p;
  p.keep_alive          = cfg.keep_alive;
  p.renewal_interval_ms = cfg.renewal_interval_ms;
  p.connect_timeout_ms  = cfg.connect_timeout_ms;
  p.connect_poll_ms     = cfg.connect_poll_ms;
  return p;
}

UplinkConnection::UplinkConnection(transport::ITransport& transport, IClock& clock,
                                   const Endpoint& endpoint, const ConnectionPolicy& policy)
: transport_(transport), clock_(clock), endpoint_(endpoint), policy_(policy) {}

// -----------------------------------------------------------------------------
// ensure_connection()
// PRE:   called once per tick, before any send.
// POLICY:
//   1) Connected + keep-alive off       -> close, then open fresh.
//   2) Connected + idle past renewal    -> close, then open fresh (Renewed).
//   3) Connected + peer visibly gone    -> close, then open fresh (PeerClosed).
//   4) Disconnected                     -> open within the connect window.
// OUT:   Connected on any non-Failed result.
// -----------------------------------------------------------------------------
EnsureResult UplinkConnection::ensure_connection(uint32_t now_ms) {
  EnsureResult reason = EnsureResult::Opened;

  if (state_ == ConnectionState::Connected) {
    if (!policy_.keep_alive) {
      discard();
    } else if (elapsed_ms(now_ms, last_activity_ms_) >= policy_.renewal_interval_ms) {
      discard();
      reason = EnsureResult::Renewed;
    } else if (!transport_.connected()) {
      discard();
      reason = EnsureResult::PeerClosed;
    } else {
      return EnsureResult::Reused;
    }
  }

  if (!open_bounded()) return EnsureResult::Failed;

  state_            = ConnectionState::Connected;
  last_activity_ms_ = clock_.now_ms();
  ++open_count_;
  return reason;
}

void UplinkConnection::note_activity(uint32_t now_ms) {
  if (state_ == ConnectionState::Connected) last_activity_ms_ = now_ms;
}

void UplinkConnection::discard() {
  close_transport();
  state_ = ConnectionState::Disconnected;
}

// open_bounded() - deadline on the clock, not an attempt count.
bool UplinkConnection::open_bounded() {
  const uint32_t start = clock_.now_ms();
  for (;;) {
    const uint32_t spent = elapsed_ms(clock_.now_ms(), start);
    if (spent >= policy_.connect_timeout_ms) break;

    const uint32_t remaining = policy_.connect_timeout_ms - spent;
    if (transport_.open(endpoint_.host.c_str(), endpoint_.port, remaining)) {
      last_connect_ms_ = elapsed_ms(clock_.now_ms(), start);
      return true;
    }
    transport_.close();                               // leave no half-open handle behind

    if (elapsed_ms(clock_.now_ms(), start) >= policy_.connect_timeout_ms) break;
    clock_.sleep_ms(policy_.connect_poll_ms);
  }
  last_connect_ms_ = elapsed_ms(clock_.now_ms(), start);
  return false;
}

void UplinkConnection::close_transport() {
  transport_.close();                                 // transports treat this as idempotent
}

// ---------- guarded I/O ----------

TxResult UplinkConnection::write(const uint8_t* data, size_t len) {
  if (state_ != ConnectionState::Connected) return TxResult::Error;
  return transport_.send(data, len);
}

bool UplinkConnection::flush() {
  if (state_ != ConnectionState::Connected) return false;
  return transport_.flush();
}

size_t UplinkConnection::available() const {
  if (state_ != ConnectionState::Connected) return 0;
  return transport_.available();
}

RxResult UplinkConnection::read(uint8_t* out, size_t cap, size_t& out_len) {
  out_len = 0;
  if (state_ != ConnectionState::Connected) return RxResult::Error;
  return transport_.recv(out, cap, out_len);
}

bool UplinkConnection::peer_alive() const {
  if (state_ != ConnectionState::Connected) return false;
  return transport_.connected();
}

} // namespace wqlink
