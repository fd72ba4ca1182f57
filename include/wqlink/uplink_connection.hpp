/**
 * @file uplink_connection.hpp
 * @brief UplinkConnection - sole owner of the outbound connection.
 *
 * @details
 * ## Field Brief
 * The collector sits behind links that drop, NATs that forget idle flows and
 * servers that close keep-alive sockets without telling anyone. This class
 * guarantees one thing: when a send is attempted, either a live connection
 * exists or the attempt is abandoned cleanly.
 *
 * @par State
 * Two states, `Disconnected` and `Connected`. There is no lingering
 * "connecting" state: a connect attempt runs to success or to its deadline
 * inside ensure_connection().
 *
 * @par Invariant
 * The transport is never read from or written to while `Disconnected`. All
 * I/O goes through write()/read()/available()/flush() here, which refuse to
 * touch the transport in that state. No other component holds the transport.
 *
 * @par Keep-alive policy
 * - keep_alive off: an existing connection is closed before the next use.
 * - keep_alive on: a connection with no exchange for renewal_interval_ms is
 *   closed and reopened proactively, even if the socket still looks fine.
 *   Activity is the open itself and every finished exchange (note_activity()).
 * - A connection the peer has visibly closed is reopened before use.
 *
 * @par Connect bound
 * Attempts repeat with connect_poll_ms pauses until one succeeds or
 * connect_timeout_ms has elapsed on the injected clock.
 */
#ifndef WQLINK_UPLINK_CONNECTION_HPP
#define WQLINK_UPLINK_CONNECTION_HPP

#include <stdint.h>
#include <stddef.h>
#include "wqlink/clock.hpp"
#include "wqlink/config.hpp"
#include "wqlink/transport/transport_base.hpp"

namespace wqlink {

enum class ConnectionState : uint8_t { Disconnected = 0, Connected = 1 };

/// What ensure_connection() had to do.
enum class EnsureResult : uint8_t {
  Reused,      ///< existing connection kept
  Opened,      ///< was disconnected (or keep-alive off); opened fresh
  Renewed,     ///< renewal interval elapsed; closed and reopened
  PeerClosed,  ///< peer had closed it; reopened
  Failed,      ///< connect window elapsed; still Disconnected
};

struct ConnectionPolicy {
  bool     keep_alive{true};
  uint32_t renewal_interval_ms{60000};
  uint32_t connect_timeout_ms{5000};
  uint32_t connect_poll_ms{100};
};

/// Pull the connection knobs out of the full config.
ConnectionPolicy connection_policy(const Config& cfg);

class UplinkConnection {
public:
  UplinkConnection(transport::ITransport& transport, IClock& clock,
                   const Endpoint& endpoint, const ConnectionPolicy& policy);

  /**
   * @brief Make sure a usable connection exists for this tick.
   * @param now_ms Tick time, used for the renewal decision.
   * @return Failed when no connection could be opened inside the window;
   *         the caller must skip the send.
   */
  EnsureResult ensure_connection(uint32_t now_ms);

  /// Close unconditionally (idempotent) and go Disconnected.
  void discard();

  ConnectionState state() const { return state_; }
  bool is_connected() const { return state_ == ConnectionState::Connected; }

  /// Open time or end of the last exchange, whichever is later (valid while Connected).
  uint32_t last_activity_ms() const { return last_activity_ms_; }

  /// An exchange finished on this connection (answered or timed out).
  void note_activity(uint32_t now_ms);

  /// Time the last connect attempt cycle took.
  uint32_t last_connect_ms() const { return last_connect_ms_; }

  /// Successful opens since construction.
  uint32_t open_count() const { return open_count_; }

  /// @name Guarded I/O (no-ops / errors while Disconnected)
  ///@{
  transport::TxResult write(const uint8_t* data, size_t len);
  bool                flush();
  size_t              available() const;
  transport::RxResult read(uint8_t* out, size_t cap, size_t& out_len);
  bool                peer_alive() const;
  ///@}

  const Endpoint& endpoint() const { return endpoint_; }

private:
  /// Retry open() until success or the connect window closes.
  bool open_bounded();
  void close_transport();

  transport::ITransport& transport_;
  IClock&                clock_;
  Endpoint               endpoint_;
  ConnectionPolicy       policy_;

  ConnectionState state_{ConnectionState::Disconnected};
  uint32_t        last_activity_ms_{0};
  uint32_t        last_connect_ms_{0};
  uint32_t        open_count_{0};
};

} // namespace wqlink

#endif // WQLINK_UPLINK_CONNECTION_HPP
