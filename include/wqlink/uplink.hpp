/**
 * @file uplink.hpp
 * @brief wqlink Uplink - the node's single periodic control loop.
 *
 * @details
 * ## Field Brief
 * A sensing node on a flaky link has one job per tick: sample the probes,
 * turn the numbers into a small JSON body, get it to the collector, and keep
 * the connection honest. **Uplink** is that loop. It owns every piece of
 * mutable state the node has (connection, counters, timestamps, throttle,
 * statistics, outbox) in one object; there are no globals.
 *
 * ---
 *
 * @par What This File Provides
 * - `wqlink::Uplink` - the orchestrator that:
 *   - Runs at most one cycle per `tick(now_ms)`, and only when
 *     `sample_interval_ms` has elapsed since the previous cycle.
 *   - Emits discrete `Event` records retrievable with `get_event()`.
 *   - Keeps `UplinkStats` counters for whoever wants totals.
 * - `wqlink::UplinkStats` - plain counters, never reset while running.
 *
 * ---
 *
 * @par Operational Model
 * ```
 *  tick(now)
 *    │
 *    ├─ link down?            ── LinkWaiting, stop
 *    ├─ recovery pending?     ── discard(), counter=0, ForcedReconnect, stop
 *    │
 *    ├─ Sampler::read()       ── Reading
 *    ├─ codec::encode()
 *    ├─ ensure_connection()   ── Connected / Reconnected / Renewed / PeerClosed
 *    │                           or ConnectFailed (counts as timeout), stop
 *    ├─ RequestPipeline::send()  ── WriteFailed (discarded), stop
 *    ├─ RequestPipeline::receive()
 *    └─ HealthMonitor::record()  ── Sent / Ignored / ServerError / Timeout /
 *                                   MalformedResponse / UnexpectedStatus,
 *                                   Escalation when the threshold is hit
 * ```
 *
 * - **One request in flight, ever.** Readings leave in sample order, one per
 *   cycle. Nothing is queued or retried; a lost reading stays lost.
 * - **Every wait is bounded** by the injected clock: sampling pauses, the
 *   connect window and the response window.
 *
 * ---
 *
 * @par Failure Model
 * - Nothing here throws and nothing here terminates the process. Each
 *   failure is handled inside its tick and surfaces as an event.
 * - Missing hardware (transport or ADC) is detected by the wrapper via
 *   `begin()` before the first tick; that is the only fatal path.
 *
 * ---
 *
 * @par Minimal Usage Example
 * @code
 * wqlink::SteadyClock clock;
 * wqlink::transport::LinuxTcp tcp;
 * wqlink::adc::Simulated adc;
 * wqlink::AlwaysUpLink link;
 * wqlink::Uplink uplink(cfg, adc, tcp, link, clock);
 *
 * for (;;) {
 *   uplink.tick(clock.now_ms());
 *   wqlink::Event ev;
 *   while (uplink.get_event(ev)) {
 *     // log / count / forward `ev`
 *   }
 *   clock.sleep_ms(10);
 * }
 * @endcode
 */
#ifndef WQLINK_UPLINK_HPP
#define WQLINK_UPLINK_HPP

#include <stdint.h>
#include <stddef.h>
#include "etl/deque.h"
#include "wqlink/adc/adc_base.hpp"
#include "wqlink/clock.hpp"
#include "wqlink/codec.hpp"
#include "wqlink/config.hpp"
#include "wqlink/events.hpp"
#include "wqlink/health_monitor.hpp"
#include "wqlink/link_status.hpp"
#include "wqlink/reading.hpp"
#include "wqlink/request_pipeline.hpp"
#include "wqlink/sampler.hpp"
#include "wqlink/transport/transport_base.hpp"
#include "wqlink/uplink_connection.hpp"

namespace wqlink {

/// Running totals since construction.
struct UplinkStats {
  uint32_t cycles{0};             ///< ticks that ran a cycle
  uint32_t requests{0};           ///< requests fully written
  uint32_t accepted{0};           ///< 200
  uint32_t ignored{0};            ///< 202
  uint32_t answered_other{0};     ///< other status below 400
  uint32_t rejected{0};           ///< >= 400
  uint32_t timeouts{0};
  uint32_t malformed{0};
  uint32_t connect_failures{0};
  uint32_t write_failures{0};
  uint32_t transport_drops{0};
  uint32_t link_waits{0};
  uint32_t renewals{0};
  uint32_t forced_reconnects{0};
  uint32_t events_dropped{0};     ///< outbox was full
};

class Uplink {
public:
  /**
   * @brief Maximum outbound event queue size.
   *
   * @details
   * A single cycle emits at most five events (stale, reading, connection
   * transition, outcome, escalation); sixteen leaves room for a wrapper that
   * drains only every few ticks. When full, new events are dropped and
   * counted in `UplinkStats::events_dropped`.
   */
  static constexpr size_t OUTBOX_CAP = 16;

  /**
   * @brief Wire the loop to its capabilities.
   *
   * @details
   * All references must outlive the Uplink. `cfg` is copied; it is expected
   * to have passed validate(). Capabilities are assumed to have passed their
   * own `begin()` checks already.
   */
  Uplink(const Config& cfg, adc::IAnalogInput& analog, transport::ITransport& transport,
         ILinkStatus& link, IClock& clock);

  /**
   * @brief Run one cycle if it is due.
   *
   * @details
   * The first call always runs and sets the health baseline. Later calls run
   * only once `sample_interval_ms` has elapsed since the previous cycle
   * started, so the wrapper may call this as often as it likes.
   *
   * @param now_ms Monotonic milliseconds (wrapping 32-bit).
   * @retval true  A cycle ran (it may still have sent nothing).
   * @retval false Not due yet.
   */
  bool tick(uint32_t now_ms);

  /**
   * @brief Retrieve the oldest queued event.
   * @retval true  `out` is valid.
   * @retval false Outbox empty.
   */
  bool get_event(Event& out);

  /// Close the connection (used on orderly shutdown).
  void shutdown();

  uint32_t tick_count() const { return tick_count_; }
  const UplinkStats& stats() const { return stats_; }
  const HealthMonitor& health() const { return health_; }
  const UplinkConnection& connection() const { return connection_; }
  const Config& config() const { return cfg_; }

  /// Result of the most recent cycle.
  CycleResult last_result() const { return last_result_; }

  /// Most recent reading; meaningful once has_reading() is true.
  const SensorReading& last_reading() const { return last_reading_; }
  bool has_reading() const { return has_reading_; }

private:
  /// Body of one due tick.
  void run_cycle(uint32_t now_ms);

  /// Report the connection step; false when the send must be skipped.
  bool report_ensure(EnsureResult result);

  /// Account and report a completed exchange.
  void finish_exchange(const Outcome& outcome);

  /// Queue Escalation when the threshold was just reached.
  void report_verdict(HealthVerdict verdict);

  Event make_event(EventKind kind) const;
  void  emit(Event ev);

  Config       cfg_;
  ILinkStatus& link_;
  IClock&      clock_;

  Sampler          sampler_;
  UplinkConnection connection_;
  RequestPipeline  pipeline_;
  HealthMonitor    health_;
  EventThrottle    throttle_;

  uint32_t      tick_count_{0};
  uint32_t      last_cycle_ms_{0};
  bool          reconnect_pending_{false};  ///< next successful open reports Reconnected
  CycleResult   last_result_{CycleResult::LinkDown};
  SensorReading last_reading_{};
  bool          has_reading_{false};
  UplinkStats   stats_{};

  etl::deque<Event, OUTBOX_CAP> outbox_;
};

} // namespace wqlink

#endif // WQLINK_UPLINK_HPP
