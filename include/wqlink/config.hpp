/**
 * @file config.hpp
 * @brief Uplink configuration record (immutable after startup).
 *
 * @details
 * One plain struct holds every knob the control loop needs: collector
 * endpoint, tick period, keep-alive policy, timeouts and the escalation
 * threshold. It is filled once (defaults, then JSON file, then command line),
 * checked by validate(), and then only ever passed by const reference.
 *
 * Defaults mirror the field firmware: 1 s ticks, 60 s keep-alive renewal,
 * 2 s response window, 5 s connect window, reconnect after 3 silent cycles.
 *
 * @par Length limits
 * Host and path are bounded (HOST_CAP, PATH_CAP) so the request head always
 * fits the fixed-capacity buffer used by RequestPipeline. validate() enforces
 * this; nothing downstream re-checks.
 */
#ifndef WQLINK_CONFIG_HPP
#define WQLINK_CONFIG_HPP

#include <stdint.h>
#include <stddef.h>
#include <string>

namespace wqlink {

static constexpr size_t HOST_CAP = 64;   ///< Max collector host length
static constexpr size_t PATH_CAP = 128;  ///< Max request path length

/// Where readings go.
struct Endpoint {
  std::string host{"127.0.0.1"};
  uint16_t    port{8000};
  std::string path{"/water-monitor/publish"};
};

/// ADC channel for each measured quantity.
struct ChannelMap {
  uint8_t turbidity{0};
  uint8_t ph{1};
  uint8_t conductivity{2};
};

/// Averaging policy for one raw sample.
struct SamplerPolicy {
  uint8_t  samples{10};   ///< consecutive reads averaged per sample
  uint32_t pause_ms{2};   ///< pause between reads
};

struct Config {
  Endpoint      endpoint{};
  SamplerPolicy sampler{};
  ChannelMap    channels{};

  uint32_t sample_interval_ms{1000};      ///< tick period
  bool     keep_alive{true};              ///< reuse one connection across ticks
  uint32_t renewal_interval_ms{60000};    ///< proactive keep-alive renewal
  uint32_t request_timeout_ms{2000};      ///< response window
  uint32_t connect_timeout_ms{5000};      ///< connection-attempt window
  uint32_t connect_poll_ms{100};          ///< pause between failed connect attempts
  uint32_t response_poll_ms{5};           ///< pause between empty response polls
  uint8_t  max_consecutive_timeouts{3};   ///< escalation threshold
  uint32_t stale_warning_ms{30000};       ///< warn after this long without a 200 (0 = off)
  uint32_t report_interval_ms{30000};     ///< throttle for success/warning events
  uint32_t reading_report_ms{10000};      ///< throttle for reading events
  uint32_t drain_cap_bytes{512};          ///< residual-byte drain bound

  std::string link_interface{};           ///< operstate source; empty = assume link up
  std::string adc_device{};               ///< IIO device dir; empty = simulated front-end
};

/**
 * @brief Check every field against its allowed range.
 * @param cfg Configuration to check.
 * @param err Set to a short reason token (e.g. "endpoint.port") on failure.
 * @retval true  Configuration is usable.
 * @retval false Something is out of range; `err` names it.
 */
bool validate(const Config& cfg, std::string& err);

} // namespace wqlink

#endif // WQLINK_CONFIG_HPP
