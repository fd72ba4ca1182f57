/**
 * @file sampler.hpp
 * @brief SensorSampler - averaged ADC reads and linear calibration.
 *
 * @details
 * The three probes (turbidity, pH, conductivity) sit on 12-bit ADC channels
 * and are noisy. Each sample is the integer mean of `SamplerPolicy::samples`
 * consecutive conversions with `pause_ms` between them, so one reading costs
 * roughly samples x pause_ms x 3 of loop time (54 ms with the defaults).
 *
 * Calibration is a straight line per channel:
 *   - turbidity    = 1000 x (1 - raw/4095)   inverted: low raw = cloudy water
 *   - acidity (pH) =   14 x (raw/4095)
 *   - conductivity = 1500 x (raw/4095)
 *
 * There is no error path here. The ADC domain is closed and backends clamp.
 */
#ifndef WQLINK_SAMPLER_HPP
#define WQLINK_SAMPLER_HPP

#include <stdint.h>
#include "wqlink/adc/adc_base.hpp"
#include "wqlink/clock.hpp"
#include "wqlink/config.hpp"
#include "wqlink/reading.hpp"

namespace wqlink {

class Sampler {
public:
  Sampler(adc::IAnalogInput& input, IClock& clock,
          const SamplerPolicy& policy, const ChannelMap& channels);

  /**
   * @brief Average `policy.samples` raw conversions of one channel.
   * @return Integer mean, always within [min, max] of the reads taken.
   */
  RawSample sample(uint8_t channel);

  /// Linear calibration; pure and monotonic in `raw`.
  static float convert(RawSample raw, ChannelKind kind);

  /// Sample all three channels and calibrate them.
  SensorReading read(uint32_t now_ms);

private:
  adc::IAnalogInput& input_;
  IClock&            clock_;
  SamplerPolicy      policy_;
  ChannelMap         channels_;
};

} // namespace wqlink

#endif // WQLINK_SAMPLER_HPP
