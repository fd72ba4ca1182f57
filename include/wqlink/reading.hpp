#pragma once
/**
 * @file reading.hpp
 * @brief One calibrated water-quality reading and its raw building block.
 */

#include <stdint.h>

namespace wqlink {

/// Mean of several consecutive ADC conversions, always in [0, 4095].
using RawSample = uint16_t;

/// Which linear calibration a raw sample goes through.
enum class ChannelKind : uint8_t { Turbidity = 0, Acidity = 1, Conductivity = 2 };

/**
 * @brief Calibrated values for one tick.
 *
 * Built fresh by Sampler::read() and handed to the encoder by const
 * reference. Uplink keeps only the latest one, for status output.
 */
struct SensorReading {
  float    turbidity_ntu{0.0f};        ///< 0..1000 NTU
  float    ph{0.0f};                   ///< 0..14
  float    conductivity_us_cm{0.0f};   ///< 0..1500 uS/cm
  uint32_t sampled_at_ms{0};           ///< monotonic time the sample started
};

} // namespace wqlink
