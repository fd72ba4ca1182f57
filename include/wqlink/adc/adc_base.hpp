#pragma once
/**
 * @file adc_base.hpp
 * @brief Analog front-end capability (12-bit ADC channels).
 *
 * Header-only. No STL in the embedded path.
 */

#include <cstdint>

namespace wqlink::adc {

/// Upper bound of the closed 12-bit ADC domain.
static constexpr uint16_t RAW_MAX = 4095;

/**
 * @brief Analog input trait.
 *
 * Contract:
 *  - begin() checks the front-end is present. false = hardware absent, fatal.
 *  - read_raw(channel) returns one conversion in [0, RAW_MAX]. It cannot fail;
 *    backends clamp and hold the last good value instead of surfacing errors.
 */
class IAnalogInput {
public:
  virtual ~IAnalogInput() = default;
  virtual bool        begin() = 0;
  virtual uint16_t    read_raw(uint8_t channel) = 0;
  virtual const char* name() const = 0;
};

} // namespace wqlink::adc
