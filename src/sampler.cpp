// -----------------------------------------------------------------------------
// sampler.cpp - averaged ADC reads and per-channel calibration
//
// API & calibration formulas:
//   see include/wqlink/sampler.hpp
// -----------------------------------------------------------------------------
#include "wqlink/sampler.hpp"

namespace wqlink {

namespace {
constexpr float RAW_FULL_SCALE = 4095.0f;
}

Sampler::Sampler(adc::IAnalogInput& input, IClock& clock,
                 const SamplerPolicy& policy, const ChannelMap& channels)
: input_(input), clock_(clock), policy_(policy), channels_(channels) {
  if (policy_.samples == 0) policy_.samples = 1;   // never divide by zero
}

// sample() - integer mean; pause only *between* reads, not after the last.
RawSample Sampler::sample(uint8_t channel) {
  uint32_t sum = 0;
  for (uint8_t i = 0; i < policy_.samples; ++i) {
    if (i > 0 && policy_.pause_ms > 0) clock_.sleep_ms(policy_.pause_ms);
    uint16_t v = input_.read_raw(channel);
    if (v > adc::RAW_MAX) v = adc::RAW_MAX;        // backend contract, enforced once more
    sum += v;
  }
  return static_cast<RawSample>(sum / policy_.samples);
}

float Sampler::convert(RawSample raw, ChannelKind kind) {
  if (raw > adc::RAW_MAX) raw = adc::RAW_MAX;
  const float ratio = static_cast<float>(raw) / RAW_FULL_SCALE;
  switch (kind) {
    case ChannelKind::Turbidity:    return 1000.0f * (1.0f - ratio);
    case ChannelKind::Acidity:      return 14.0f * ratio;
    case ChannelKind::Conductivity: return 1500.0f * ratio;
  }
  return 0.0f;
}

SensorReading Sampler::read(uint32_t now_ms) {
  SensorReading r;
  r.sampled_at_ms      = now_ms;
  r.turbidity_ntu      = convert(sample(channels_.turbidity), ChannelKind::Turbidity);
  r.ph                 = convert(sample(channels_.ph), ChannelKind::Acidity);
  r.conductivity_us_cm = convert(sample(channels_.conductivity), ChannelKind::Conductivity);
  return r;
}

} // namespace wqlink
