#pragma once
/**
 * @file adc_simulated.hpp
 * @brief Bench front-end: slowly drifting, jittered raw values, no hardware.
 *
 * Deterministic for a given seed so bench logs can be compared run to run.
 * Channels 0..2 start near clear water (low turbidity), neutral pH and a
 * mid conductivity; any other channel idles at mid-scale.
 */

#include "wqlink/adc/adc_base.hpp"

namespace wqlink::adc {

class Simulated : public IAnalogInput {
public:
  explicit Simulated(uint64_t seed = 0x5EEDu) : seed_(seed) {}

  bool begin() override { return true; }

  uint16_t read_raw(uint8_t channel) override {
    static constexpr int32_t BASE[3] = {3900, 2048, 1200};
    const int32_t base = channel < 3 ? BASE[channel] : 2048;

    // triangle drift, period 1200 reads, +/-150 counts
    const int32_t phase = static_cast<int32_t>(step_++ % 1200);
    const int32_t drift = (phase < 600 ? phase : 1200 - phase) / 2 - 150;

    // simple LCG jitter, +/-8 counts
    seed_ = seed_ * 6364136223846793005ull + 1;
    const int32_t jitter = static_cast<int32_t>((seed_ >> 33) % 17) - 8;

    int32_t v = base + drift + jitter;
    if (v < 0) v = 0;
    if (v > RAW_MAX) v = RAW_MAX;
    return static_cast<uint16_t>(v);
  }

  const char* name() const override { return "simulated"; }

private:
  uint64_t seed_;
  uint32_t step_{0};
};

} // namespace wqlink::adc
