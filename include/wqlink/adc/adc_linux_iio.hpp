#pragma once
/**
 * @file adc_linux_iio.hpp
 * @brief Linux Industrial I/O ADC backend (header-only, sysfs).
 *
 * Reads `<device>/in_voltage<N>_raw`, e.g.
 * `/sys/bus/iio/devices/iio:device0/in_voltage2_raw`.
 * Depends on: std::ifstream only (Linux-only path).
 */

#if !defined(__linux__)
#  error "adc_linux_iio.hpp is Linux-only."
#endif

#include "wqlink/adc/adc_base.hpp"
#include <array>
#include <fstream>
#include <string>

namespace wqlink::adc {

class LinuxIio : public IAnalogInput {
public:
  static constexpr uint8_t MAX_CHANNELS = 8;

  /// @param channels the channels begin() must find readable.
  LinuxIio(const std::string& device_dir, std::array<uint8_t, 3> channels)
  : dir_(device_dir), channels_(channels) {}

  bool begin() override {
    if (dir_.empty()) return false;
    for (uint8_t ch : channels_) {
      long v = 0;
      if (ch >= MAX_CHANNELS || !read_file(ch, v)) return false;
      last_[ch] = clamp(v);
    }
    return true;
  }

  // Failed reads hold the previous value; the model has no analog error path.
  uint16_t read_raw(uint8_t channel) override {
    if (channel >= MAX_CHANNELS) return 0;
    long v = 0;
    if (read_file(channel, v)) last_[channel] = clamp(v);
    return last_[channel];
  }

  const char* name() const override { return "linux-iio"; }

private:
  bool read_file(uint8_t channel, long& out) const {
    std::ifstream in(dir_ + "/in_voltage" + std::to_string(channel) + "_raw");
    if (!in) return false;
    in >> out;
    return static_cast<bool>(in);
  }

  static uint16_t clamp(long v) {
    if (v < 0) return 0;
    if (v > RAW_MAX) return RAW_MAX;
    return static_cast<uint16_t>(v);
  }

  std::string dir_;
  std::array<uint8_t, 3> channels_;
  std::array<uint16_t, MAX_CHANNELS> last_{};
};

} // namespace wqlink::adc
