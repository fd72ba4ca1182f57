#pragma once
/**
 * @file clock.hpp
 * @brief Monotonic millisecond clock capability for the uplink loop.
 *
 * Every bounded wait in wqlink (sampling pause, connect retry, response poll)
 * checks a deadline against this clock instead of counting attempts. Tests
 * inject a fake whose sleep_ms() simply advances time.
 *
 * Time is a 32-bit wrapping millisecond counter (same as millis() on an MCU).
 * Always compare with elapsed_ms(), never with raw `<`.
 */

#include <chrono>
#include <cstdint>
#include <thread>

namespace wqlink {

class IClock {
public:
  virtual ~IClock() = default;
  virtual uint32_t now_ms() const = 0;
  virtual void     sleep_ms(uint32_t ms) = 0;
};

/// Wrap-safe elapsed time between two 32-bit timestamps.
inline uint32_t elapsed_ms(uint32_t now, uint32_t since) {
  return static_cast<uint32_t>(now - since);
}

/// Linux/desktop clock backed by std::chrono::steady_clock.
class SteadyClock : public IClock {
public:
  uint32_t now_ms() const override {
    using namespace std::chrono;
    auto ms = duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
    return static_cast<uint32_t>(ms & 0xFFFFFFFFu);
  }

  void sleep_ms(uint32_t ms) override {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
  }
};

} // namespace wqlink
