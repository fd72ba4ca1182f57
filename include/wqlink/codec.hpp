/**
 * @file codec.hpp
 * @brief TelemetryEncoder - SensorReading <-> compact JSON request body.
 *
 * @details
 * Wire body, exactly three members, two decimals each:
 * @code
 *   {"T":499.88,"PH":7.00,"C":750.18}
 * @endcode
 * Values are rounded half away from zero to 2 decimals *before* formatting,
 * so the text never depends on printf's handling of binary ties.
 *
 * encode() is heap-free (fixed-capacity ETL string) and runs on every tick.
 * decode() is the conformant reader used by tools and tests: it accepts any
 * JSON object carrying numeric `T`, `PH` and `C`, the same members the
 * collector requires before it answers 200/202 instead of 400.
 *
 * ## Dual backend (decode only)
 * - Desktop/Linux builds use nlohmann::json.
 * - ARDUINO builds use ArduinoJson with a StaticJsonDocument, configured
 *   by ajson_config.hpp (double storage, no NaN/Infinity literals).
 */
#ifndef WQLINK_CODEC_HPP
#define WQLINK_CODEC_HPP

#include <stddef.h>
#include <optional>
#include "etl/string.h"
#include "wqlink/reading.hpp"

namespace wqlink {
namespace codec {

static constexpr size_t BODY_CAP = 64;   ///< Worst case body is ~36 chars
using Body = etl::string<BODY_CAP>;

/// Fields recovered from a body.
struct Decoded {
  double turbidity{0.0};
  double ph{0.0};
  double conductivity{0.0};
};

/// Round half away from zero to 2 decimal places.
double round2(double v);

/**
 * @brief Serialize a reading into the fixed three-member body.
 * @return std::nullopt if a value is not finite or the text would not fit
 *         BODY_CAP. Calibrated readings always fit.
 */
std::optional<Body> encode(const SensorReading& reading);

/**
 * @brief Parse a body back into numbers.
 * @return std::nullopt if the text is not JSON, not an object, or any of
 *         `T`, `PH`, `C` is missing or not a number.
 */
std::optional<Decoded> decode(const char* body, size_t len);

} // namespace codec
} // namespace wqlink

#endif // WQLINK_CODEC_HPP
