// -----------------------------------------------------------------------------
// codec.cpp - request body encoder and conformant decoder
//
// API & wire format:
//   see include/wqlink/codec.hpp
// -----------------------------------------------------------------------------
#include "wqlink/codec.hpp"

#include <cmath>
#include <cstdio>

#ifdef ARDUINO

#include "wqlink/ajson_config.hpp"
#include <ArduinoJson.hpp>
using ArduinoJson::StaticJsonDocument;
using ArduinoJson::deserializeJson;
using ArduinoJson::JsonObject;

#else

#include "nlohmann/json.hpp"
using nlohmann::json;

#endif

namespace wqlink {
namespace codec {

double round2(double v) {
  return std::round(v * 100.0) / 100.0;    // std::round is half away from zero
}

std::optional<Body> encode(const SensorReading& reading) {
  const double t  = round2(reading.turbidity_ntu);
  const double ph = round2(reading.ph);
  const double c  = round2(reading.conductivity_us_cm);
  if (!std::isfinite(t) || !std::isfinite(ph) || !std::isfinite(c)) return std::nullopt;

  char buf[BODY_CAP];
  const int n = std::snprintf(buf, sizeof(buf), "{\"T\":%.2f,\"PH\":%.2f,\"C\":%.2f}", t, ph, c);
  // a truncated body is not JSON; refuse it instead of sending half a number
  if (n <= 0 || static_cast<size_t>(n) >= sizeof(buf)) return std::nullopt;
  return Body(buf, static_cast<size_t>(n));
}

std::optional<Decoded> decode(const char* body, size_t len) {
  if (!body || len == 0) return std::nullopt;
#ifdef ARDUINO
  // Embedded path: fixed-size document, no heap
  StaticJsonDocument<128> doc;
  auto error = deserializeJson(doc, body, len);
  if (error) return std::nullopt;

  JsonObject obj = doc.as<JsonObject>();
  if (obj.isNull()) return std::nullopt;
  if (!obj["T"].is<double>() || !obj["PH"].is<double>() || !obj["C"].is<double>()) {
    return std::nullopt;
  }

  Decoded d;
  d.turbidity    = obj["T"].as<double>();
  d.ph           = obj["PH"].as<double>();
  d.conductivity = obj["C"].as<double>();
  return d;
#else
  // Desktop path: parse without exceptions, then check shape
  json j = json::parse(body, body + len, nullptr, false);
  if (j.is_discarded() || !j.is_object()) return std::nullopt;

  for (const char* key : {"T", "PH", "C"}) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return std::nullopt;
  }

  Decoded d;
  d.turbidity    = j["T"].get<double>();
  d.ph           = j["PH"].get<double>();
  d.conductivity = j["C"].get<double>();
  return d;
#endif
}

} // namespace codec
} // namespace wqlink
