// -----------------------------------------------------------------------------
// config_file.cpp - JSON overlay for Config (nlohmann::json)
//
// API & file layout:
//   see include/wqlink/config_file.hpp
//
// POLICY: a key that is present must have the right type and fit the field;
// anything else is reported by name and the load fails. Absent keys are left
// alone. Range checks beyond "fits the type" belong to validate().
// -----------------------------------------------------------------------------
#include "wqlink/config_file.hpp"

#include <fstream>
#include <limits>

using nlohmann::json;

namespace wqlink {

namespace {

template <typename T>
bool read_uint(const json& obj, const char* key, T& out, std::string& err, const char* name) {
  if (!obj.contains(key)) return true;
  const json& v = obj.at(key);
  if (!v.is_number_unsigned() || v.get<uint64_t>() > std::numeric_limits<T>::max()) {
    err = name;
    return false;
  }
  out = static_cast<T>(v.get<uint64_t>());
  return true;
}

bool read_bool(const json& obj, const char* key, bool& out, std::string& err, const char* name) {
  if (!obj.contains(key)) return true;
  if (!obj.at(key).is_boolean()) { err = name; return false; }
  out = obj.at(key).get<bool>();
  return true;
}

bool read_string(const json& obj, const char* key, std::string& out, std::string& err, const char* name) {
  if (!obj.contains(key)) return true;
  if (!obj.at(key).is_string()) { err = name; return false; }
  out = obj.at(key).get<std::string>();
  return true;
}

// Nested section: absent is fine, present-but-not-object is an error.
const json* section(const json& j, const char* key, std::string& err, bool& ok) {
  ok = true;
  if (!j.contains(key)) return nullptr;
  if (!j.at(key).is_object()) { err = key; ok = false; return nullptr; }
  return &j.at(key);
}

} // namespace

bool apply_config_json(const json& j, Config& cfg, std::string& err) {
  if (!j.is_object()) { err = "config_not_object"; return false; }

  bool ok = true;
  if (const json* ep = section(j, "endpoint", err, ok)) {
    if (!read_string(*ep, "host", cfg.endpoint.host, err, "endpoint.host")) return false;
    if (!read_uint(*ep, "port", cfg.endpoint.port, err, "endpoint.port")) return false;
    if (!read_string(*ep, "path", cfg.endpoint.path, err, "endpoint.path")) return false;
  }
  if (!ok) return false;

  if (const json* sp = section(j, "sampler", err, ok)) {
    if (!read_uint(*sp, "samples", cfg.sampler.samples, err, "sampler.samples")) return false;
    if (!read_uint(*sp, "pause_ms", cfg.sampler.pause_ms, err, "sampler.pause_ms")) return false;
  }
  if (!ok) return false;

  if (const json* ch = section(j, "channels", err, ok)) {
    if (!read_uint(*ch, "turbidity", cfg.channels.turbidity, err, "channels.turbidity")) return false;
    if (!read_uint(*ch, "ph", cfg.channels.ph, err, "channels.ph")) return false;
    if (!read_uint(*ch, "conductivity", cfg.channels.conductivity, err, "channels.conductivity")) return false;
  }
  if (!ok) return false;

  if (const json* ln = section(j, "link", err, ok)) {
    if (!read_string(*ln, "interface", cfg.link_interface, err, "link.interface")) return false;
  }
  if (!ok) return false;

  if (const json* adc = section(j, "adc", err, ok)) {
    if (!read_string(*adc, "device", cfg.adc_device, err, "adc.device")) return false;
  }
  if (!ok) return false;

  return read_uint(j, "sample_interval_ms", cfg.sample_interval_ms, err, "sample_interval_ms")
      && read_bool(j, "keep_alive", cfg.keep_alive, err, "keep_alive")
      && read_uint(j, "renewal_interval_ms", cfg.renewal_interval_ms, err, "renewal_interval_ms")
      && read_uint(j, "request_timeout_ms", cfg.request_timeout_ms, err, "request_timeout_ms")
      && read_uint(j, "connect_timeout_ms", cfg.connect_timeout_ms, err, "connect_timeout_ms")
      && read_uint(j, "connect_poll_ms", cfg.connect_poll_ms, err, "connect_poll_ms")
      && read_uint(j, "response_poll_ms", cfg.response_poll_ms, err, "response_poll_ms")
      && read_uint(j, "max_consecutive_timeouts", cfg.max_consecutive_timeouts, err, "max_consecutive_timeouts")
      && read_uint(j, "stale_warning_ms", cfg.stale_warning_ms, err, "stale_warning_ms")
      && read_uint(j, "report_interval_ms", cfg.report_interval_ms, err, "report_interval_ms")
      && read_uint(j, "reading_report_ms", cfg.reading_report_ms, err, "reading_report_ms")
      && read_uint(j, "drain_cap_bytes", cfg.drain_cap_bytes, err, "drain_cap_bytes");
}

bool load_config_file(const std::string& path, Config& cfg, std::string& err) {
  std::ifstream in(path);
  if (!in) { err = "config_unreadable"; return false; }

  // parse without exceptions; a discarded value means malformed JSON
  json j = json::parse(in, nullptr, false);
  if (j.is_discarded()) { err = "config_parse"; return false; }

  return apply_config_json(j, cfg, err);
}

json config_to_json(const Config& cfg) {
  json j;
  j["endpoint"] = {
    {"host", cfg.endpoint.host},
    {"port", cfg.endpoint.port},
    {"path", cfg.endpoint.path},
  };
  j["sampler"] = {
    {"samples", cfg.sampler.samples},
    {"pause_ms", cfg.sampler.pause_ms},
  };
  j["channels"] = {
    {"turbidity", cfg.channels.turbidity},
    {"ph", cfg.channels.ph},
    {"conductivity", cfg.channels.conductivity},
  };
  j["link"] = {{"interface", cfg.link_interface}};
  j["adc"]  = {{"device", cfg.adc_device}};
  j["sample_interval_ms"]       = cfg.sample_interval_ms;
  j["keep_alive"]               = cfg.keep_alive;
  j["renewal_interval_ms"]      = cfg.renewal_interval_ms;
  j["request_timeout_ms"]       = cfg.request_timeout_ms;
  j["connect_timeout_ms"]       = cfg.connect_timeout_ms;
  j["connect_poll_ms"]          = cfg.connect_poll_ms;
  j["response_poll_ms"]         = cfg.response_poll_ms;
  j["max_consecutive_timeouts"] = cfg.max_consecutive_timeouts;
  j["stale_warning_ms"]         = cfg.stale_warning_ms;
  j["report_interval_ms"]       = cfg.report_interval_ms;
  j["reading_report_ms"]        = cfg.reading_report_ms;
  j["drain_cap_bytes"]          = cfg.drain_cap_bytes;
  return j;
}

} // namespace wqlink
