#pragma once
/**
 * @file config_file.hpp
 * @brief JSON config file <-> Config (desktop/Linux builds, nlohmann::json).
 *
 * File layout mirrors the struct:
 * @code
 * {
 *   "endpoint": {"host": "10.0.0.5", "port": 8000, "path": "/water-monitor/publish"},
 *   "sampler":  {"samples": 10, "pause_ms": 2},
 *   "channels": {"turbidity": 0, "ph": 1, "conductivity": 2},
 *   "sample_interval_ms": 1000,
 *   "keep_alive": true,
 *   "link": {"interface": "wlan0"},
 *   "adc":  {"device": "/sys/bus/iio/devices/iio:device0"}
 * }
 * @endcode
 * Missing keys keep their current value, so a file only lists what it changes.
 */

#include <string>
#include "nlohmann/json.hpp"
#include "wqlink/config.hpp"

namespace wqlink {

/**
 * @brief Overlay a JSON document onto `cfg`.
 * @return false with `err` set on a type mismatch or out-of-range number.
 */
bool apply_config_json(const nlohmann::json& j, Config& cfg, std::string& err);

/**
 * @brief Read `path` and overlay it onto `cfg`.
 * @return false with `err` = "config_unreadable", "config_parse" or a field name.
 */
bool load_config_file(const std::string& path, Config& cfg, std::string& err);

/// Effective configuration as JSON (same layout the loader accepts).
nlohmann::json config_to_json(const Config& cfg);

} // namespace wqlink
