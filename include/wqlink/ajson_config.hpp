#pragma once
/**
 * @file ajson_config.hpp
 * @brief ArduinoJson switches for the embedded decode path.
 *
 * Included by codec.cpp right before ArduinoJson.hpp on ARDUINO builds.
 *
 * - Telemetry members are two-decimal numbers up to 1500.00; AVR cores
 *   default to float storage, which cannot hold them to 0.01.
 * - The collector never sends NaN or Infinity, so neither literal is accepted.
 * - Bodies are flat objects with ASCII keys.
 */

#define ARDUINOJSON_USE_DOUBLE            1
#define ARDUINOJSON_USE_LONG_LONG         0
#define ARDUINOJSON_ENABLE_NAN            0
#define ARDUINOJSON_ENABLE_INFINITY       0
#define ARDUINOJSON_DECODE_UNICODE        0
#define ARDUINOJSON_DEFAULT_NESTING_LIMIT 2
