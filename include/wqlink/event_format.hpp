#pragma once
/**
 * @file event_format.hpp
 * @brief Render Events and UplinkStats for the console and for JSON lines.
 *
 * Key/value form, one event per line:
 * @code
 * event=sent severity=info at_ms=12034 code=200 elapsed_ms=41 timeouts=0 suppressed=29
 * event=reading severity=info at_ms=12000 T=499.88 PH=7.00 C=750.18
 * @endcode
 * Fields that do not apply to the kind are left out.
 */

#include <string>
#include "nlohmann/json.hpp"
#include "wqlink/events.hpp"
#include "wqlink/uplink.hpp"

namespace wqlink {

std::string format_event(const Event& ev);

nlohmann::json event_to_json(const Event& ev);

nlohmann::json stats_to_json(const UplinkStats& stats);

} // namespace wqlink
