// -----------------------------------------------------------------------------
// event_format.cpp - key=value and JSON rendering of uplink events
//
// API & line layout:
//   see include/wqlink/event_format.hpp
// -----------------------------------------------------------------------------
#include "wqlink/event_format.hpp"

#include <cstdio>
#include "wqlink/codec.hpp"

using nlohmann::json;

namespace wqlink {

namespace {

bool carries_status(EventKind kind) {
  return kind == EventKind::Sent || kind == EventKind::Ignored
      || kind == EventKind::UnexpectedStatus || kind == EventKind::ServerError;
}

bool carries_elapsed(EventKind kind) {
  return carries_status(kind) || kind == EventKind::Timeout
      || kind == EventKind::MalformedResponse || kind == EventKind::ConnectFailed;
}

bool carries_timeouts(EventKind kind) {
  return kind == EventKind::Timeout || kind == EventKind::MalformedResponse
      || kind == EventKind::ConnectFailed || kind == EventKind::Escalation;
}

std::string fixed2(float v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2f", codec::round2(v));
  return buf;
}

} // namespace

std::string format_event(const Event& ev) {
  std::string line;
  line.reserve(96);
  line += "event=";    line += to_string(ev.kind);
  line += " severity="; line += to_string(ev.severity);
  line += " at_ms=";   line += std::to_string(ev.at_ms);

  if (ev.kind == EventKind::Reading) {
    line += " T=";  line += fixed2(ev.turbidity);
    line += " PH="; line += fixed2(ev.ph);
    line += " C=";  line += fixed2(ev.conductivity);
  }
  if (carries_status(ev.kind)) {
    line += " code="; line += std::to_string(ev.status);
  }
  if (carries_elapsed(ev.kind)) {
    line += " elapsed_ms="; line += std::to_string(ev.elapsed_ms);
  }
  if (carries_timeouts(ev.kind)) {
    line += " timeouts="; line += std::to_string(static_cast<unsigned>(ev.consecutive_timeouts));
  }
  if (ev.suppressed > 0) {
    line += " suppressed="; line += std::to_string(ev.suppressed);
  }
  return line;
}

json event_to_json(const Event& ev) {
  json j;
  j["event"]    = to_string(ev.kind);
  j["severity"] = to_string(ev.severity);
  j["at_ms"]    = ev.at_ms;
  if (ev.kind == EventKind::Reading) {
    j["T"]  = codec::round2(ev.turbidity);
    j["PH"] = codec::round2(ev.ph);
    j["C"]  = codec::round2(ev.conductivity);
  }
  if (carries_status(ev.kind))   j["code"]       = ev.status;
  if (carries_elapsed(ev.kind))  j["elapsed_ms"] = ev.elapsed_ms;
  if (carries_timeouts(ev.kind)) j["timeouts"]   = ev.consecutive_timeouts;
  if (ev.suppressed > 0)         j["suppressed"] = ev.suppressed;
  return j;
}

json stats_to_json(const UplinkStats& s) {
  return json{
    {"cycles",            s.cycles},
    {"requests",          s.requests},
    {"accepted",          s.accepted},
    {"ignored",           s.ignored},
    {"answered_other",    s.answered_other},
    {"rejected",          s.rejected},
    {"timeouts",          s.timeouts},
    {"malformed",         s.malformed},
    {"connect_failures",  s.connect_failures},
    {"write_failures",    s.write_failures},
    {"transport_drops",   s.transport_drops},
    {"link_waits",        s.link_waits},
    {"renewals",          s.renewals},
    {"forced_reconnects", s.forced_reconnects},
    {"events_dropped",    s.events_dropped},
  };
}

} // namespace wqlink
