// -----------------------------------------------------------------------------
// config.cpp - range checks for the uplink configuration
//
// API & field descriptions:
//   see include/wqlink/config.hpp
// -----------------------------------------------------------------------------
#include "wqlink/config.hpp"

namespace wqlink {

namespace {

// Request-line and header injection guard: no whitespace or control bytes.
bool is_token_text(const std::string& s) {
  for (char c : s) {
    const unsigned char u = static_cast<unsigned char>(c);
    if (u <= 0x20 || u == 0x7F) return false;
  }
  return true;
}

bool fail(std::string& err, const char* reason) {
  err = reason;
  return false;
}

} // namespace

bool validate(const Config& cfg, std::string& err) {
  const Endpoint& ep = cfg.endpoint;
  if (ep.host.empty() || ep.host.size() > HOST_CAP || !is_token_text(ep.host))
    return fail(err, "endpoint.host");
  if (ep.port == 0)
    return fail(err, "endpoint.port");
  if (ep.path.empty() || ep.path.front() != '/' || ep.path.size() > PATH_CAP || !is_token_text(ep.path))
    return fail(err, "endpoint.path");

  if (cfg.sampler.samples == 0 || cfg.sampler.samples > 64)
    return fail(err, "sampler.samples");
  if (cfg.sampler.pause_ms > 100)
    return fail(err, "sampler.pause_ms");

  const ChannelMap& ch = cfg.channels;
  if (ch.turbidity > 7 || ch.ph > 7 || ch.conductivity > 7)
    return fail(err, "channels.range");
  if (ch.turbidity == ch.ph || ch.turbidity == ch.conductivity || ch.ph == ch.conductivity)
    return fail(err, "channels.distinct");

  if (cfg.sample_interval_ms == 0)
    return fail(err, "sample_interval_ms");
  if (cfg.keep_alive && cfg.renewal_interval_ms == 0)
    return fail(err, "renewal_interval_ms");
  if (cfg.request_timeout_ms == 0 || cfg.request_timeout_ms > 60000)
    return fail(err, "request_timeout_ms");
  if (cfg.connect_timeout_ms == 0 || cfg.connect_timeout_ms > 60000)
    return fail(err, "connect_timeout_ms");
  if (cfg.connect_poll_ms == 0 || cfg.connect_poll_ms > cfg.connect_timeout_ms)
    return fail(err, "connect_poll_ms");
  if (cfg.response_poll_ms == 0 || cfg.response_poll_ms > cfg.request_timeout_ms)
    return fail(err, "response_poll_ms");
  if (cfg.max_consecutive_timeouts == 0)
    return fail(err, "max_consecutive_timeouts");
  if (cfg.drain_cap_bytes > 65536)
    return fail(err, "drain_cap_bytes");

  err.clear();
  return true;
}

} // namespace wqlink
