// -----------------------------------------------------------------------------
// request_pipeline.cpp - request framing, bounded response poll, drain
//
// API & wire layout:
//   see include/wqlink/request_pipeline.hpp
// -----------------------------------------------------------------------------
#include "wqlink/request_pipeline.hpp"

#include <string.h>

namespace wqlink {

using transport::RxResult;
using transport::TxResult;

namespace {

constexpr char STATUS_PREFIX[] = "HTTP/";
constexpr size_t STATUS_PREFIX_LEN = sizeof(STATUS_PREFIX) - 1;

bool is_space(char c) { return c == ' ' || c == '\t'; }

// Bounded append; false instead of silent truncation.
bool put(etl::istring& out, const char* s, size_t n) {
  if (out.available() < n) return false;
  out.append(s, n);
  return true;
}

bool put(etl::istring& out, const char* s) { return put(out, s, strlen(s)); }

// Decimal without heap or printf.
bool put_uint(etl::istring& out, uint32_t n) {
  char buf[10];
  size_t idx = 0;
  do {
    buf[idx++] = static_cast<char>('0' + n % 10);
    n /= 10;
  } while (n > 0 && idx < sizeof(buf));
  char rev[10];
  for (size_t i = 0; i < idx; ++i) rev[i] = buf[idx - 1 - i];
  return put(out, rev, idx);
}

} // namespace

PipelinePolicy pipeline_policy(const Config& cfg) {
  PipelinePolicy p;
  p.keep_alive = cfg.keep_alive;
  p.poll_ms    = cfg.response_poll_ms;
  p.drain_cap  = cfg.drain_cap_bytes;
  return p;
}

// -----------------------------------------------------------------------------
// parse_status_line()
// POLICY:
//   - Status line iff the line *starts* with "HTTP/".
//   - Tokens are whitespace-delimited; token #2 must be exactly 3 digits.
//   - "HTTP/1.1 2OO OK" or "HTTP/1.1" alone -> is_status_line, no code.
// -----------------------------------------------------------------------------
StatusLine parse_status_line(const char* line, size_t len) {
  StatusLine out;
  if (!line || len < STATUS_PREFIX_LEN || memcmp(line, STATUS_PREFIX, STATUS_PREFIX_LEN) != 0) {
    return out;
  }
  out.is_status_line = true;

  size_t i = 0;
  while (i < len && !is_space(line[i])) ++i;        // skip version token
  while (i < len && is_space(line[i])) ++i;         // skip separator
  const size_t start = i;
  while (i < len && !is_space(line[i])) ++i;        // second token

  if (i - start != 3) return out;
  uint16_t code = 0;
  for (size_t k = start; k < i; ++k) {
    if (line[k] < '0' || line[k] > '9') return out;
    code = static_cast<uint16_t>(code * 10 + (line[k] - '0'));
  }
  out.code = code;
  return out;
}

RequestPipeline::RequestPipeline(UplinkConnection& connection, IClock& clock,
                                 const PipelinePolicy& policy)
: connection_(connection), clock_(clock), policy_(policy) {}

bool RequestPipeline::build_request(const Endpoint& ep, bool keep_alive,
                                    const char* body, size_t body_len, RequestBuf& out) {
  out.clear();
  bool ok = put(out, "POST ")
         && put(out, ep.path.c_str(), ep.path.size())
         && put(out, " HTTP/1.1\r\nHost: ")
         && put(out, ep.host.c_str(), ep.host.size());
  if (ok && ep.port != 80) {
    ok = put(out, ":") && put_uint(out, ep.port);
  }
  ok = ok
    && put(out, keep_alive ? "\r\nConnection: keep-alive" : "\r\nConnection: close")
    && put(out, "\r\nContent-Type: application/json\r\nContent-Length: ")
    && put_uint(out, static_cast<uint32_t>(body_len))
    && put(out, "\r\n\r\n")
    && put(out, body, body_len);
  return ok;
}

// -----------------------------------------------------------------------------
// send()
// POLICY:
//   - Bytes still queued from an earlier exchange (a late reply, a body that
//     trailed its headers) are thrown away first, bounded by drain_cap. If
//     they do not clear, the stream is out of sync: discard and fail.
//   - One write, one flush. Busy/partial/error all count as WriteFailure;
//     the connection is discarded right here so the next tick starts clean.
// -----------------------------------------------------------------------------
bool RequestPipeline::send(const codec::Body& body) {
  if (!connection_.is_connected()) return false;

  if (connection_.available() > 0) {
    bool dead = false;
    (void)drain(dead);
    if (dead || connection_.available() > 0) {
      connection_.discard();
      return false;
    }
  }

  RequestBuf req;
  if (!build_request(connection_.endpoint(), policy_.keep_alive, body.c_str(), body.size(), req)) {
    connection_.discard();
    return false;
  }

  const TxResult tx = connection_.write(reinterpret_cast<const uint8_t*>(req.data()), req.size());
  if (tx != TxResult::Ok || !connection_.flush()) {
    connection_.discard();
    return false;
  }
  return true;
}

bool RequestPipeline::feed(uint8_t byte) {
  if (byte == '\n') {
    if (!line_.empty() && line_.back() == '\r') line_.pop_back();
    return true;
  }
  if (!line_.full()) line_ += static_cast<char>(byte);  // overlong lines are truncated
  return false;
}

// -----------------------------------------------------------------------------
// receive()
// PRE:   send() returned true.
// POLICY:
//   - Deadline checked against the clock once per poll iteration.
//   - Bytes are consumed one at a time so nothing past the blank line is
//     pulled into the line buffer.
//   - First status line wins; later ones (e.g. after a 1xx) are ignored.
//   - Bytes left after drain_cap would prefix the next status line, so the
//     connection is discarded (desynced).
//   - A finished exchange, answered or not, counts as connection activity.
// OUT:   Outcome; transport_dead or desynced imply the connection was discarded.
// -----------------------------------------------------------------------------
Outcome RequestPipeline::receive(uint32_t timeout_ms) {
  Outcome out;
  line_.clear();
  const uint32_t start = clock_.now_ms();
  bool seen_status = false;
  bool done = false;

  while (!done && elapsed_ms(clock_.now_ms(), start) < timeout_ms) {
    if (!connection_.is_connected()) break;

    if (connection_.available() == 0) {
      if (!connection_.peer_alive()) {              // closed with nothing left to read
        out.transport_dead = true;
        break;
      }
      clock_.sleep_ms(policy_.poll_ms);
      continue;
    }

    while (!done) {
      uint8_t byte = 0;
      size_t n = 0;
      const RxResult rx = connection_.read(&byte, 1, n);
      if (rx == RxResult::Error) { out.transport_dead = true; done = true; break; }
      if (rx == RxResult::None || n == 0) break;    // back to polling
      if (!feed(byte)) continue;

      if (line_.empty()) {                          // end of header section
        out.header_ended = true;
        done = true;
      } else if (!seen_status) {
        const StatusLine sl = parse_status_line(line_.data(), line_.size());
        if (sl.is_status_line) {
          seen_status = true;
          if (sl.code) {
            out.received    = true;
            out.status_code = sl.code;
          } else {
            out.malformed = true;
          }
        }
      }
      line_.clear();
    }
  }

  out.elapsed_ms = elapsed_ms(clock_.now_ms(), start);

  if (!out.transport_dead) out.drained = drain(out.transport_dead);
  if (out.transport_dead) {
    connection_.discard();
  } else if (connection_.available() > 0) {
    out.desynced = true;
    connection_.discard();
  } else {
    connection_.note_activity(clock_.now_ms());
  }
  return out;
}

size_t RequestPipeline::drain(bool& transport_dead) {
  size_t total = 0;
  uint8_t buf[64];
  while (total < policy_.drain_cap && connection_.available() > 0) {
    size_t want = policy_.drain_cap - total;
    if (want > sizeof(buf)) want = sizeof(buf);
    size_t n = 0;
    const RxResult rx = connection_.read(buf, want, n);
    if (rx == RxResult::Error) { transport_dead = true; break; }
    if (rx == RxResult::None || n == 0) break;
    total += n;
  }
  return total;
}

} // namespace wqlink
