/**
 * @file request_pipeline.hpp
 * @brief RequestPipeline - one request/response exchange per tick.
 *
 * @details
 * Frames a single `POST <path> HTTP/1.1` with the JSON body over a connection
 * UplinkConnection has already made usable, then watches the reply only as
 * far as the end of the header section. No pipelining: one request in flight,
 * so every outcome maps to exactly one reading.
 *
 * @par Request
 * @code
 * POST /water-monitor/publish HTTP/1.1\r\n
 * Host: 10.0.0.5:8000\r\n
 * Connection: keep-alive\r\n
 * Content-Type: application/json\r\n
 * Content-Length: 33\r\n
 * \r\n
 * {"T":499.88,"PH":7.00,"C":750.18}
 * @endcode
 * The port is appended to Host only when it is not 80. The whole request is
 * written in one call and flushed; a failed or partial write is not retried,
 * the connection is discarded instead.
 *
 * @par Response
 * receive() polls until one of:
 *   - a blank line (end of headers) - return early, body left unread;
 *   - the deadline - nothing useful seen, or a status line without its
 *     blank line;
 *   - the transport dies - connection discarded, whatever was parsed stands.
 * Lines are tokenized, not substring-searched: a line starting with `HTTP/`
 * is a status line, its second whitespace-delimited token must be exactly
 * three digits. Anything else on such a line marks the response malformed.
 * Leftover bytes are drained afterwards, at most drain_cap bytes. Anything
 * still queued after that would prefix the next status line, so the
 * connection is discarded (Outcome::desynced). send() likewise clears bytes
 * that trickled in after the previous receive() before writing.
 */
#ifndef WQLINK_REQUEST_PIPELINE_HPP
#define WQLINK_REQUEST_PIPELINE_HPP

#include <stdint.h>
#include <stddef.h>
#include <optional>
#include "etl/string.h"
#include "wqlink/clock.hpp"
#include "wqlink/codec.hpp"
#include "wqlink/config.hpp"
#include "wqlink/uplink_connection.hpp"

namespace wqlink {

static constexpr size_t REQUEST_CAP = 512;   ///< head + body; config caps keep it in range
static constexpr size_t LINE_CAP    = 128;   ///< longer response lines are truncated

using RequestBuf = etl::string<REQUEST_CAP>;
using LineBuf    = etl::string<LINE_CAP>;

/// Typed result of looking at one response line.
struct StatusLine {
  bool                    is_status_line{false};  ///< starts with "HTTP/"
  std::optional<uint16_t> code;                   ///< set when the second token is 3 digits
};

/**
 * @brief Tokenize one response line (CR/LF already stripped).
 * @details Only the *start* of the line decides whether it is a status line,
 *          so a header value that happens to contain "200" never matches.
 */
StatusLine parse_status_line(const char* line, size_t len);

/// What one receive() saw. Returned to the caller unchanged.
struct Outcome {
  bool                    received{false};        ///< a valid status code was parsed
  std::optional<uint16_t> status_code;
  uint32_t                elapsed_ms{0};          ///< time spent waiting for the reply
  bool                    header_ended{false};    ///< blank line seen
  bool                    malformed{false};       ///< status line present, code unparseable
  bool                    transport_dead{false};  ///< connection died; already discarded
  bool                    desynced{false};        ///< bytes left past drain_cap; already discarded
  size_t                  drained{0};             ///< residual bytes thrown away
};

struct PipelinePolicy {
  bool     keep_alive{true};
  uint32_t poll_ms{5};
  uint32_t drain_cap{512};
};

PipelinePolicy pipeline_policy(const Config& cfg);

class RequestPipeline {
public:
  RequestPipeline(UplinkConnection& connection, IClock& clock, const PipelinePolicy& policy);

  /**
   * @brief Write request line, headers, blank line and body; then flush.
   * @retval true  Whole request handed to the transport.
   * @retval false Write failed, or stale bytes from an earlier exchange
   *               could not be cleared; the connection has been discarded.
   */
  bool send(const codec::Body& body);

  /**
   * @brief Wait up to `timeout_ms` for the status line / end of headers.
   * @return Outcome; `received` is false on timeout, malformed status or a
   *         dead transport that never produced a status line.
   */
  Outcome receive(uint32_t timeout_ms);

  /**
   * @brief Compose the full request into `out`.
   * @return false if it does not fit REQUEST_CAP (cannot happen after validate()).
   */
  static bool build_request(const Endpoint& ep, bool keep_alive,
                            const char* body, size_t body_len, RequestBuf& out);

private:
  /// Feed one byte; true when `line_` holds a complete line.
  bool feed(uint8_t byte);

  /// Throw away residual bytes, bounded by drain_cap.
  size_t drain(bool& transport_dead);

  UplinkConnection& connection_;
  IClock&           clock_;
  PipelinePolicy    policy_;
  LineBuf           line_;
};

} // namespace wqlink

#endif // WQLINK_REQUEST_PIPELINE_HPP
