#pragma once
/**
 * @file transport_base.hpp
 * @brief Minimal connection-oriented transport capability used by the uplink.
 *
 * Header-only. No STL in the embedded path.
 */

#include <cstddef>
#include <cstdint>

namespace wqlink::transport {

// Return codes kept simple for embedded sanity.
enum class TxResult : uint8_t { Ok=0, Busy=1, Error=2 };
enum class RxResult : uint8_t { None=0, Ok=1, Error=2 };

/**
 * @brief Transport trait every uplink backend implements.
 *
 * Contract:
 *  - begin() probes the capability (socket stack, modem). false = absent, fatal.
 *  - open(host,port,timeout_ms) makes ONE connect attempt bounded by timeout_ms.
 *  - connected() reports whether the peer is still there (cheap, non-blocking).
 *  - available() returns bytes ready for recv().
 *  - recv(buf,cap) pulls up to cap bytes; RxResult::Ok & count>0 on success.
 *  - send(buf,len) writes the whole buffer or fails; no partial-write retry.
 *  - flush() pushes anything buffered onto the wire.
 *  - close() is idempotent.
 */
class ITransport {
public:
  virtual ~ITransport() = default;
  virtual bool        begin() = 0;
  virtual bool        open(const char* host, uint16_t port, uint32_t timeout_ms) = 0;
  virtual void        close() = 0;
  virtual bool        connected() const = 0;
  virtual std::size_t available() const = 0;
  virtual RxResult    recv(uint8_t* out, std::size_t cap, std::size_t& out_len) = 0;
  virtual TxResult    send(const uint8_t* data, std::size_t len) = 0;
  virtual bool        flush() = 0;
  virtual const char* name() const = 0;
};

} // namespace wqlink::transport
