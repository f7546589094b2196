#pragma once
/**
 * @file transport_base.hpp
 * @brief Minimal transport interface the TP90x session runs on.
 *
 * One notification in, one GATT write out. The session never sees a BLE
 * library; it only sees this interface. Header-only.
 */

#include <cstddef>
#include <cstdint>
#include <vector>

namespace tp90x::transport {

// Return codes kept simple; the session maps them onto tp90x::Status.
enum class TxResult : uint8_t { Ok=0, Busy=1, Error=2 };
enum class RxResult : uint8_t { None=0, Ok=1, Error=2, Closed=3 };

/// One GATT notification exactly as the link delivered it (padding included).
using Notification = std::vector<uint8_t>;

/**
 * @brief Transport trait every link adapter implements.
 *
 * Contract:
 *  - send(buf,len) performs one write; never blocks for long (return Busy instead).
 *  - recv(out,timeout_ms) waits at most timeout_ms for one notification:
 *      Ok     -> @p out holds it
 *      None   -> nothing arrived in time
 *      Closed -> the link is gone for good (peer dropped or end() was called)
 *      Error  -> the link failed
 *  - end() releases the link. Idempotent. The session calls it only after its
 *    receive thread has stopped.
 *  - name() is a short identifier for logs/diagnostics.
 *
 * send() is called from the caller's thread, recv() from the session's
 * receive thread; implementations must allow the two to overlap.
 */
class ITransport {
public:
  virtual ~ITransport() = default;
  virtual TxResult    send(const uint8_t* data, std::size_t len) = 0;
  virtual RxResult    recv(Notification& out, int timeout_ms) = 0;
  virtual void        end() = 0;
  virtual const char* name() const = 0;
  virtual std::size_t mtu() const = 0;
};

} // namespace tp90x::transport
