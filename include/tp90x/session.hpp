#pragma once
/**
 * @file session.hpp
 * @brief TP90x Session: one transport, one request in flight, one broadcast stream.
 *
 * @details
 * ## Field Brief
 * The thermometer talks over a single GATT notify characteristic. Replies to
 * our requests and the device's own 0x30 temperature broadcasts arrive on the
 * same pipe, interleaved, with no correlation id. The Session sorts them out:
 * the reply we are waiting for goes to the caller, everything else goes to the
 * broadcast stream.
 *
 * ---
 *
 * @par Operational Model
 * ```
 *   caller thread                         receive thread (owned by Session)
 *        │                                         │
 *   submit_request(op) ──► pending slot ◄── match? ┤◄── transport.recv(poll_ms)
 *        │   (wait, deadline)                      │
 *        ◄── reply frame                      else ├──► BroadcastChannel
 *                                                  │        │
 *   broadcasts().next() ◄──────────────────────────┘────────┘
 * ```
 *
 * - **One request at a time.** A call mutex serializes submit_request and
 *   submit_write; the pending slot holds at most one expected opcode.
 * - **First match wins.** The first inbound frame whose opcode equals the
 *   expected response completes the request. Broadcasts never block it.
 * - **Timeouts release the slot.** No retry. A late reply after a timeout is
 *   treated like any other unsolicited frame.
 *
 * ---
 *
 * @par State Machine
 * ```
 *   Disconnected ──start()──► Connected ──submit 0x01──► Authenticating
 *        ▲                        ▲                          │
 *        │                        └──── 0x01 failed ─────────┤
 *        │                                                   ▼ 0x01 ok
 *        └──────── close() / link lost / transport error ── Ready
 * ```
 * Only Ready accepts arbitrary opcodes. Connected and Authenticating accept the
 * 0x01 exchange only; anything else fails with InvalidState. A session that has
 * been closed stays closed; make a new one to reconnect.
 *
 * ---
 *
 * @par Failure Model
 * - Frame fails to decode (short, bad checksum): logged, dropped.
 * - Broadcast with unexpected length or corrupt BCD: logged, dropped.
 * - Expected reply with wrong length: request fails with UnexpectedPayloadLength.
 * - Transport send/recv error: TransportError, session goes Disconnected for good.
 * - Transport reports Closed, or close() is called: pending request fails with
 *   Cancelled, broadcast stream ends after draining.
 *
 * @author Leo
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include "tp90x/commands.hpp"
#include "tp90x/frame.hpp"
#include "tp90x/messages.hpp"
#include "tp90x/status.hpp"
#include "tp90x/transport/transport_base.hpp"

namespace tp90x {

enum class SessionState : uint8_t { Disconnected, Connected, Authenticating, Ready };

const char* to_string(SessionState s);

/// Timing and queue knobs. Defaults match the values the CLI ships with.
struct SessionConfig {
  uint32_t request_timeout_ms{5000};   ///< default deadline for submit_request
  uint32_t write_grace_ms{300};        ///< default echo window for submit_write
  uint32_t receive_poll_ms{50};        ///< receive thread slice; bounds close() latency
  size_t   broadcast_backlog{0};       ///< 0 = unbounded; else oldest is dropped
};

/// Longest receive slice the session will use; larger values are clamped.
static constexpr uint32_t MAX_RECEIVE_POLL_MS = 60000;

class BroadcastChannel;   // session.cpp

/**
 * @class BroadcastStream
 * @brief Consumer handle on the session's broadcast queue.
 *
 * Order-preserving and lazy: values wait in the queue until next() is called.
 * Every handle from the same session reads the same queue, so use one
 * consumer. After the session ends, queued values are still returned; once
 * they are drained next() reports Cancelled forever.
 *
 * A default-constructed stream is already ended.
 */
class BroadcastStream {
public:
  BroadcastStream() = default;

  /// Ok (value in @p out), Timeout (nothing yet), Cancelled (ended and drained).
  Status next(InboundMessage& out, uint32_t timeout_ms);

  /// Like next(), but skips everything that is not a 0x30 broadcast.
  Status next_temperature(TemperatureBroadcast& out, uint32_t timeout_ms);

  /// Values waiting right now.
  size_t queued() const;

  bool valid() const { return static_cast<bool>(ch_); }

private:
  friend class Session;
  explicit BroadcastStream(std::shared_ptr<BroadcastChannel> ch) : ch_(std::move(ch)) {}

  std::shared_ptr<BroadcastChannel> ch_;
};

/**
 * @class Session
 * @brief Owns one transport and its receive thread; correlates replies.
 *
 * **Typical usage:**
 * @code
 *   tp90x::Session s(std::move(transport));
 *   s.start();
 *
 *   tp90x::Frame reply;
 *   auto auth = tp90x::make_auth(tp90x::KNOWN_AUTH_PAYLOAD);
 *   if (s.submit_request(auth, reply) == tp90x::Status::Ok) {
 *     // s.state() == SessionState::Ready
 *   }
 *
 *   auto stream = s.broadcasts();
 *   tp90x::TemperatureBroadcast b;
 *   while (stream.next_temperature(b, 2000) == tp90x::Status::Ok) { ... }
 * @endcode
 */
class Session {
public:
  explicit Session(std::unique_ptr<transport::ITransport> transport, SessionConfig cfg = {});
  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  /// Disconnected -> Connected and spawn the receive thread. InvalidState if
  /// already started or closed; InvalidArgument without a transport.
  Status start();

  /// Cancel the pending request, stop the receive thread, end the transport,
  /// end the broadcast stream. Idempotent.
  void close();

  /**
   * @brief Send @p opcode and wait for its catalog response opcode.
   *
   * @return Ok with the reply in @p reply, or one of: InvalidArgument (not a
   *         request/response opcode), UnexpectedPayloadLength (outbound length
   *         or reply length off-catalog), InvalidState, Timeout, Cancelled,
   *         TransportError.
   */
  Status submit_request(uint8_t opcode, const Payload& payload, uint32_t timeout_ms, Frame& reply);

  Status submit_request(const Request& r, Frame& reply) {
    return submit_request(r.opcode, r.payload, cfg_.request_timeout_ms, reply);
  }

  /**
   * @brief Send a write and wait up to @p grace_ms for an echo of the same opcode.
   *
   * Silence is success. An echo ends the wait early. @p grace_ms == 0 returns
   * right after the send. 0x01 cannot be written this way.
   */
  Status submit_write(uint8_t opcode, const Payload& payload, uint32_t grace_ms);

  Status submit_write(const Request& r) {
    return submit_write(r.opcode, r.payload, cfg_.write_grace_ms);
  }

  SessionState state() const;

  /// Handle on the broadcast queue. Valid even after close() (drains, then ends).
  BroadcastStream broadcasts() const { return BroadcastStream(channel_); }

  const SessionConfig& config() const { return cfg_; }

private:
  using Clock = std::chrono::steady_clock;

  // Single-slot mailbox for the one request in flight.
  struct Pending {
    bool              active{false};
    bool              done{false};
    uint8_t           expect{0};        ///< opcode that completes the request
    Status            result{Status::Ok};
    Frame             reply;
    Clock::time_point submitted{};
    Clock::time_point deadline{};
  };

  void   receive_loop();
  void   dispatch(const transport::Notification& raw);
  void   link_down(Status why);                      ///< fatal: Disconnected, fail pending, end stream
  Status admit_locked(uint8_t opcode, std::string& moved);  ///< state gate; may move Connected -> Authenticating
  std::string set_state_locked(SessionState next);          ///< "from=.. to=.." or empty if unchanged
  static void log_transition(const std::string& moved);
  Status send_frame(uint8_t opcode, const Payload& payload);
  Status await_locked(std::unique_lock<std::mutex>& lk, Clock::time_point deadline, bool silence_ok);

  std::unique_ptr<transport::ITransport> transport_;
  SessionConfig                          cfg_;
  std::shared_ptr<BroadcastChannel>      channel_;

  std::thread       reader_;
  std::atomic<bool> stop_{false};
  std::once_flag    close_once_;

  std::mutex              call_mu_;   // serializes callers
  mutable std::mutex      mu_;        // state_, closed_, started_, pending_
  std::condition_variable cv_;
  SessionState            state_{SessionState::Disconnected};
  bool                    started_{false};
  bool                    closed_{false};
  Pending                 pending_;
};

} // namespace tp90x

