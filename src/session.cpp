// ============================================================================
// session.cpp: request/response correlation over one transport
// Overview and state machine live in include/tp90x/session.hpp.
// Tests: tests/test_session.cpp
// ============================================================================

#include "tp90x/session.hpp"
#include "tp90x/catalog.hpp"   // validate_outbound(), find_command(), decode_inbound()
#include "tp90x/log.hpp"

#include <algorithm>
#include <deque>
#include <string>

namespace tp90x {

using transport::Notification;
using transport::RxResult;
using transport::TxResult;

// ============================================================================
// BroadcastChannel: unbounded (or capped) FIFO between the receive thread
// and whoever holds a BroadcastStream.
// ============================================================================

class BroadcastChannel {
public:
  using Clock = std::chrono::steady_clock;

  explicit BroadcastChannel(size_t backlog) : backlog_(backlog) {}

  /// Returns true if the oldest value had to be dropped to make room.
  bool push(InboundMessage m) {
    bool dropped = false;
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (closed_) return false;
      if (backlog_ > 0 && q_.size() >= backlog_) {
        q_.pop_front();
        dropped = true;
      }
      q_.push_back(std::move(m));
    }
    cv_.notify_one();
    return dropped;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lk(mu_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  Status pop(InboundMessage& out, Clock::time_point deadline) {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_until(lk, deadline, [this] { return !q_.empty() || closed_; });
    if (!q_.empty()) {
      out = std::move(q_.front());
      q_.pop_front();
      return Status::Ok;
    }
    return closed_ ? Status::Cancelled : Status::Timeout;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return q_.size();
  }

private:
  size_t                     backlog_{0};
  mutable std::mutex         mu_;
  std::condition_variable    cv_;
  std::deque<InboundMessage> q_;
  bool                       closed_{false};
};

// ============================================================================
// BroadcastStream
// ============================================================================

Status BroadcastStream::next(InboundMessage& out, uint32_t timeout_ms) {
  if (!ch_) return Status::Cancelled;
  return ch_->pop(out, BroadcastChannel::Clock::now() + std::chrono::milliseconds(timeout_ms));
}

Status BroadcastStream::next_temperature(TemperatureBroadcast& out, uint32_t timeout_ms) {
  if (!ch_) return Status::Cancelled;
  const auto deadline = BroadcastChannel::Clock::now() + std::chrono::milliseconds(timeout_ms);

  InboundMessage m;
  while (true) {
    Status st = ch_->pop(m, deadline);
    if (st != Status::Ok) return st;
    if (auto* b = std::get_if<TemperatureBroadcast>(&m)) {
      out = *b;
      return Status::Ok;
    }
  }
}

size_t BroadcastStream::queued() const { return ch_ ? ch_->size() : 0; }

// ============================================================================
// Session
// ============================================================================

const char* to_string(SessionState s) {
  switch (s) {
    case SessionState::Disconnected:   return "disconnected";
    case SessionState::Connected:      return "connected";
    case SessionState::Authenticating: return "authenticating";
    case SessionState::Ready:          return "ready";
  }
  return "unknown";
}

static std::string op_detail(uint8_t opcode) {
  std::string s = "op=" + hex_byte(opcode);
  if (const CommandDescriptor* d = find_command(opcode)) {
    s += " name=";
    s += d->name;
  }
  return s;
}

Session::Session(std::unique_ptr<transport::ITransport> transport, SessionConfig cfg)
: transport_(std::move(transport)),
  cfg_(cfg),
  channel_(std::make_shared<BroadcastChannel>(cfg.broadcast_backlog)) {}

Session::~Session() { close(); }

Status Session::start() {
  std::string moved;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!transport_) return Status::InvalidArgument;
    if (started_ || closed_) return Status::InvalidState;

    started_ = true;
    moved = set_state_locked(SessionState::Connected);
    reader_ = std::thread(&Session::receive_loop, this);
  }
  log_transition(moved);
  log_event(LogLevel::Info, "session_started", std::string("transport=") + transport_->name());
  return Status::Ok;
}

void Session::close() {
  std::call_once(close_once_, [this] {
    std::string moved;
    {
      std::lock_guard<std::mutex> lk(mu_);
      closed_ = true;
      if (pending_.active && !pending_.done) {
        pending_.done   = true;
        pending_.result = Status::Cancelled;
      }
      moved = set_state_locked(SessionState::Disconnected);
    }
    cv_.notify_all();
    log_transition(moved);

    stop_.store(true);
    if (reader_.joinable()) reader_.join();   // at most one poll slice
    if (transport_) transport_->end();
    channel_->close();
    log_event(LogLevel::Info, "session_closed");
  });
}

SessionState Session::state() const {
  std::lock_guard<std::mutex> lk(mu_);
  return state_;
}

// ---------------------------------------------------------------------------
// State helpers (mu_ held). Nothing here logs; callers pass the returned
// transition to log_transition() once mu_ is released.
// ---------------------------------------------------------------------------

std::string Session::set_state_locked(SessionState next) {
  if (next == state_) return {};
  std::string moved = std::string("from=") + to_string(state_) + " to=" + to_string(next);
  state_ = next;
  return moved;
}

void Session::log_transition(const std::string& moved) {
  if (!moved.empty()) log_event(LogLevel::Debug, "state_change", moved);
}

Status Session::admit_locked(uint8_t opcode, std::string& moved) {
  if (closed_) return Status::Cancelled;
  switch (state_) {
    case SessionState::Ready:
      return Status::Ok;
    case SessionState::Connected:
      if (opcode != OP_AUTH) return Status::InvalidState;
      moved = set_state_locked(SessionState::Authenticating);
      return Status::Ok;
    case SessionState::Authenticating:
      return opcode == OP_AUTH ? Status::Ok : Status::InvalidState;
    case SessionState::Disconnected:
      break;
  }
  return Status::InvalidState;
}

// ---------------------------------------------------------------------------
// Outbound
// ---------------------------------------------------------------------------

Status Session::send_frame(uint8_t opcode, const Payload& payload) {
  WireBytes wire;
  Status st = encode_frame(opcode, payload, wire);
  if (st != Status::Ok) return st;

  TxResult tx = transport_->send(wire.data(), wire.size());
  if (tx == TxResult::Ok) {
    log_event(LogLevel::Debug, "tx", op_detail(opcode) + " len=" + std::to_string(payload.size()));
    return Status::Ok;
  }

  {
    std::lock_guard<std::mutex> lk(mu_);
    if (closed_) return Status::Cancelled;    // close() raced the send
  }
  log_event(LogLevel::Error, "send_failed",
            std::string("reason=") + (tx == TxResult::Busy ? "busy " : "error ") + op_detail(opcode));
  link_down(Status::TransportError);
  return Status::TransportError;
}

Status Session::await_locked(std::unique_lock<std::mutex>& lk, Clock::time_point deadline, bool silence_ok) {
  if (cv_.wait_until(lk, deadline, [this] { return pending_.done; })) return pending_.result;
  return silence_ok ? Status::Ok : Status::Timeout;
}

Status Session::submit_request(uint8_t opcode, const Payload& payload, uint32_t timeout_ms, Frame& reply) {
  std::lock_guard<std::mutex> call(call_mu_);

  Status st = validate_outbound(opcode, payload.size());
  if (st != Status::Ok) return st;
  const CommandDescriptor* d = find_command(opcode);
  if (!d->has_response) return Status::InvalidArgument;

  std::string moved;
  SessionState seen = SessionState::Disconnected;
  {
    std::lock_guard<std::mutex> lk(mu_);
    seen = state_;
    st = admit_locked(opcode, moved);
    if (st == Status::Ok) {
      // Armed before the send so a fast reply cannot slip past.
      pending_           = Pending{};
      pending_.active    = true;
      pending_.expect    = d->response_opcode;
      pending_.submitted = Clock::now();
      pending_.deadline  = pending_.submitted + std::chrono::milliseconds(timeout_ms);
    }
  }
  if (st != Status::Ok) {
    log_event(LogLevel::Debug, "request_refused",
              op_detail(opcode) + " state=" + to_string(seen) + " reason=" + to_string(st));
    return st;
  }
  log_transition(moved);

  st = send_frame(opcode, payload);

  std::unique_lock<std::mutex> lk(mu_);
  if (st == Status::Ok) st = await_locked(lk, pending_.deadline, false);
  if (st == Status::Ok) reply = pending_.reply;
  const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - pending_.submitted);
  pending_ = Pending{};

  moved.clear();
  if (opcode == OP_AUTH && state_ == SessionState::Authenticating)
    moved = set_state_locked(st == Status::Ok ? SessionState::Ready : SessionState::Connected);
  lk.unlock();
  log_transition(moved);

  const std::string detail = op_detail(opcode) + " waited_ms=" + std::to_string(waited.count());
  if (st == Status::Ok)            log_event(LogLevel::Debug, "request_ok", detail);
  else if (st == Status::Timeout)  log_event(LogLevel::Info, "request_timeout", detail);
  else                             log_event(LogLevel::Warn, "request_failed", detail + " reason=" + to_string(st));
  return st;
}

Status Session::submit_write(uint8_t opcode, const Payload& payload, uint32_t grace_ms) {
  std::lock_guard<std::mutex> call(call_mu_);

  if (opcode == OP_AUTH) return Status::InvalidArgument;   // the handshake needs its reply
  Status st = validate_outbound(opcode, payload.size());
  if (st != Status::Ok) return st;

  std::string moved;
  SessionState seen = SessionState::Disconnected;
  {
    std::lock_guard<std::mutex> lk(mu_);
    seen = state_;
    st = admit_locked(opcode, moved);
    if (st == Status::Ok && grace_ms > 0) {
      pending_           = Pending{};
      pending_.active    = true;
      pending_.expect    = opcode;
      pending_.submitted = Clock::now();
      pending_.deadline  = pending_.submitted + std::chrono::milliseconds(grace_ms);
    }
  }
  if (st != Status::Ok) {
    log_event(LogLevel::Debug, "write_refused",
              op_detail(opcode) + " state=" + to_string(seen) + " reason=" + to_string(st));
    return st;
  }
  log_transition(moved);

  st = send_frame(opcode, payload);
  if (grace_ms == 0) return st;

  std::unique_lock<std::mutex> lk(mu_);
  if (st == Status::Ok) st = await_locked(lk, pending_.deadline, true);
  const bool echoed = pending_.done && pending_.result == Status::Ok;
  pending_ = Pending{};
  lk.unlock();

  if (st == Status::Ok)
    log_event(LogLevel::Debug, "write_ok", op_detail(opcode) + (echoed ? " echo=yes" : " echo=no"));
  else
    log_event(LogLevel::Warn, "write_failed", op_detail(opcode) + " reason=" + to_string(st));
  return st;
}

// ---------------------------------------------------------------------------
// Inbound (receive thread)
// ---------------------------------------------------------------------------

void Session::receive_loop() {
  const int slice = static_cast<int>(
      std::min(std::max<uint32_t>(cfg_.receive_poll_ms, 1), MAX_RECEIVE_POLL_MS));
  Notification n;

  while (!stop_.load()) {
    n.clear();
    switch (transport_->recv(n, slice)) {
      case RxResult::Ok:
        dispatch(n);
        break;
      case RxResult::None:
        break;
      case RxResult::Closed:
        if (!stop_.load()) {
          log_event(LogLevel::Warn, "link_closed", std::string("transport=") + transport_->name());
          link_down(Status::Cancelled);
        }
        return;
      case RxResult::Error:
        log_event(LogLevel::Error, "link_error", std::string("transport=") + transport_->name());
        link_down(Status::TransportError);
        return;
    }
  }
}

void Session::dispatch(const Notification& raw) {
  Frame f;
  Status st = decode_frame(raw.data(), raw.size(), f);
  if (st != Status::Ok) {
    log_event(LogLevel::Warn, "frame_dropped",
              std::string("reason=") + to_string(st) + " len=" + std::to_string(raw.size()));
    return;
  }

  bool claimed  = false;
  bool rejected = false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (pending_.active && !pending_.done && f.opcode == pending_.expect) {
      const CommandDescriptor* d = find_command(f.opcode);
      rejected = d && d->inbound() && !d->in_len.contains(f.payload.size());
      if (rejected) {
        pending_.result = Status::UnexpectedPayloadLength;
      } else {
        pending_.result = Status::Ok;
        pending_.reply  = f;
      }
      pending_.done = true;
      claimed = true;
    }
  }
  if (claimed) {
    cv_.notify_all();
    if (rejected)
      log_event(LogLevel::Warn, "reply_rejected",
                op_detail(f.opcode) + " len=" + std::to_string(f.payload.size()));
    return;
  }

  InboundMessage m;
  st = decode_inbound(f, m);
  if (st != Status::Ok) {
    log_event(LogLevel::Warn, "broadcast_dropped",
              std::string("reason=") + to_string(st) + " " + op_detail(f.opcode) +
              " len=" + std::to_string(f.payload.size()));
    return;
  }

  if (log_level() >= LogLevel::Debug) log_event(LogLevel::Debug, "rx", describe(m));

  if (channel_->push(std::move(m)))
    log_event(LogLevel::Warn, "broadcast_overflow", "backlog=" + std::to_string(cfg_.broadcast_backlog));
}

void Session::link_down(Status why) {
  std::string moved;
  {
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
    if (pending_.active && !pending_.done) {
      pending_.done   = true;
      pending_.result = why;
    }
    moved = set_state_locked(SessionState::Disconnected);
  }
  cv_.notify_all();
  log_transition(moved);
  channel_->close();
}

} // namespace tp90x
