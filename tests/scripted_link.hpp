#pragma once
// Test double: a NotifyQueue whose far end is a scripted thermometer.
// Every frame the session writes is decoded, recorded, and handed to `reply`,
// which may push notifications back with notify().
// fail_receive() makes the link report RxResult::Error from then on.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "tp90x/frame.hpp"
#include "tp90x/log.hpp"
#include "tp90x/transport/transport_notify_queue.hpp"

namespace testkit {

using tp90x::transport::Notification;
using tp90x::transport::NotifyQueue;
using tp90x::transport::RxResult;
using tp90x::transport::TxResult;

inline Notification frame_bytes(uint8_t opcode, std::initializer_list<uint8_t> payload) {
  tp90x::WireBytes w;
  tp90x::encode_frame(opcode, payload.begin(), payload.size(), w);
  return w;
}

inline tp90x::Payload payload_of(std::initializer_list<uint8_t> bytes) {
  tp90x::Payload p;
  for (uint8_t b : bytes) p.push_back(b);
  return p;
}

/// NotifyQueue whose receive side can be switched to a hard failure.
class FaultyQueue : public NotifyQueue {
public:
  using NotifyQueue::NotifyQueue;

  RxResult recv(Notification& out, int timeout_ms) override {
    if (fail_.load()) return RxResult::Error;
    return NotifyQueue::recv(out, timeout_ms);
  }

  void fail_receive() { fail_.store(true); }

private:
  std::atomic<bool> fail_{false};
};

class ScriptedLink {
public:
  using Reply = std::function<void(const tp90x::Frame& request, ScriptedLink& link)>;

  Reply reply;                                // set before the session sends anything
  TxResult tx_result{TxResult::Ok};           // what send() reports

  /// The transport to hand to a Session. The link keeps a raw pointer, so the
  /// session (which owns it) must be destroyed before this object.
  std::unique_ptr<NotifyQueue> make_transport() {
    auto q = std::make_unique<FaultyQueue>([this](const uint8_t* d, size_t n) {
      tp90x::Frame f;
      if (tp90x::decode_frame(d, n, f) != tp90x::Status::Ok) return TxResult::Error;
      {
        std::lock_guard<std::mutex> lk(mu_);
        written_.push_back(f);
      }
      if (tx_result != TxResult::Ok) return tx_result;
      if (reply) reply(f, *this);
      return TxResult::Ok;
    });
    queue_ = q.get();
    return q;
  }

  void notify(uint8_t opcode, std::initializer_list<uint8_t> payload) {
    queue_->push(frame_bytes(opcode, payload));
  }

  void notify_raw(Notification n) { queue_->push(std::move(n)); }

  void drop_link() { queue_->peer_closed(); }

  void fail_receive() { queue_->fail_receive(); }

  size_t writes() const {
    std::lock_guard<std::mutex> lk(mu_);
    return written_.size();
  }

  tp90x::Frame written(size_t i) const {
    std::lock_guard<std::mutex> lk(mu_);
    return written_.at(i);
  }

  tp90x::Frame last_written() const {
    std::lock_guard<std::mutex> lk(mu_);
    return written_.back();
  }

private:
  FaultyQueue*              queue_{nullptr};
  mutable std::mutex        mu_;
  std::vector<tp90x::Frame> written_;
};

/// Poll @p pred until it holds or @p timeout_ms passes.
template <typename Pred>
bool wait_for(Pred pred, int timeout_ms = 1000) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return pred();
}

/// Collect log lines for the duration of a test.
class LogCapture {
public:
  LogCapture() {
    tp90x::set_log_sink([this](tp90x::LogLevel, const std::string& line) {
      std::lock_guard<std::mutex> lk(mu_);
      lines_.push_back(line);
    });
  }
  ~LogCapture() { tp90x::set_log_sink({}); }

  bool contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& l : lines_)
      if (l.find(needle) != std::string::npos) return true;
    return false;
  }

private:
  mutable std::mutex       mu_;
  std::vector<std::string> lines_;
};

} // namespace testkit
