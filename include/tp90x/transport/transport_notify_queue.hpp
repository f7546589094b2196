#pragma once
/**
 * @file transport_notify_queue.hpp
 * @brief Push-based transport: adapts a BLE library's notify callback to ITransport.
 *
 * Platform BLE stacks deliver notifications on their own thread through a
 * callback. Call push() from that callback; the session's receive thread pulls
 * them back out with recv(). Writes go through the Writer you supply (usually a
 * thin wrapper around "write characteristic without response").
 *
 * @code
 *   auto q = std::make_unique<tp90x::transport::NotifyQueue>(
 *       [&gatt](const uint8_t* d, size_t n) { return gatt.write(d, n) ? TxResult::Ok : TxResult::Error; });
 *   gatt.on_notify([raw = q.get()](const uint8_t* d, size_t n) { raw->push(d, n); });
 * @endcode
 *
 * Header-only.
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <utility>

#include "tp90x/transport/transport_base.hpp"

namespace tp90x::transport {

class NotifyQueue : public ITransport {
public:
  using Writer = std::function<TxResult(const uint8_t* data, std::size_t len)>;

  explicit NotifyQueue(Writer writer, std::size_t mtu = 20)
  : writer_(std::move(writer)), mtu_(mtu) {}

  // ------------------------------------------------------------------ producer side

  /// Queue one notification. Dropped silently once the queue is closed.
  void push(const uint8_t* data, std::size_t len) {
    push(Notification(data, data + len));
  }

  void push(Notification n) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (closed_) return;
      q_.push_back(std::move(n));
    }
    cv_.notify_one();
  }

  /// The peer went away (disconnect callback). Queued items are still delivered first.
  void peer_closed() { end(); }

  // ------------------------------------------------------------------ ITransport

  TxResult send(const uint8_t* data, std::size_t len) override {
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (closed_) return TxResult::Error;
    }
    if (!writer_ || !data) return TxResult::Error;
    return writer_(data, len);   // never called under mu_: the writer may push()
  }

  RxResult recv(Notification& out, int timeout_ms) override {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms < 0 ? 0 : timeout_ms),
                 [this] { return !q_.empty() || closed_; });
    if (!q_.empty()) {
      out = std::move(q_.front());
      q_.pop_front();
      return RxResult::Ok;
    }
    return closed_ ? RxResult::Closed : RxResult::None;
  }

  void end() override {
    {
      std::lock_guard<std::mutex> lk(mu_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  const char* name() const override { return "notify-queue"; }
  std::size_t mtu() const override { return mtu_; }

  std::size_t pending() const {
    std::lock_guard<std::mutex> lk(mu_);
    return q_.size();
  }

private:
  Writer                   writer_;
  std::size_t              mtu_{20};
  mutable std::mutex       mu_;
  std::condition_variable  cv_;
  std::deque<Notification> q_;
  bool                     closed_{false};
};

} // namespace tp90x::transport
