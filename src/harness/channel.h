#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

namespace alucheck {

// --- Channel ---
// A bounded or unbounded FIFO for passing items between pipeline stages
// running on different threads. A closed channel accepts no more items but
// still delivers the ones already queued.

template <typename T>
class Channel {
 public:
  explicit Channel(size_t bound = 0) : bound_(bound) {}  // 0 means unbounded.

  Channel(const Channel&) = delete;
  Channel& operator=(const Channel&) = delete;

  // Blocks while the channel is full. Returns false if the channel was
  // closed or a stop was requested before the item could be queued.
  bool Put(T item, std::stop_token stop = {}) {
    std::unique_lock lock(mu_);
    not_full_.wait(lock, stop, [this] { return closed_ || !IsFull(); });
    if (closed_ || stop.stop_requested()) return false;
    items_.push_back(std::move(item));
    not_empty_.notify_one();
    return true;
  }

  // Blocks until an item is available. Returns nullopt once the channel is
  // closed and drained, or when a stop is requested.
  std::optional<T> Get(std::stop_token stop = {}) {
    std::unique_lock lock(mu_);
    not_empty_.wait(lock, stop, [this] { return closed_ || !items_.empty(); });
    if (stop.stop_requested()) return std::nullopt;
    return PopLocked();
  }

  // Like Get(), but gives up at `deadline`.
  std::optional<T> GetUntil(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock lock(mu_);
    if (!not_empty_.wait_until(lock, deadline,
                               [this] { return closed_ || !items_.empty(); })) {
      return std::nullopt;
    }
    return PopLocked();
  }

  std::optional<T> TryGet() {
    std::lock_guard lock(mu_);
    return PopLocked();
  }

  void Close() {
    std::lock_guard lock(mu_);
    closed_ = true;
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  size_t Num() const {
    std::lock_guard lock(mu_);
    return items_.size();
  }

  bool IsClosed() const {
    std::lock_guard lock(mu_);
    return closed_;
  }

 private:
  bool IsFull() const { return bound_ > 0 && items_.size() >= bound_; }

  std::optional<T> PopLocked() {
    if (items_.empty()) return std::nullopt;
    T item = std::move(items_.front());
    items_.pop_front();
    not_full_.notify_one();
    return item;
  }

  size_t bound_;
  std::deque<T> items_;
  bool closed_ = false;
  mutable std::mutex mu_;
  std::condition_variable_any not_empty_;
  std::condition_variable_any not_full_;
};

}  // namespace alucheck
