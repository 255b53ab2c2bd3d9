/**
 * @file channel.h
 * @brief Closable FIFO channel used for every event sequence in pdrop
 *
 * A Channel is the pull side of a lazy sequence: producers send(), one
 * consumer receive()s in FIFO order, and close() ends the sequence. Items
 * already queued are still delivered after close(); only then does
 * receive() report Closed.
 *
 * A channel built with a capacity holds at most that many items: sending
 * to a full channel discards the oldest one and counts it in dropped().
 */

#ifndef PDROP_CHANNEL_H
#define PDROP_CHANNEL_H

#include "platform.h"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace pdrop {

/// Outcome of a blocking receive
enum class ChannelStatus : uint8_t { Ok = 0, Timeout = 1, Closed = 2 };

inline const char *channel_status_name(ChannelStatus status) {
  switch (status) {
  case ChannelStatus::Ok:
    return "Ok";
  case ChannelStatus::Timeout:
    return "Timeout";
  case ChannelStatus::Closed:
    return "Closed";
  }
  return "Unknown";
}

template <typename T> class Channel {
public:
  Channel() = default;

  /// capacity 0 means unbounded
  explicit Channel(size_t capacity) : capacity_(capacity) {}

  Channel(const Channel &) = delete;
  Channel &operator=(const Channel &) = delete;

  /**
   * @brief Enqueue a value
   * @return false if the channel is closed (value dropped)
   */
  bool send(T value) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_) {
        return false;
      }
      if (capacity_ != 0 && queue_.size() >= capacity_) {
        queue_.pop_front();
        ++dropped_;
      }
      queue_.push_back(std::move(value));
    }
    cv_.notify_one();
    return true;
  }

  /// End the sequence; wakes every blocked receiver
  void close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  bool is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  /// Closed and fully drained
  bool is_finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_ && queue_.empty();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

  size_t capacity() const { return capacity_; }

  /// Items discarded because the channel was full
  size_t dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
  }

  /**
   * @brief Wait up to timeout for the next value
   */
  ChannelStatus receive(T &out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
    return pop_locked(out);
  }

  /**
   * @brief Wait until deadline for the next value
   */
  template <typename ClockT, typename Duration>
  ChannelStatus
  receive_until(T &out,
                const std::chrono::time_point<ClockT, Duration> &deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_until(lock, deadline,
                   [this] { return closed_ || !queue_.empty(); });
    return pop_locked(out);
  }

  /// Non-blocking receive
  std::optional<T> try_receive() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

private:
  ChannelStatus pop_locked(T &out) {
    if (!queue_.empty()) {
      out = std::move(queue_.front());
      queue_.pop_front();
      return ChannelStatus::Ok;
    }
    return closed_ ? ChannelStatus::Closed : ChannelStatus::Timeout;
  }

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<T> queue_;
  const size_t capacity_ = 0;
  size_t dropped_ = 0;
  bool closed_ = false;
};

} // namespace pdrop

#endif // PDROP_CHANNEL_H
