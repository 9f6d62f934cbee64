/**
 * @file channel.hpp
 * @brief Thread-safe closable FIFO for producer-consumer hand-off
 *
 * @details Used twice by the tagging pipeline:
 *
 *          - Work queue: filled completely by one producer, then closed;
 *            workers drain it until pop() returns false
 *
 *          - Event channel: workers push events; the caller thread drains
 *            it and the last exiting worker closes it
 */

#ifndef VIDEO_TAGGER_CHANNEL_HPP
#define VIDEO_TAGGER_CHANNEL_HPP

#include <condition_variable>
#include <mutex>
#include <queue>

namespace video_tagger {

/**
 * @class Channel
 * @brief Blocking queue that can be closed once no more items will come.
 *
 * @attention USAGE:
 *
 *   - Producers call push()
 *
 *   - Consumers call pop() in a loop
 *
 *   - Call close() when all producers are done
 */
template <typename T> class Channel {
public:
  /**
   * @brief Push an item to the channel.
   * @return false if the channel was already closed (item dropped)
   */
  bool push(T item) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_)
        return false;
      items_.push(std::move(item));
    }
    cv_.notify_one();
    return true;
  }

  /**
   * @brief Pop an item (blocking).
   * @param item Output: the next item
   * @return true if an item was retrieved, false if closed and drained
   */
  bool pop(T &item) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !items_.empty() || closed_; });

    if (items_.empty()) {
      return false;
    }

    item = std::move(items_.front());
    items_.pop();
    return true;
  }

  /**
   * @brief Signal that no more items will be pushed.
   * @note Wakes all waiting consumers so they can exit.
   */
  void close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<T> items_;
  bool closed_ = false;
};

} // namespace video_tagger

#endif // VIDEO_TAGGER_CHANNEL_HPP
