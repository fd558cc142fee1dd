#ifndef __UEX_HANDOFF_QUEUE__
#define __UEX_HANDOFF_QUEUE__

#include "Headers.hpp"

namespace uex {
/**
 * @brief Unbounded FIFO channel between one producer thread and one consumer.
 *
 * Pushes never block. Consumers either wait up to a deadline or poll.
 */
template <typename T>
class HandoffQueue {
 public:
  HandoffQueue() {}

  HandoffQueue(const HandoffQueue&) = delete;
  HandoffQueue& operator=(const HandoffQueue&) = delete;

  void push(T item) {
    {
      lock_guard<std::mutex> guard(queueMutex);
      items.push_back(std::move(item));
    }
    itemsAvailable.notify_one();
  }

  /**
   * @brief Waits up to `timeout` for the next item.
   * @return false if nothing arrived in time.
   */
  bool pop(T* item, Seconds timeout) {
    unique_lock<std::mutex> lock(queueMutex);
    if (timeout > Seconds::zero()) {
      auto deadline = std::chrono::steady_clock::now() +
                      std::chrono::duration_cast<
                          std::chrono::steady_clock::duration>(timeout);
      if (!itemsAvailable.wait_until(lock, deadline,
                                     [this] { return !items.empty(); })) {
        return false;
      }
    } else if (items.empty()) {
      return false;
    }
    *item = std::move(items.front());
    items.pop_front();
    return true;
  }

  /** @brief Takes the next item only if one is already queued. */
  bool tryPop(T* item) { return pop(item, Seconds::zero()); }

  size_t size() const {
    lock_guard<std::mutex> guard(queueMutex);
    return items.size();
  }

  bool empty() const { return size() == 0; }

 protected:
  mutable std::mutex queueMutex;
  std::condition_variable itemsAvailable;
  std::deque<T> items;
};
}  // namespace uex

#endif  // __UEX_HANDOFF_QUEUE__
