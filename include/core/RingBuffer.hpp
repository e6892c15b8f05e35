#pragma once
/** @file  RingBuffer.hpp
 *  @brief Bounded MPSC queue between producers and the Logger worker thread.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace rfsweep {
  namespace core {

    /**
 * @class RingBuffer
 * @brief Fixed-capacity FIFO. A full buffer overwrites its oldest element so
 *        producers never block.
 */
    template <typename T> class RingBuffer {
    public:
      explicit RingBuffer(std::size_t capacity) : capacity_{ capacity == 0 ? 1 : capacity } {}

      /// Enqueue; returns false if the oldest element had to be dropped.
      bool push(T value) {
        bool kept = true;
        {
          std::lock_guard<std::mutex> lock(mtx_);
          if (items_.size() == capacity_) {
            items_.pop_front();
            ++dropped_;
            kept = false;
          }
          items_.push_back(std::move(value));
        }
        cv_.notify_one();
        return kept;
      }

      /// Wait up to \p timeout for an element.
      std::optional<T> pop(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mtx_);
        if (!cv_.wait_for(lock, timeout, [this] { return !items_.empty(); }))
          return std::nullopt;
        T value = std::move(items_.front());
        items_.pop_front();
        return value;
      }

      bool empty() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return items_.empty();
      }

      std::size_t dropped() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return dropped_;
      }

    private:
      const std::size_t capacity_;
      std::deque<T> items_;
      std::size_t dropped_{ 0 };
      mutable std::mutex mtx_;
      std::condition_variable cv_;
    };

  } // namespace core
} // namespace rfsweep
