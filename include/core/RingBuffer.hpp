#pragma once
/** @file  RingBuffer.hpp
 *  @brief Bounded multi-producer / single-consumer queue (mutex + condvar).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace wayfinder {
  namespace core {

    /**
 * @class RingBuffer
 * @brief Fixed-capacity FIFO; producers never block.
 *
 *  * `tryPush()` fails when full or closed (caller decides what to drop).
 *  * `waitPop()` blocks until an item arrives or the buffer is closed *and* drained.
 *  * `close()` wakes every waiter; items already queued are still delivered.
 */
    template <typename T> class RingBuffer {
    public:
      explicit RingBuffer(std::size_t capacity) : slots_(capacity == 0 ? 1 : capacity) {}

      RingBuffer(const RingBuffer&) = delete;
      RingBuffer& operator=(const RingBuffer&) = delete;

      bool tryPush(T item) {
        {
          std::lock_guard<std::mutex> lock(mtx_);
          if (closed_ || count_ == slots_.size())
            return false;
          slots_[(head_ + count_) % slots_.size()].emplace(std::move(item));
          ++count_;
        }
        cv_.notify_one();
        return true;
      }

      std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(mtx_);
        return takeLocked();
      }

      std::optional<T> waitPop() {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait(lock, [this] { return count_ != 0 || closed_; });
        return takeLocked();
      }

      /// nullopt on timeout or when closed and empty.
      std::optional<T> waitPop(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait_for(lock, timeout, [this] { return count_ != 0 || closed_; });
        return takeLocked();
      }

      void close() {
        {
          std::lock_guard<std::mutex> lock(mtx_);
          closed_ = true;
        }
        cv_.notify_all();
      }

      bool closed() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return closed_;
      }

      std::size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return count_;
      }

      std::size_t capacity() const { return slots_.size(); }

    private:
      std::optional<T> takeLocked() {
        if (count_ == 0)
          return std::nullopt;
        std::optional<T> out = std::move(slots_[head_]);
        slots_[head_].reset();
        head_ = (head_ + 1) % slots_.size();
        --count_;
        return out;
      }

      std::vector<std::optional<T>> slots_;
      std::size_t head_{ 0 };
      std::size_t count_{ 0 };
      bool closed_{ false };
      mutable std::mutex mtx_;
      std::condition_variable cv_;
    };

  } // namespace core
} // namespace wayfinder
