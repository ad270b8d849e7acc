#pragma once
/** @file  RingBuffer.hpp
 *  @brief Bounded multi-producer / single-consumer queue feeding the committee-log worker.
 *
 *  © 2025 RollStart contributors — MIT-licensed.
 */

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>

namespace rollstart::core {

  template <typename T> class RingBuffer {
  public:
    explicit RingBuffer(std::size_t capacity) : slots_(capacity) {
      if (capacity == 0)
        throw std::invalid_argument("[RingBuffer] capacity must be positive");
    }

    /// Non-blocking; false when full or closed.
    bool tryPush(T item) {
      {
        std::lock_guard<std::mutex> lock(mtx_);
        if (closed_ || count_ == slots_.size())
          return false;
        slots_[tail_] = std::move(item);
        tail_ = (tail_ + 1) % slots_.size();
        ++count_;
      }
      cv_.notify_one();
      return true;
    }

    /// Blocks until an item arrives; nullopt once closed and drained.
    std::optional<T> pop() {
      std::unique_lock<std::mutex> lock(mtx_);
      cv_.wait(lock, [this] { return count_ > 0 || closed_; });
      if (count_ == 0)
        return std::nullopt;
      std::optional<T> item = std::move(slots_[head_]);
      slots_[head_].reset();
      head_ = (head_ + 1) % slots_.size();
      --count_;
      return item;
    }

    void close() {
      {
        std::lock_guard<std::mutex> lock(mtx_);
        closed_ = true;
      }
      cv_.notify_all();
    }

    std::size_t size() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return count_;
    }

    std::size_t capacity() const { return slots_.size(); }

  private:
    std::vector<std::optional<T>> slots_;
    std::size_t head_{ 0 };
    std::size_t tail_{ 0 };
    std::size_t count_{ 0 };
    bool closed_{ false };
    mutable std::mutex mtx_;
    std::condition_variable cv_;
  };

} // namespace rollstart::core
