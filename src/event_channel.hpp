#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

// Unbounded multi-producer queue. close() wakes every waiting consumer;
// items pushed before close() are still delivered.
template<typename T>
class EventChannel {
public:
  bool push(T item) {
    {
      std::lock_guard lg(m_);
      if(closed_) return false;
      items_.push_back(std::move(item));
    }
    cv_.notify_one();
    return true;
  }

  std::optional<T> try_pop() {
    std::lock_guard lg(m_);
    return take_locked();
  }

  // nullopt on timeout, or once closed and drained.
  template<typename Rep, typename Period>
  std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lk(m_);
    cv_.wait_for(lk, timeout, [this](){ return closed_ || !items_.empty(); });
    return take_locked();
  }

  void close() {
    {
      std::lock_guard lg(m_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  bool closed() const {
    std::lock_guard lg(m_);
    return closed_;
  }

  std::size_t size() const {
    std::lock_guard lg(m_);
    return items_.size();
  }

private:
  std::optional<T> take_locked() {
    if(items_.empty()) return std::nullopt;
    T item = std::move(items_.front());
    items_.pop_front();
    return item;
  }

  mutable std::mutex m_;
  std::condition_variable cv_;
  std::deque<T> items_;
  bool closed_ = false;
};
