#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace core {

// Prosty, bezpieczny wątkowo bufor FIFO. Producent pcha, konsument zdejmuje
// bez blokowania albo czeka z limitem czasu.
template <typename T>
class TsQueue {
public:
  void push(T v) {
    {
      std::lock_guard<std::mutex> lk(m_);
      q_.push_back(std::move(v));
    }
    cv_.notify_one();
  }

  std::optional<T> try_pop() {
    std::lock_guard<std::mutex> lk(m_);
    if (q_.empty()) return std::nullopt;
    T v = std::move(q_.front());
    q_.pop_front();
    return v;
  }

  std::optional<T> wait_pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(m_);
    if (!cv_.wait_for(lk, timeout, [this] { return !q_.empty(); })) return std::nullopt;
    T v = std::move(q_.front());
    q_.pop_front();
    return v;
  }

  void clear() {
    std::lock_guard<std::mutex> lk(m_);
    q_.clear();
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lk(m_);
    return q_.size();
  }

private:
  mutable std::mutex m_;
  std::deque<T> q_;
  std::condition_variable cv_;
};

} // namespace core
