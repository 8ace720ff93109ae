#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include <utility>

namespace pitwall {

// Single-producer latest-only snapshot buffer. Readers only ever see the most
// recent publication; intermediate ones are dropped.
template <class T>
class LatestBuffer {
public:
  void publish(T v) {
    {
      std::lock_guard<std::mutex> lk(m_);
      data_ = std::move(v);
    }
    seq_.fetch_add(1, std::memory_order_release);
  }

  // Copies out the latest value if the sequence moved past `cursor`.
  bool try_consume_latest(std::uint64_t& cursor, T& out) const {
    const auto s = seq_.load(std::memory_order_acquire);
    if (s == cursor) return false;
    std::lock_guard<std::mutex> lk(m_);
    out = data_;
    cursor = s;
    return true;
  }

  std::uint64_t sequence() const { return seq_.load(std::memory_order_acquire); }

private:
  mutable std::mutex m_;
  T data_{};
  std::atomic<std::uint64_t> seq_{0};
};

} // namespace pitwall
