#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <vector>
#include <pitwall/status.hpp>
#include <pitwall/telemetry.hpp>

namespace pitwall {

struct LapBoundary {
  int lap{};
  std::size_t first_index{};  // logical index into the buffer (0 = oldest)
};

class HistoryBuffer;

// Lazy, restartable view over the lap boundaries of a buffer. Each begin()
// rescans from the oldest sample; the view is invalidated by append().
class LapBoundaryRange {
public:
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = LapBoundary;
    using difference_type = std::ptrdiff_t;
    using pointer = const LapBoundary*;
    using reference = LapBoundary;

    iterator() = default;
    iterator(const HistoryBuffer* buf, std::size_t idx) : buf_(buf), idx_(idx) {}

    LapBoundary operator*() const;
    iterator& operator++();
    iterator operator++(int) { auto tmp = *this; ++*this; return tmp; }
    bool operator==(const iterator& o) const { return buf_ == o.buf_ && idx_ == o.idx_; }
    bool operator!=(const iterator& o) const { return !(*this == o); }

  private:
    const HistoryBuffer* buf_{nullptr};
    std::size_t idx_{0};
  };

  explicit LapBoundaryRange(const HistoryBuffer& buf) : buf_(&buf) {}
  iterator begin() const;
  iterator end() const;

private:
  const HistoryBuffer* buf_;
};

// Bounded FIFO of samples for one session. Appends are O(1) amortized; once
// the count or time-span bound is hit the oldest samples are dropped.
class HistoryBuffer {
public:
  explicit HistoryBuffer(std::size_t max_samples = 4096, std::int64_t max_span_ms = 0);

  // Ok, OutOfOrderSample (timestamp or lap went backwards) or InvalidSample.
  // A rejected sample leaves the buffer untouched.
  Errc append(const TelemetrySample& s);

  std::size_t size() const { return count_; }
  bool empty() const { return count_ == 0; }
  std::size_t max_samples() const { return cap_; }
  std::int64_t max_span_ms() const { return span_ms_; }

  const TelemetrySample& operator[](std::size_t logical) const {
    return buf_[(head_ + logical) % cap_];
  }
  const TelemetrySample& front() const { return (*this)[0]; }
  const TelemetrySample& back() const { return (*this)[count_ - 1]; }

  // Most recent n samples / samples within `d` of the newest, oldest first.
  std::vector<TelemetrySample> window(std::size_t n) const;
  std::vector<TelemetrySample> window(std::chrono::milliseconds d) const;

  LapBoundaryRange lap_boundaries() const { return LapBoundaryRange(*this); }

  // True when eviction cut into the lap of the oldest retained sample, so its
  // first sample is not the real start of that lap.
  bool front_lap_partial() const { return front_partial_; }

  std::uint64_t total_accepted() const { return accepted_; }
  std::uint64_t total_evicted() const { return evicted_; }

  void clear();
  // clear() and give the storage back.
  void release();

private:
  void evict_front_();

  std::vector<TelemetrySample> buf_;
  std::size_t cap_;
  std::int64_t span_ms_;
  std::size_t head_{0};
  std::size_t count_{0};
  bool front_partial_{false};
  std::uint64_t accepted_{0};
  std::uint64_t evicted_{0};
};

// Derived per completed lap; never stored.
struct LapSummary {
  int lap_number{};
  double lap_time{};      // seconds
  double fuel_used{};     // liters, first sample of this lap minus first of the next
  double avg_speed{};
  double max_speed{};
  std::size_t first_index{};
  std::size_t end_index{};   // first sample of the following lap
};

// Completed laps (a later lap exists in the buffer), oldest first. A leading
// lap cut by eviction is skipped.
std::vector<LapSummary> lap_summaries(const HistoryBuffer& buf);

struct RefuelEvent {
  std::size_t index{};    // first sample after the jump
  int lap{};
  std::int64_t timestamp_ms{};
  double added_l{};
};

struct TireChangeEvent {
  std::size_t index{};
  int lap{};
  std::int64_t timestamp_ms{};
};

// Fuel rising by >= threshold between consecutive samples.
std::vector<RefuelEvent> refuel_events(const HistoryBuffer& buf, double threshold_l);
// Mean wear falling by >= drop between consecutive samples.
std::vector<TireChangeEvent> tire_change_events(const HistoryBuffer& buf, double drop);

} // namespace pitwall
