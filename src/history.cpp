#include <pitwall/history.hpp>
#include <algorithm>

namespace pitwall {

// ---- LapBoundaryRange ----

LapBoundary LapBoundaryRange::iterator::operator*() const {
  return LapBoundary{(*buf_)[idx_].lap, idx_};
}

LapBoundaryRange::iterator& LapBoundaryRange::iterator::operator++() {
  const std::size_t n = buf_->size();
  const int lap = (*buf_)[idx_].lap;
  ++idx_;
  while (idx_ < n && (*buf_)[idx_].lap == lap) ++idx_;
  return *this;
}

LapBoundaryRange::iterator LapBoundaryRange::begin() const { return iterator(buf_, 0); }
LapBoundaryRange::iterator LapBoundaryRange::end() const { return iterator(buf_, buf_->size()); }

// ---- HistoryBuffer ----

HistoryBuffer::HistoryBuffer(std::size_t max_samples, std::int64_t max_span_ms)
  : cap_(max_samples == 0 ? 1 : max_samples),
    span_ms_(max_span_ms < 0 ? 0 : max_span_ms) {}

Errc HistoryBuffer::append(const TelemetrySample& s) {
  if (!sample_is_sane(s)) return Errc::InvalidSample;
  if (count_ > 0) {
    const auto& last = back();
    if (s.timestamp_ms < last.timestamp_ms || s.lap < last.lap) return Errc::OutOfOrderSample;
  }

  if (count_ == cap_) evict_front_();

  // Storage grows lazily up to cap_, then wraps.
  const std::size_t pos = (head_ + count_) % cap_;
  if (pos == buf_.size()) buf_.push_back(s);
  else buf_[pos] = s;
  ++count_;
  ++accepted_;

  if (span_ms_ > 0) {
    while (count_ > 1 && s.timestamp_ms - front().timestamp_ms > span_ms_) evict_front_();
  }
  return Errc::Ok;
}

void HistoryBuffer::evict_front_() {
  if (count_ == 0) return;
  const int lap = front().lap;
  head_ = (head_ + 1) % cap_;
  --count_;
  ++evicted_;
  if (count_ == 0) {
    front_partial_ = false;
  } else if (front().lap == lap) {
    front_partial_ = true;
  } else {
    // The new front starts a lap we have in full.
    front_partial_ = false;
  }
}

std::vector<TelemetrySample> HistoryBuffer::window(std::size_t n) const {
  const std::size_t take = std::min(n, count_);
  std::vector<TelemetrySample> out;
  out.reserve(take);
  for (std::size_t i = count_ - take; i < count_; ++i) out.push_back((*this)[i]);
  return out;
}

std::vector<TelemetrySample> HistoryBuffer::window(std::chrono::milliseconds d) const {
  std::vector<TelemetrySample> out;
  if (count_ == 0) return out;
  const std::int64_t cutoff = back().timestamp_ms - static_cast<std::int64_t>(d.count());
  std::size_t first = count_;
  while (first > 0 && (*this)[first - 1].timestamp_ms >= cutoff) --first;
  out.reserve(count_ - first);
  for (std::size_t i = first; i < count_; ++i) out.push_back((*this)[i]);
  return out;
}

void HistoryBuffer::clear() {
  head_ = 0;
  count_ = 0;
  front_partial_ = false;
  buf_.clear();
}

void HistoryBuffer::release() {
  clear();
  buf_.shrink_to_fit();
}

// ---- Derived views ----

std::vector<LapSummary> lap_summaries(const HistoryBuffer& buf) {
  std::vector<LapBoundary> bounds;
  for (const auto b : buf.lap_boundaries()) bounds.push_back(b);

  std::vector<LapSummary> out;
  if (bounds.size() < 2) return out;
  const std::size_t start = buf.front_lap_partial() ? 1 : 0;
  for (std::size_t k = start; k + 1 < bounds.size(); ++k) {
    const auto& a = buf[bounds[k].first_index];
    const auto& next = buf[bounds[k + 1].first_index];

    LapSummary ls;
    ls.lap_number = bounds[k].lap;
    ls.first_index = bounds[k].first_index;
    ls.end_index = bounds[k + 1].first_index;
    // Prefer the simulator's own timing; fall back to the sample clock.
    ls.lap_time = next.lap_time > 0.0
      ? next.lap_time
      : static_cast<double>(next.timestamp_ms - a.timestamp_ms) / 1000.0;
    ls.fuel_used = a.fuel_level - next.fuel_level;

    double sum = 0.0;
    for (std::size_t i = ls.first_index; i < ls.end_index; ++i) {
      sum += buf[i].speed;
      ls.max_speed = std::max(ls.max_speed, buf[i].speed);
    }
    ls.avg_speed = sum / static_cast<double>(ls.end_index - ls.first_index);
    out.push_back(ls);
  }
  return out;
}

std::vector<RefuelEvent> refuel_events(const HistoryBuffer& buf, double threshold_l) {
  std::vector<RefuelEvent> out;
  for (std::size_t i = 1; i < buf.size(); ++i) {
    const double added = buf[i].fuel_level - buf[i - 1].fuel_level;
    if (added >= threshold_l) {
      out.push_back(RefuelEvent{i, buf[i].lap, buf[i].timestamp_ms, added});
    }
  }
  return out;
}

std::vector<TireChangeEvent> tire_change_events(const HistoryBuffer& buf, double drop) {
  std::vector<TireChangeEvent> out;
  for (std::size_t i = 1; i < buf.size(); ++i) {
    const double d = mean_of(buf[i - 1].tire_wear) - mean_of(buf[i].tire_wear);
    if (d >= drop) out.push_back(TireChangeEvent{i, buf[i].lap, buf[i].timestamp_ms});
  }
  return out;
}

} // namespace pitwall
