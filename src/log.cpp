#include <pitwall/log.hpp>
#include <algorithm>
#include <chrono>
#include <cinttypes>
#include <cstdarg>
#include <cstdio>

namespace pitwall::log {

static std::uint64_t now_us() {
  using namespace std::chrono;
  return static_cast<std::uint64_t>(
    duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count());
}

const char* level_name(Level lv) {
  switch (lv) {
    case Level::Trace: return "TRACE";
    case Level::Debug: return "DEBUG";
    case Level::Info:  return "INFO";
    case Level::Warn:  return "WARN";
    case Level::Error: return "ERROR";
  }
  return "?";
}

void ConsoleSink::write(const Record& r) {
  std::fprintf(stderr, "[%12" PRIu64 "us] %-5s %-10s %s\n",
               r.ts_us, level_name(r.level), r.tag.c_str(), r.msg.c_str());
}

void MemorySink::write(const Record& r) {
  std::lock_guard<std::mutex> lk(m_);
  q_.push_back(r);
  while (q_.size() > cap_) q_.pop_front();
}

std::vector<Record> MemorySink::snapshot() const {
  std::lock_guard<std::mutex> lk(m_);
  return {q_.begin(), q_.end()};
}

std::size_t MemorySink::count(Level lv) const {
  std::lock_guard<std::mutex> lk(m_);
  return static_cast<std::size_t>(
    std::count_if(q_.begin(), q_.end(), [&](const Record& r){ return r.level == lv; }));
}

void MemorySink::clear() {
  std::lock_guard<std::mutex> lk(m_);
  q_.clear();
}

Logger& Logger::instance() {
  static Logger lg;
  return lg;
}

Logger::Logger() : console_(std::make_shared<ConsoleSink>()) {}

void Logger::add_sink(std::shared_ptr<ISink> sink) {
  if (!sink) return;
  std::lock_guard<std::mutex> lk(m_);
  sinks_.push_back(std::move(sink));
}

void Logger::remove_sink(const std::shared_ptr<ISink>& sink) {
  std::lock_guard<std::mutex> lk(m_);
  sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::set_console_enabled(bool enabled) {
  std::lock_guard<std::mutex> lk(m_);
  console_enabled_ = enabled;
}

void Logger::set_level(Level lv) {
  std::lock_guard<std::mutex> lk(m_);
  level_ = lv;
}

Level Logger::level() const {
  std::lock_guard<std::mutex> lk(m_);
  return level_;
}

void Logger::write(Level lv, const char* tag, std::string msg) {
  Record r;
  r.ts_us = now_us();
  r.level = lv;
  r.tag = tag ? tag : "";
  r.msg = std::move(msg);

  std::lock_guard<std::mutex> lk(m_);
  if (lv < level_) return;
  if (console_enabled_) console_->write(r);
  for (const auto& s : sinks_) s->write(r);
}

void Logger::logf(Level lv, const char* tag, const char* fmt, ...) {
  if (!enabled(lv)) return;
  char buf[512];
  va_list ap;
  va_start(ap, fmt);
  std::vsnprintf(buf, sizeof(buf), fmt, ap);
  va_end(ap);
  write(lv, tag, buf);
}

} // namespace pitwall::log
