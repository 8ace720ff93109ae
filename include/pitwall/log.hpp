#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace pitwall::log {

enum class Level : std::uint8_t { Trace = 0, Debug, Info, Warn, Error };

struct Record {
  std::uint64_t ts_us{};   // steady clock, microseconds
  Level level{Level::Info};
  std::string tag;
  std::string msg;
};

struct ISink {
  virtual ~ISink() = default;
  virtual void write(const Record& r) = 0;
};

// One line per record on stderr.
class ConsoleSink final : public ISink {
public:
  void write(const Record& r) override;
};

// Keeps the newest `cap` records; used by tests and the viewer log pane.
class MemorySink final : public ISink {
public:
  explicit MemorySink(std::size_t cap = 256) : cap_(cap == 0 ? 1 : cap) {}
  void write(const Record& r) override;

  std::vector<Record> snapshot() const;
  std::size_t count(Level lv) const;
  void clear();

private:
  std::size_t cap_;
  mutable std::mutex m_;
  std::deque<Record> q_;
};

class Logger {
public:
  static Logger& instance();

  void add_sink(std::shared_ptr<ISink> sink);
  void remove_sink(const std::shared_ptr<ISink>& sink);
  void set_console_enabled(bool enabled);

  void set_level(Level lv);
  Level level() const;
  bool enabled(Level lv) const { return lv >= level(); }

  void write(Level lv, const char* tag, std::string msg);
  // printf-style convenience used by the PITWALL_LOG* macros
  void logf(Level lv, const char* tag, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 4, 5)))
#endif
    ;

private:
  Logger();

  mutable std::mutex m_;
  Level level_{Level::Info};
  bool console_enabled_{true};
  std::shared_ptr<ConsoleSink> console_;
  std::vector<std::shared_ptr<ISink>> sinks_;
};

const char* level_name(Level lv);

} // namespace pitwall::log

#define PITWALL_LOGD(tag, ...) \
  ::pitwall::log::Logger::instance().logf(::pitwall::log::Level::Debug, (tag), __VA_ARGS__)
#define PITWALL_LOGI(tag, ...) \
  ::pitwall::log::Logger::instance().logf(::pitwall::log::Level::Info, (tag), __VA_ARGS__)
#define PITWALL_LOGW(tag, ...) \
  ::pitwall::log::Logger::instance().logf(::pitwall::log::Level::Warn, (tag), __VA_ARGS__)
#define PITWALL_LOGE(tag, ...) \
  ::pitwall::log::Logger::instance().logf(::pitwall::log::Level::Error, (tag), __VA_ARGS__)
