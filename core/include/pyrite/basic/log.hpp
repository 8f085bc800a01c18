// pyrite/basic/log.hpp - Component-tagged leveled logging
//
// Messages are formatted with {fmt} and written to a single sink stream
// (stderr by default). Level, sink and colour are process-wide and are
// normally set once from the project configuration.
//
//   log::debug("solver", "untracked name `{}`", name);
//
#pragma once

#include <fmt/core.h>

#include <atomic>
#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string_view>
#include <utility>

namespace pyrite::log
{

enum class Level : uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error,
  Off,
};

[[nodiscard]] const char * level_name(Level level) noexcept;

/// Parse "trace", "debug", "info", "warn", "error" or "off" (case-insensitive).
[[nodiscard]] std::optional<Level> parse_level(std::string_view text);

class Logger
{
public:
  static Logger & instance();

  void set_level(Level level) noexcept { level_.store(level, std::memory_order_relaxed); }
  [[nodiscard]] Level level() const noexcept { return level_.load(std::memory_order_relaxed); }

  /// Redirect output. The stream must outlive every later log call.
  void set_sink(std::ostream & sink);
  void set_color(bool enabled) noexcept { color_.store(enabled, std::memory_order_relaxed); }

  [[nodiscard]] bool enabled(Level level) const noexcept
  {
    return level != Level::Off && level >= level_.load(std::memory_order_relaxed);
  }

  template <typename... Args>
  void log(
    Level level, std::string_view component, fmt::format_string<Args...> format, Args &&... args)
  {
    if (!enabled(level)) return;
    write(level, component, fmt::format(format, std::forward<Args>(args)...));
  }

private:
  Logger();

  void write(Level level, std::string_view component, std::string_view message);

  // Read on every log call from any thread; only the sink is guarded by mutex_.
  std::atomic<Level> level_{Level::Warn};
  std::atomic<bool> color_{true};
  std::ostream * sink_;
  std::mutex mutex_;
};

template <typename... Args>
void trace(std::string_view component, fmt::format_string<Args...> format, Args &&... args)
{
  Logger::instance().log(Level::Trace, component, format, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(std::string_view component, fmt::format_string<Args...> format, Args &&... args)
{
  Logger::instance().log(Level::Debug, component, format, std::forward<Args>(args)...);
}

template <typename... Args>
void info(std::string_view component, fmt::format_string<Args...> format, Args &&... args)
{
  Logger::instance().log(Level::Info, component, format, std::forward<Args>(args)...);
}

template <typename... Args>
void warn(std::string_view component, fmt::format_string<Args...> format, Args &&... args)
{
  Logger::instance().log(Level::Warn, component, format, std::forward<Args>(args)...);
}

template <typename... Args>
void error(std::string_view component, fmt::format_string<Args...> format, Args &&... args)
{
  Logger::instance().log(Level::Error, component, format, std::forward<Args>(args)...);
}

}  // namespace pyrite::log
