// pyrite/basic/log.cpp - Logger implementation
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "pyrite/basic/log.hpp"

#include <fmt/ostream.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <rang.hpp>
#include <string>

namespace pyrite::log
{

const char * level_name(Level level) noexcept
{
  switch (level) {
    case Level::Trace:
      return "trace";
    case Level::Debug:
      return "debug";
    case Level::Info:
      return "info";
    case Level::Warn:
      return "warn";
    case Level::Error:
      return "error";
    case Level::Off:
      return "off";
  }
  return "?";
}

std::optional<Level> parse_level(std::string_view text)
{
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (lowered == "trace") return Level::Trace;
  if (lowered == "debug") return Level::Debug;
  if (lowered == "info") return Level::Info;
  if (lowered == "warn" || lowered == "warning") return Level::Warn;
  if (lowered == "error") return Level::Error;
  if (lowered == "off") return Level::Off;
  return std::nullopt;
}

Logger & Logger::instance()
{
  static Logger logger;
  return logger;
}

Logger::Logger() : sink_(&std::cerr) {}

void Logger::set_sink(std::ostream & sink)
{
  const std::lock_guard<std::mutex> lock(mutex_);
  sink_ = &sink;
}

void Logger::write(Level level, std::string_view component, std::string_view message)
{
  const std::lock_guard<std::mutex> lock(mutex_);
  std::ostream & os = *sink_;
  const bool color = color_.load(std::memory_order_relaxed);

  if (color) {
    switch (level) {
      case Level::Trace:
      case Level::Debug:
        os << rang::fg::gray;
        break;
      case Level::Info:
        os << rang::fg::cyan;
        break;
      case Level::Warn:
        os << rang::fg::yellow << rang::style::bold;
        break;
      case Level::Error:
        os << rang::fg::red << rang::style::bold;
        break;
      case Level::Off:
        break;
    }
  }
  fmt::print(os, "[{}]", level_name(level));
  if (color) {
    os << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os, " {}: {}\n", component, message);
}

}  // namespace pyrite::log
