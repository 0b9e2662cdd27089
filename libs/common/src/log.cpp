#include "escrowcore/common/log.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace escrowcore {
namespace log {

namespace {

std::string timestamp() {
  using namespace std::chrono;
  const auto now = system_clock::now();
  const auto seconds = system_clock::to_time_t(now);
  const auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &seconds);
#else
  gmtime_r(&seconds, &tm);
#endif
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  std::ostringstream oss;
  oss << buf << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
  return oss.str();
}

}  // namespace

std::optional<Level> parse_level(std::string_view name) noexcept {
  if (name == "trace") return Level::kTrace;
  if (name == "debug") return Level::kDebug;
  if (name == "info") return Level::kInfo;
  if (name == "warn") return Level::kWarn;
  if (name == "error") return Level::kError;
  if (name == "off") return Level::kOff;
  return std::nullopt;
}

std::string_view level_name(Level level) noexcept {
  switch (level) {
    case Level::kTrace:
      return "TRACE";
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
    case Level::kOff:
      return "OFF";
  }
  return "?";
}

Logger& Logger::instance() {
  static Logger logger;
  return logger;
}

void Logger::set_level(Level level) noexcept {
  std::scoped_lock lock(mutex_);
  level_ = level;
}

Level Logger::level() const noexcept {
  std::scoped_lock lock(mutex_);
  return level_;
}

void Logger::set_sink(std::ostream* sink) {
  std::scoped_lock lock(mutex_);
  sink_ = sink;
}

void Logger::write(Level level, std::string_view component, const std::string& message) {
  std::scoped_lock lock(mutex_);
  if (level < level_ || level == Level::kOff) {
    return;
  }
  std::ostream& out = sink_ ? *sink_ : (level >= Level::kWarn ? std::cerr : std::cout);
  out << timestamp() << " [" << level_name(level) << "] " << component << ": " << message << '\n';
  out.flush();
}

}  // namespace log
}  // namespace escrowcore
