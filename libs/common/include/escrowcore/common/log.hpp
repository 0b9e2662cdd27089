#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

namespace escrowcore {
namespace log {

enum class Level : std::uint8_t {
  kTrace,
  kDebug,
  kInfo,
  kWarn,
  kError,
  kOff,
};

[[nodiscard]] std::optional<Level> parse_level(std::string_view name) noexcept;
[[nodiscard]] std::string_view level_name(Level level) noexcept;

// Process-wide, thread-safe line logger. Warnings and errors go to stderr,
// everything else to stdout unless an explicit sink is installed.
class Logger {
 public:
  static Logger& instance();

  void set_level(Level level) noexcept;
  [[nodiscard]] Level level() const noexcept;
  [[nodiscard]] bool enabled(Level level) const noexcept { return level >= this->level() && level != Level::kOff; }

  // nullptr restores the default stdout/stderr split.
  void set_sink(std::ostream* sink);

  void write(Level level, std::string_view component, const std::string& message);

 private:
  Logger() = default;

  mutable std::mutex mutex_;
  Level level_{Level::kInfo};
  std::ostream* sink_{nullptr};
};

class LineBuilder {
 public:
  LineBuilder(Level level, std::string_view component) : level_(level), component_(component) {}
  LineBuilder(const LineBuilder&) = delete;
  LineBuilder& operator=(const LineBuilder&) = delete;
  ~LineBuilder() { Logger::instance().write(level_, component_, stream_.str()); }

  template <typename T>
  LineBuilder& operator<<(const T& value) {
    stream_ << value;
    return *this;
  }

 private:
  Level level_;
  std::string_view component_;
  std::ostringstream stream_;
};

}  // namespace log
}  // namespace escrowcore

#define ESCROWCORE_LOG(lvl, component, msg)                              \
  do {                                                                   \
    if (::escrowcore::log::Logger::instance().enabled(lvl)) {            \
      ::escrowcore::log::LineBuilder(lvl, component) << msg;             \
    }                                                                    \
  } while (0)

#define ESCROWCORE_LOG_DEBUG(component, msg) ESCROWCORE_LOG(::escrowcore::log::Level::kDebug, component, msg)
#define ESCROWCORE_LOG_INFO(component, msg) ESCROWCORE_LOG(::escrowcore::log::Level::kInfo, component, msg)
#define ESCROWCORE_LOG_WARN(component, msg) ESCROWCORE_LOG(::escrowcore::log::Level::kWarn, component, msg)
#define ESCROWCORE_LOG_ERROR(component, msg) ESCROWCORE_LOG(::escrowcore::log::Level::kError, component, msg)
