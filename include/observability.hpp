#ifndef DOCJSON_OBSERVABILITY_HPP
#define DOCJSON_OBSERVABILITY_HPP

#include <atomic>
#include <chrono>
#include <string_view>

namespace docjson {

enum class LogLevel { Debug, Info, Warn, Error };

std::string_view to_string(LogLevel level);

class ILogger {
public:
  virtual ~ILogger() = default;
  virtual bool log(LogLevel level, std::string_view message,
                   std::string_view operation,
                   std::chrono::microseconds duration, size_t buffer_offset,
                   std::string_view key = "") = 0;
};

class IMetrics {
public:
  virtual ~IMetrics() = default;
  virtual bool record_latency(std::string_view operation, double seconds) = 0;
  virtual bool increment_operation_count(std::string_view operation,
                                         std::string_view status) = 0;
  virtual bool set_buffer_capacity(size_t capacity_bytes) = 0;

  // Writer buffer growth
  virtual bool increment_buffer_resizes() = 0;

  // Binary container ends that had to move their payload
  virtual bool increment_payload_shifts() = 0;
};

#ifndef DOCJSON_DISABLE_OBSERVABILITY
// Global atomic pointers for the current logger and metrics implementations.
// docjson does NOT take ownership of the objects pointed to by g_logger or
// g_metrics. Their lifetime must be managed by the caller.
extern std::atomic<ILogger *> g_logger;
extern std::atomic<IMetrics *> g_metrics;

// Sets the global logger. Passing nullptr restores the null logger.
void set_logger(ILogger *logger);

// Sets the global metrics collector. Passing nullptr restores the null
// collector.
void set_metrics(IMetrics *metrics);

// Messages with a level lower than this threshold are dropped before they
// reach the logger. Defaults to LogLevel::Info.
extern std::atomic<LogLevel> g_log_level_threshold;

void set_log_level_threshold(LogLevel level);
#else
inline void set_logger(ILogger *) {}
inline void set_metrics(IMetrics *) {}
inline void set_log_level_threshold(LogLevel) {}
#endif

inline bool log_if_enabled(LogLevel level, std::string_view message,
                           std::string_view operation,
                           std::chrono::microseconds duration,
                           size_t buffer_offset, std::string_view key = "") {
#ifndef DOCJSON_DISABLE_OBSERVABILITY
  if (level >= g_log_level_threshold.load(std::memory_order_acquire)) {
    ILogger *logger = g_logger.load(std::memory_order_acquire);
    if (logger) {
      return logger->log(level, message, operation, duration, buffer_offset,
                         key);
    }
  }
#endif
  return true;
}

template <typename Fn> inline bool record_metric(Fn &&fn) {
#ifndef DOCJSON_DISABLE_OBSERVABILITY
  IMetrics *metrics = g_metrics.load(std::memory_order_acquire);
  if (metrics) {
    return fn(*metrics);
  }
#endif
  return true;
}

} // namespace docjson

#endif // DOCJSON_OBSERVABILITY_HPP
