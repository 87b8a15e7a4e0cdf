#ifndef BONDCPP_OBSERVABILITY_HPP
#define BONDCPP_OBSERVABILITY_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string_view>

namespace bondcpp {

enum class LogLevel { Debug, Info, Warn, Error };

class ILogger {
public:
  virtual ~ILogger() = default;
  virtual bool log(LogLevel level, std::string_view message,
                   std::string_view operation,
                   std::chrono::microseconds duration, size_t offset,
                   std::string_view detail = "") = 0;
};

class IMetrics {
public:
  virtual ~IMetrics() = default;
  virtual bool record_latency(std::string_view operation, double seconds) = 0;
  virtual bool increment_operation_count(std::string_view operation,
                                         std::string_view status) = 0;
  virtual bool record_bytes_read(size_t bytes) = 0;
  virtual bool increment_blob_skips(size_t bytes) = 0;

  // Errors, keyed by exception kind
  virtual bool record_error(std::string_view kind) = 0;
};

#ifndef BONDCPP_DISABLE_OBSERVABILITY
// Global atomic pointers for the current logger and metrics implementations.
// bondcpp does NOT take ownership of the objects pointed to by g_logger or
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
                           std::chrono::microseconds duration, size_t offset,
                           std::string_view detail = "") {
#ifndef BONDCPP_DISABLE_OBSERVABILITY
  if (level >= g_log_level_threshold.load(std::memory_order_acquire)) {
    ILogger *logger = g_logger.load(std::memory_order_acquire);
    if (logger) {
      return logger->log(level, message, operation, duration, offset, detail);
    }
  }
#endif
  return true;
}

// Runs f against the current metrics collector, if any.
template <typename F> inline bool with_metrics(F &&f) {
#ifndef BONDCPP_DISABLE_OBSERVABILITY
  IMetrics *metrics = g_metrics.load(std::memory_order_acquire);
  if (metrics) {
    return f(*metrics);
  }
#endif
  return true;
}

} // namespace bondcpp

#endif // BONDCPP_OBSERVABILITY_HPP
