#include "cmdvec/observability/log_observer.hpp"

#include "cmdvec/common/fs.hpp"

#include <type_traits>

namespace cmdvec::observability {

std::optional<LogLevel> parse_log_level(const std::string &value) {
  const std::string level = common::to_lower(common::trim(value));
  if (level == "debug") {
    return LogLevel::Debug;
  }
  if (level == "info") {
    return LogLevel::Info;
  }
  if (level == "warn" || level == "warning") {
    return LogLevel::Warn;
  }
  if (level == "error") {
    return LogLevel::Error;
  }
  return std::nullopt;
}

std::string_view log_level_label(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

void LogObserver::log_line(const LogLevel level, const std::string &message) {
  if (level < min_level_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "[" << log_level_label(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, StageStartEvent>) {
          log_line(LogLevel::Info, "stage.start name=" + evt.stage);
        } else if constexpr (std::is_same_v<T, ProgressEvent>) {
          std::string line = "stage.progress name=" + evt.stage + " done=" + std::to_string(evt.done);
          if (evt.total.has_value()) {
            line += " total=" + std::to_string(*evt.total);
          }
          log_line(LogLevel::Info, line);
        } else if constexpr (std::is_same_v<T, StageEndEvent>) {
          log_line(LogLevel::Info, "stage.end name=" + evt.stage +
                                       " items=" + std::to_string(evt.items) +
                                       " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, AssetWrittenEvent>) {
          log_line(LogLevel::Info,
                   "asset.written path=" + evt.path + " bytes=" + std::to_string(evt.bytes));
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line(LogLevel::Warn, evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, MalformedLinesMetric>) {
          log_line(LogLevel::Debug, "metric.malformed_lines=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, ZeroMatchMetric>) {
          log_line(LogLevel::Debug, "metric.zero_matches=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, StageLatencyMetric>) {
          log_line(LogLevel::Debug, "metric.stage_latency_ms stage=" + m.stage + " value=" +
                                        std::to_string(m.latency.count()));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

} // namespace cmdvec::observability
