#pragma once

#include "cmdvec/observability/observer.hpp"

#include <iostream>
#include <mutex>
#include <optional>
#include <ostream>

namespace cmdvec::observability {

enum class LogLevel { Debug, Info, Warn, Error };

[[nodiscard]] std::optional<LogLevel> parse_log_level(const std::string &value);
[[nodiscard]] std::string_view log_level_label(LogLevel level);

class LogObserver final : public IObserver {
public:
  explicit LogObserver(LogLevel min_level = LogLevel::Info, std::ostream &out = std::cerr)
      : min_level_(min_level), out_(out) {}

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

  [[nodiscard]] LogLevel min_level() const { return min_level_; }

private:
  void log_line(LogLevel level, const std::string &message);

  LogLevel min_level_;
  std::ostream &out_;
  std::mutex mutex_;
};

} // namespace cmdvec::observability
