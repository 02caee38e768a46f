#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace cmdvec::observability {

struct StageStartEvent {
  std::string stage;
};

struct ProgressEvent {
  std::string stage;
  std::uint64_t done = 0;
  std::optional<std::uint64_t> total;
};

struct StageEndEvent {
  std::string stage;
  std::chrono::milliseconds duration{0};
  std::uint64_t items = 0;
};

struct AssetWrittenEvent {
  std::string path;
  std::uint64_t bytes = 0;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<StageStartEvent, ProgressEvent, StageEndEvent,
                                   AssetWrittenEvent, WarningEvent, ErrorEvent>;

struct MalformedLinesMetric {
  std::uint64_t count = 0;
};

struct ZeroMatchMetric {
  std::uint64_t count = 0;
};

struct StageLatencyMetric {
  std::string stage;
  std::chrono::milliseconds latency{0};
};

using ObserverMetric = std::variant<MalformedLinesMetric, ZeroMatchMetric, StageLatencyMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace cmdvec::observability
