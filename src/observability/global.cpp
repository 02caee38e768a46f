#include "cmdvec/observability/global.hpp"

#include <mutex>

namespace cmdvec::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_stage_start(const std::string &stage) { record_event(StageStartEvent{.stage = stage}); }

void record_progress(const std::string &stage, const std::uint64_t done,
                     std::optional<std::uint64_t> total) {
  record_event(ProgressEvent{.stage = stage, .done = done, .total = total});
}

void record_stage_end(const std::string &stage, std::chrono::milliseconds duration,
                      const std::uint64_t items) {
  record_event(StageEndEvent{.stage = stage, .duration = duration, .items = items});
  record_metric(StageLatencyMetric{.stage = stage, .latency = duration});
}

void record_asset_written(const std::string &path, const std::uint64_t bytes) {
  record_event(AssetWrittenEvent{.path = path, .bytes = bytes});
}

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace cmdvec::observability
