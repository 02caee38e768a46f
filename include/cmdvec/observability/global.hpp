#pragma once

#include "cmdvec/observability/observer.hpp"

#include <memory>

namespace cmdvec::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_stage_start(const std::string &stage);
void record_progress(const std::string &stage, std::uint64_t done,
                     std::optional<std::uint64_t> total = std::nullopt);
void record_stage_end(const std::string &stage, std::chrono::milliseconds duration,
                      std::uint64_t items);
void record_asset_written(const std::string &path, std::uint64_t bytes);
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace cmdvec::observability
