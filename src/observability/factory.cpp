#include "cmdvec/observability/factory.hpp"

#include "cmdvec/common/fs.hpp"
#include "cmdvec/observability/log_observer.hpp"
#include "cmdvec/observability/noop_observer.hpp"

namespace cmdvec::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }

  const auto level = parse_log_level(config.observability.level);
  return std::make_unique<LogObserver>(level.value_or(LogLevel::Info));
}

} // namespace cmdvec::observability
