#pragma once

#include "cmdvec/config/schema.hpp"
#include "cmdvec/observability/observer.hpp"

#include <memory>

namespace cmdvec::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace cmdvec::observability
