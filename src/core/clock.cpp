#include "pipeaudit/core/clock.h"

#include <chrono>

namespace pipeaudit::core {

Timestamp SystemClock::now() {
  return std::chrono::system_clock::now();
}

Timestamp FixedClock::now() {
  return fixed_time_;
}

}  // namespace pipeaudit::core
