#include "core/clock/lamport_clock.hpp"

#include <algorithm>

namespace mural {

LamportClock::LamportClock(std::string_view node_id) : node_id_(node_id) {}

LogicalTimestamp LamportClock::next() {
  std::lock_guard lock(mutex_);
  ++counter_;
  return {
      .counter = counter_,
      .node_id = node_id_,
  };
}

void LamportClock::observe(std::uint64_t counter) {
  std::lock_guard lock(mutex_);
  counter_ = std::max(counter_, counter);
}

std::uint64_t LamportClock::current() const {
  std::lock_guard lock(mutex_);
  return counter_;
}

}  // namespace mural
