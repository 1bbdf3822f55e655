#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace mural {

// Lamport clock owned by one node. `next()` is strictly increasing and stays
// ahead of every counter passed to `observe()`.
class LamportClock {
public:
  explicit LamportClock(std::string_view node_id);

  LogicalTimestamp next();
  void observe(std::uint64_t counter);

  [[nodiscard]] std::uint64_t current() const;
  [[nodiscard]] const std::string& node_id() const { return node_id_; }

private:
  std::string node_id_;
  mutable std::mutex mutex_;
  std::uint64_t counter_ = 0;
};

}  // namespace mural
