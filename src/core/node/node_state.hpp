#pragma once

#include <atomic>
#include <string>
#include <string_view>
#include <utility>

#include "core/model/types.hpp"

namespace mural {

class FailureSimulator;

// Self-state of one node. Read before every network attempt; only the
// FailureSimulator moves it between Online and Offline.
class NodeSelfState {
public:
  explicit NodeSelfState(std::string node_id) : node_id_(std::move(node_id)) {}

  [[nodiscard]] const std::string& node_id() const { return node_id_; }
  [[nodiscard]] Connectivity connectivity() const { return connectivity_.load(); }
  [[nodiscard]] bool offline() const { return connectivity() == Connectivity::Offline; }

private:
  friend class FailureSimulator;

  // True when the state actually changed.
  bool transition(Connectivity to) { return connectivity_.exchange(to) != to; }

  std::string node_id_;
  std::atomic<Connectivity> connectivity_ = Connectivity::Online;
};

std::string connectivity_to_string(Connectivity connectivity);

}  // namespace mural
