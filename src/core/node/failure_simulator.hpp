#pragma once

#include <memory>
#include <mutex>

#include <spdlog/logger.h>

#include "core/model/types.hpp"
#include "core/node/node_state.hpp"
#include "core/replication/reconciliation_service.hpp"

namespace mural {

// Online <-> Offline state machine. Anti-entropy is attached to the
// Offline -> Online edge only.
class FailureSimulator {
public:
  FailureSimulator(NodeSelfState& self, ReconciliationService& reconciler,
                   std::shared_ptr<spdlog::logger> logger);

  Result go_offline();
  Result go_online(ReconcileReport* out_report = nullptr);

private:
  NodeSelfState& self_;
  ReconciliationService& reconciler_;
  std::shared_ptr<spdlog::logger> logger_;
  std::mutex transition_mutex_;
};

}  // namespace mural
