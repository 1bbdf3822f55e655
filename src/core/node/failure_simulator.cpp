#include "core/node/failure_simulator.hpp"

namespace mural {

FailureSimulator::FailureSimulator(NodeSelfState& self, ReconciliationService& reconciler,
                                   std::shared_ptr<spdlog::logger> logger)
    : self_(self), reconciler_(reconciler), logger_(std::move(logger)) {}

Result FailureSimulator::go_offline() {
  std::lock_guard lock(transition_mutex_);
  if (!self_.transition(Connectivity::Offline)) {
    return Result::success("Node already offline.");
  }
  if (logger_) {
    logger_->info("node {} is now offline; replication suppressed", self_.node_id());
  }
  return Result::success("Node replication disabled (simulated down).");
}

Result FailureSimulator::go_online(ReconcileReport* out_report) {
  std::lock_guard lock(transition_mutex_);
  if (!self_.transition(Connectivity::Online)) {
    return Result::success("Node already online.");
  }
  if (logger_) {
    logger_->info("node {} is back online; reconciling with peers", self_.node_id());
  }

  const ReconcileReport report = reconciler_.reconcile_all();
  if (out_report != nullptr) {
    *out_report = report;
  }
  return Result::success("Node online; reconciliation added " +
                             std::to_string(report.messages_added) + " messages" +
                             (report.partial_failure() ? " (some peers unreachable)." : "."),
                         std::to_string(report.messages_added));
}

}  // namespace mural
