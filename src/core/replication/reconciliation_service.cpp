#include "core/replication/reconciliation_service.hpp"

#include <algorithm>
#include <future>
#include <vector>

namespace mural {

ReconciliationService::ReconciliationService(const NodeSelfState& self, PeerRegistry& registry,
                                             IPeerTransport& transport, MessageStore& store,
                                             LamportClock& clock,
                                             std::chrono::milliseconds pull_timeout,
                                             std::shared_ptr<spdlog::logger> logger)
    : self_(self),
      registry_(registry),
      transport_(transport),
      store_(store),
      clock_(clock),
      pull_timeout_(pull_timeout),
      logger_(std::move(logger)) {}

ReconciliationService::~ReconciliationService() {
  stop_periodic();
}

PeerReconcileReport ReconciliationService::reconcile_with(const PeerEntry& peer) {
  PeerReconcileReport report{.peer_id = peer.peer_id};
  if (self_.offline()) {
    report.error = "node offline";
    return report;
  }

  std::vector<Message> remote;
  const Result pulled = transport_.pull_snapshot(peer, pull_timeout_, remote);
  registry_.mark_result(peer.peer_id, pulled.ok);
  if (!pulled.ok) {
    report.error = pulled.message;
    peer_failures_.fetch_add(1);
    if (logger_) {
      logger_->warn("reconcile with {} failed: {}", peer.peer_id, pulled.message);
    }
    return report;
  }

  report.reached = true;
  report.received = remote.size();

  std::uint64_t highest = 0;
  for (const auto& message : remote) {
    highest = std::max(highest, message.logical_ts.counter);
  }
  clock_.observe(highest);

  const Result merged = store_.merge(remote, report.added);
  messages_pulled_.fetch_add(report.added);
  if (!merged.ok) {
    // Peer answered; the local write path is what failed.
    report.error = merged.message;
    if (logger_) {
      logger_->error("merge of snapshot from {} stopped: {}", peer.peer_id, merged.message);
    }
  } else if (logger_ && report.added > 0) {
    logger_->info("pulled {} new message(s) from {}", report.added, peer.peer_id);
  }
  return report;
}

ReconcileReport ReconciliationService::reconcile_all() {
  ReconcileReport report;
  const auto peers = registry_.list_peers();

  std::vector<std::future<PeerReconcileReport>> pending;
  pending.reserve(peers.size());
  for (const auto& peer : peers) {
    pending.push_back(std::async(std::launch::async, [this, peer] { return reconcile_with(peer); }));
  }
  for (auto& future : pending) {
    PeerReconcileReport peer_report = future.get();
    report.messages_added += peer_report.added;
    report.peers.push_back(std::move(peer_report));
  }

  rounds_.fetch_add(1);
  if (logger_) {
    logger_->info("reconciliation round complete: {} message(s) added from {} peer(s){}",
                  report.messages_added, report.peers.size(),
                  report.partial_failure() ? ", some peers unreachable" : "");
  }
  return report;
}

void ReconciliationService::start_periodic(std::chrono::seconds interval) {
  if (interval.count() <= 0 || periodic_thread_.joinable()) {
    return;
  }
  {
    std::lock_guard lock(periodic_mutex_);
    periodic_stop_ = false;
  }
  periodic_thread_ = std::thread([this, interval] { periodic_loop(interval); });
}

void ReconciliationService::stop_periodic() {
  {
    std::lock_guard lock(periodic_mutex_);
    periodic_stop_ = true;
  }
  periodic_cv_.notify_all();
  if (periodic_thread_.joinable()) {
    periodic_thread_.join();
  }
}

void ReconciliationService::periodic_loop(std::chrono::seconds interval) {
  std::unique_lock lock(periodic_mutex_);
  while (!periodic_cv_.wait_for(lock, interval, [this] { return periodic_stop_; })) {
    if (self_.offline()) {
      continue;
    }
    lock.unlock();
    (void)reconcile_all();
    lock.lock();
  }
}

ReconciliationStats ReconciliationService::stats() const {
  return {
      .rounds = rounds_.load(),
      .peer_failures = peer_failures_.load(),
      .messages_pulled = messages_pulled_.load(),
  };
}

}  // namespace mural
