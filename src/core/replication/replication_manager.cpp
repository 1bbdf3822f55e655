#include "core/replication/replication_manager.hpp"

#include <algorithm>

namespace mural {

ReplicationManager::ReplicationManager(const NodeSelfState& self, PeerRegistry& registry,
                                       IPeerTransport& transport, RetryPolicy policy,
                                       std::size_t workers, std::size_t max_queue,
                                       std::shared_ptr<spdlog::logger> logger)
    : self_(self),
      registry_(registry),
      transport_(transport),
      policy_(policy),
      logger_(std::move(logger)),
      pool_(workers, max_queue) {
  policy_.max_attempts = std::max<std::uint32_t>(1, policy_.max_attempts);
}

ReplicationManager::~ReplicationManager() {
  shutdown();
}

std::chrono::milliseconds ReplicationManager::backoff_delay(const RetryPolicy& policy,
                                                            std::uint32_t attempt) {
  std::uint64_t delay = policy.base_delay_ms;
  for (std::uint32_t i = 1; i < attempt && delay < policy.max_delay_ms; ++i) {
    delay *= 2;
  }
  return std::chrono::milliseconds(std::min<std::uint64_t>(delay, policy.max_delay_ms));
}

void ReplicationManager::on_local_write(const Message& message) {
  if (self_.offline()) {
    suppressed_offline_.fetch_add(1);
    if (logger_) {
      logger_->debug("offline: push of {} suppressed", message.id);
    }
    return;
  }

  for (const auto& peer : registry_.list_peers()) {
    const bool queued = pool_.submit([this, peer, message] {
      const PushOutcome outcome = push_with_retry(peer, message);
      if (outcome.delivered) {
        pushes_delivered_.fetch_add(1);
        return;
      }
      if (outcome.suppressed) {
        return;
      }
      pushes_abandoned_.fetch_add(1);
      if (logger_) {
        logger_->warn("push of {} to {} abandoned after {} attempt(s): {}", outcome.message_id,
                      outcome.peer_id, outcome.attempts, outcome.last_error);
      }
    });
    if (!queued) {
      dropped_queue_full_.fetch_add(1);
      if (logger_) {
        logger_->warn("replication queue full: push of {} to {} dropped", message.id, peer.peer_id);
      }
    }
  }
}

PushOutcome ReplicationManager::push_with_retry(const PeerEntry& peer, const Message& message) {
  PushOutcome outcome{.peer_id = peer.peer_id, .message_id = message.id};

  // Current reachability, not the one captured when the task was queued.
  const auto current = registry_.find(peer.peer_id);
  const bool single_attempt = current.has_value() && !current->reachable;
  const std::uint32_t budget = single_attempt ? 1U : policy_.max_attempts;
  const auto timeout = std::chrono::milliseconds(policy_.push_timeout_ms);

  for (std::uint32_t attempt = 1; attempt <= budget; ++attempt) {
    if (self_.offline()) {
      outcome.last_error = "node went offline";
      outcome.suppressed = true;
      suppressed_offline_.fetch_add(1);
      return outcome;
    }

    outcome.attempts = attempt;
    const Result pushed = transport_.push_message(peer, self_.node_id(), message, timeout);
    registry_.mark_result(peer.peer_id, pushed.ok);
    if (pushed.ok) {
      outcome.delivered = true;
      outcome.last_error.clear();
      return outcome;
    }

    failed_attempts_.fetch_add(1);
    outcome.last_error = pushed.message;
    if (logger_) {
      logger_->warn("push of {} to {} failed (attempt {}/{}): {}", message.id, peer.peer_id,
                     attempt, budget, pushed.message);
    }

    if (attempt < budget && !sleep_for(backoff_delay(policy_, attempt))) {
      outcome.last_error = "replication shutting down";
      return outcome;
    }
  }
  return outcome;
}

bool ReplicationManager::sleep_for(std::chrono::milliseconds delay) {
  std::unique_lock lock(stop_mutex_);
  return !stop_cv_.wait_for(lock, delay, [this] { return stopping_; });
}

void ReplicationManager::wait_idle() {
  pool_.wait_idle();
}

void ReplicationManager::shutdown() {
  {
    std::lock_guard lock(stop_mutex_);
    stopping_ = true;
  }
  stop_cv_.notify_all();
  pool_.stop();
}

ReplicationStats ReplicationManager::stats() const {
  return {
      .pushes_delivered = pushes_delivered_.load(),
      .failed_attempts = failed_attempts_.load(),
      .pushes_abandoned = pushes_abandoned_.load(),
      .suppressed_offline = suppressed_offline_.load(),
      .dropped_queue_full = dropped_queue_full_.load(),
  };
}

}  // namespace mural
