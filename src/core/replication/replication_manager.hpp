#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>

#include <spdlog/logger.h>

#include "core/model/types.hpp"
#include "core/node/node_state.hpp"
#include "core/p2p/peer_registry.hpp"
#include "core/replication/worker_pool.hpp"
#include "core/transport/peer_transport.hpp"

namespace mural {

// Pushes locally created messages to every peer, off the caller's thread.
// A failed push is retried with capped exponential backoff; a peer already
// believed unreachable gets a single attempt. Nothing is sent while offline.
class ReplicationManager {
public:
  ReplicationManager(const NodeSelfState& self, PeerRegistry& registry, IPeerTransport& transport,
                     RetryPolicy policy, std::size_t workers, std::size_t max_queue,
                     std::shared_ptr<spdlog::logger> logger);
  ~ReplicationManager();

  void on_local_write(const Message& message);

  void wait_idle();
  void shutdown();

  [[nodiscard]] ReplicationStats stats() const;
  [[nodiscard]] const RetryPolicy& policy() const { return policy_; }

  // min(max_delay, base_delay * 2^(attempt - 1)), attempt counted from 1.
  static std::chrono::milliseconds backoff_delay(const RetryPolicy& policy, std::uint32_t attempt);

private:
  PushOutcome push_with_retry(const PeerEntry& peer, const Message& message);
  // False when woken by shutdown().
  bool sleep_for(std::chrono::milliseconds delay);

  const NodeSelfState& self_;
  PeerRegistry& registry_;
  IPeerTransport& transport_;
  RetryPolicy policy_;
  std::shared_ptr<spdlog::logger> logger_;

  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  bool stopping_ = false;

  std::atomic<std::uint64_t> pushes_delivered_ = 0;
  std::atomic<std::uint64_t> failed_attempts_ = 0;
  std::atomic<std::uint64_t> pushes_abandoned_ = 0;
  std::atomic<std::uint64_t> suppressed_offline_ = 0;
  std::atomic<std::uint64_t> dropped_queue_full_ = 0;

  // Last member: its threads reference everything above.
  WorkerPool pool_;
};

}  // namespace mural
