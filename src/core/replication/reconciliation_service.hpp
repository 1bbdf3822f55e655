#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include <spdlog/logger.h>

#include "core/clock/lamport_clock.hpp"
#include "core/model/types.hpp"
#include "core/node/node_state.hpp"
#include "core/p2p/peer_registry.hpp"
#include "core/storage/message_store.hpp"
#include "core/transport/peer_transport.hpp"

namespace mural {

// Pull-based anti-entropy: fetch a peer's full snapshot and merge what is
// missing. Repairs anything push replication lost.
class ReconciliationService {
public:
  ReconciliationService(const NodeSelfState& self, PeerRegistry& registry,
                        IPeerTransport& transport, MessageStore& store, LamportClock& clock,
                        std::chrono::milliseconds pull_timeout,
                        std::shared_ptr<spdlog::logger> logger);
  ~ReconciliationService();

  PeerReconcileReport reconcile_with(const PeerEntry& peer);

  // One round against every peer, in parallel. An unreachable peer is
  // reported, never fatal.
  ReconcileReport reconcile_all();

  // Repeats reconcile_all() every `interval` while online.
  void start_periodic(std::chrono::seconds interval);
  void stop_periodic();

  [[nodiscard]] ReconciliationStats stats() const;

private:
  void periodic_loop(std::chrono::seconds interval);

  const NodeSelfState& self_;
  PeerRegistry& registry_;
  IPeerTransport& transport_;
  MessageStore& store_;
  LamportClock& clock_;
  std::chrono::milliseconds pull_timeout_;
  std::shared_ptr<spdlog::logger> logger_;

  std::atomic<std::uint64_t> rounds_ = 0;
  std::atomic<std::uint64_t> peer_failures_ = 0;
  std::atomic<std::uint64_t> messages_pulled_ = 0;

  std::mutex periodic_mutex_;
  std::condition_variable periodic_cv_;
  bool periodic_stop_ = false;
  std::thread periodic_thread_;
};

}  // namespace mural
