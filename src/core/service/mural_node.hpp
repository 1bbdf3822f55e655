#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/logger.h>

#include "core/auth/auth_gate.hpp"
#include "core/clock/lamport_clock.hpp"
#include "core/config/node_config.hpp"
#include "core/model/types.hpp"
#include "core/node/failure_simulator.hpp"
#include "core/node/node_state.hpp"
#include "core/p2p/peer_registry.hpp"
#include "core/replication/reconciliation_service.hpp"
#include "core/replication/replication_manager.hpp"
#include "core/storage/message_store.hpp"
#include "core/transport/peer_transport.hpp"

namespace mural {

// One replica of the board: owns its store, clock, peers and the
// replication machinery, and answers both client and peer requests.
class MuralNode final : public IPeerEndpoint {
public:
  // A null `log` means the file log under config.data_dir.
  MuralNode(NodeConfig config, std::shared_ptr<IPeerTransport> transport,
            std::unique_ptr<IMessageLog> log = nullptr);
  ~MuralNode() override;

  MuralNode(const MuralNode&) = delete;
  MuralNode& operator=(const MuralNode&) = delete;

  Result init();
  void shutdown();

  Result login(std::string_view username, std::string_view password);
  Result logout(std::string_view token);
  // Success only for a live session of a user listed in admin_users.
  [[nodiscard]] Result authorize_admin(std::string_view token) const;

  // `author` may be empty; otherwise it must equal the token's principal.
  // On success `data` carries the new message id.
  Result post_message(std::string_view token, std::string_view author, std::string_view content,
                      Message* out_message = nullptr);
  [[nodiscard]] std::vector<Message> list_messages() const;
  // Id-ordered slice for clients reading the board a page at a time.
  [[nodiscard]] SnapshotPage list_page(std::string_view after_id, std::size_t limit) const;

  Result go_offline();
  Result go_online(ReconcileReport* out_report = nullptr);
  Result reconcile_now(ReconcileReport& out_report);

  [[nodiscard]] std::vector<PeerEntry> peers() const;
  [[nodiscard]] NodeStatusReport status() const;

  Result handle_push(const Message& message, std::string_view from_node) override;
  Result handle_pull(std::string_view after_id, std::size_t limit, SnapshotPage& out) override;

  // What transports should expose; stops forwarding once the node shuts down.
  [[nodiscard]] std::shared_ptr<IPeerEndpoint> endpoint() const { return endpoint_; }

  // Safe while the node is already serving requests.
  void set_listen_address(std::string address);
  [[nodiscard]] std::string listen_address() const;

  [[nodiscard]] const std::string& node_id() const { return config_.node_id; }
  [[nodiscard]] const NodeConfig& config() const { return config_; }
  [[nodiscard]] bool offline() const { return self_.offline(); }
  [[nodiscard]] const MessageStore& store() const { return store_; }
  [[nodiscard]] std::uint64_t clock_counter() const { return clock_.current(); }
  [[nodiscard]] std::string peers_dat_path() const;

  // Blocks until queued pushes have finished (delivered or abandoned).
  void wait_for_replication();

private:
  Result require_ready() const;

  NodeConfig config_;
  std::shared_ptr<spdlog::logger> logger_;
  std::shared_ptr<IPeerTransport> transport_;
  mutable std::mutex listen_mutex_;
  std::string listen_address_;

  NodeSelfState self_;
  LamportClock clock_;
  MessageStore store_;
  PeerRegistry registry_;
  SessionAuthGate auth_;

  std::mutex write_mutex_;
  std::uint64_t last_sequence_ = 0;
  std::atomic<bool> initialized_ = false;
  std::atomic<bool> shut_down_ = false;

  std::unique_ptr<ReplicationManager> replication_;
  std::unique_ptr<ReconciliationService> reconciler_;
  std::unique_ptr<FailureSimulator> simulator_;
  std::shared_ptr<GuardedEndpoint> endpoint_;
};

}  // namespace mural
