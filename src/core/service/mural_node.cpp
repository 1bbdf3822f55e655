#include "core/service/mural_node.hpp"

#include <filesystem>
#include <utility>

#include "core/log/logging.hpp"
#include "core/model/message_codec.hpp"
#include "core/util/canonical.hpp"

namespace mural {

MuralNode::MuralNode(NodeConfig config, std::shared_ptr<IPeerTransport> transport,
                     std::unique_ptr<IMessageLog> log)
    : config_(std::move(config)),
      logger_(log::node_logger(config_.node_id)),
      transport_(std::move(transport)),
      listen_address_(config_.listen_host + ":" + std::to_string(config_.listen_port)),
      self_(config_.node_id),
      clock_(config_.node_id),
      store_(log != nullptr ? std::move(log)
                            : std::unique_ptr<IMessageLog>(std::make_unique<FileMessageLog>(
                                  message_log_path(config_.data_dir, config_.node_id)))),
      registry_(config_.node_id, config_.failure_threshold, logger_),
      auth_(config_.users, config_.admin_users) {
  replication_ = std::make_unique<ReplicationManager>(
      self_, registry_, *transport_, config_.retry, config_.replication_workers,
      config_.replication_queue_limit, logger_);
  reconciler_ = std::make_unique<ReconciliationService>(
      self_, registry_, *transport_, store_, clock_,
      std::chrono::milliseconds(config_.pull_timeout_ms), logger_);
  simulator_ = std::make_unique<FailureSimulator>(self_, *reconciler_, logger_);
  endpoint_ = std::make_shared<GuardedEndpoint>(this);
}

MuralNode::~MuralNode() {
  shutdown();
}

void MuralNode::set_listen_address(std::string address) {
  std::lock_guard lock(listen_mutex_);
  listen_address_ = std::move(address);
}

std::string MuralNode::listen_address() const {
  std::lock_guard lock(listen_mutex_);
  return listen_address_;
}

std::string MuralNode::peers_dat_path() const {
  if (config_.data_dir.empty()) {
    return {};
  }
  return (std::filesystem::path{config_.data_dir} / ("peers-" + config_.node_id + ".dat")).string();
}

Result MuralNode::init() {
  if (initialized_) {
    return Result::success("Node already initialized.");
  }

  const Result valid = validate_node_config(config_);
  if (!valid.ok) {
    return valid;
  }

  const Result opened = store_.open();
  if (!opened.ok) {
    return opened;
  }

  // Counters and ids never go backwards across restarts.
  clock_.observe(store_.max_counter());
  last_sequence_ = store_.max_sequence_for(config_.node_id);

  // Configured peers win; peers.dat only seeds a node started without any.
  const std::string dat_path = peers_dat_path();
  if (config_.peers.empty() && !dat_path.empty()) {
    const Result loaded = registry_.load_peers_dat(dat_path);
    if (!loaded.ok) {
      return loaded;
    }
  }
  for (const auto& peer : config_.peers) {
    const Result added = registry_.add_peer(peer.peer_id, peer.address);
    if (!added.ok) {
      return added;
    }
  }
  if (!dat_path.empty()) {
    const Result saved = registry_.save_peers_dat(dat_path);
    if (!saved.ok) {
      logger_->warn("{}", saved.message);
    }
  }

  if (config_.reconcile_interval_seconds > 0) {
    reconciler_->start_periodic(std::chrono::seconds(config_.reconcile_interval_seconds));
  }

  initialized_ = true;
  logger_->info("node {} ready: {} messages, clock {}, {} peer(s)", config_.node_id, store_.size(),
                clock_.current(), registry_.size());
  return Result::success(opened.message);
}

void MuralNode::shutdown() {
  if (shut_down_.exchange(true)) {
    return;
  }
  endpoint_->detach();
  reconciler_->stop_periodic();
  replication_->shutdown();
  if (initialized_) {
    logger_->info("node {} stopped", config_.node_id);
  }
}

Result MuralNode::require_ready() const {
  if (!initialized_ || shut_down_) {
    return Result::failure(ErrorKind::Unavailable, "Node " + config_.node_id + " is not running.");
  }
  return Result::success();
}

Result MuralNode::login(std::string_view username, std::string_view password) {
  const Result ready = require_ready();
  if (!ready.ok) {
    return ready;
  }
  return auth_.login(username, password);
}

Result MuralNode::logout(std::string_view token) {
  return auth_.logout(token);
}

Result MuralNode::authorize_admin(std::string_view token) const {
  const auto principal = auth_.authorize(token);
  if (!principal.has_value()) {
    return Result::failure(ErrorKind::Authorization, "authentication required");
  }
  if (!auth_.is_admin(*principal)) {
    logger_->info("control op refused for non-admin {}", *principal);
    return Result::failure(ErrorKind::Authorization, "user " + *principal + " is not an admin");
  }
  return Result::success("Admin.", *principal);
}

Result MuralNode::post_message(std::string_view token, std::string_view author,
                               std::string_view content, Message* out_message) {
  const Result ready = require_ready();
  if (!ready.ok) {
    return ready;
  }

  const auto principal = auth_.authorize(token);
  if (!principal.has_value()) {
    logger_->info("post rejected: unauthenticated");
    return Result::failure(ErrorKind::Authorization, "authentication required");
  }
  const std::string claimed = util::trim_copy(author);
  if (!claimed.empty() && claimed != *principal) {
    logger_->info("post rejected: {} tried to post as {}", *principal, claimed);
    return Result::failure(ErrorKind::Authorization,
                           "user " + *principal + " cannot post as " + claimed);
  }

  const std::string text = util::trim_copy(content);
  if (text.empty()) {
    return Result::failure(ErrorKind::InvalidInput, "text cannot be empty");
  }
  if (text.size() > config_.max_content_bytes) {
    return Result::failure(ErrorKind::InvalidInput, "text exceeds " +
                                                        std::to_string(config_.max_content_bytes) +
                                                        " bytes");
  }

  Message message;
  {
    // Sequence and timestamp are issued together so ids follow clock order.
    std::lock_guard lock(write_mutex_);
    ++last_sequence_;
    message = Message{
        .id = config_.node_id + "-" + std::to_string(last_sequence_),
        .author = *principal,
        .content = text,
        .logical_ts = clock_.next(),
        .origin_node = config_.node_id,
    };

    const Result stored = store_.insert(message);
    if (!stored.ok) {
      logger_->error("local write {} failed: {}", message.id, stored.message);
      return stored;
    }
  }

  logger_->info("{} posted {} at {}", message.author, message.id, message.logical_ts.counter);
  replication_->on_local_write(message);

  if (out_message != nullptr) {
    *out_message = message;
  }
  return Result::success("Message posted.", message.id);
}

std::vector<Message> MuralNode::list_messages() const {
  return store_.ordered_view();
}

SnapshotPage MuralNode::list_page(std::string_view after_id, std::size_t limit) const {
  return store_.page_after(after_id, limit);
}

Result MuralNode::go_offline() {
  const Result ready = require_ready();
  if (!ready.ok) {
    return ready;
  }
  return simulator_->go_offline();
}

Result MuralNode::go_online(ReconcileReport* out_report) {
  const Result ready = require_ready();
  if (!ready.ok) {
    return ready;
  }
  return simulator_->go_online(out_report);
}

Result MuralNode::reconcile_now(ReconcileReport& out_report) {
  const Result ready = require_ready();
  if (!ready.ok) {
    return ready;
  }
  if (self_.offline()) {
    return Result::failure(ErrorKind::Unavailable, "Node is offline; reconciliation skipped.");
  }

  out_report = reconciler_->reconcile_all();
  if (out_report.partial_failure()) {
    std::string unreachable;
    for (const auto& peer : out_report.peers) {
      if (!peer.reached) {
        unreachable += (unreachable.empty() ? "" : ",") + peer.peer_id;
      }
    }
    Result partial = Result::failure(ErrorKind::ReconciliationPartial,
                                     "Reconciled with unreachable peers: " + unreachable);
    partial.data = std::to_string(out_report.messages_added);
    return partial;
  }
  return Result::success("Reconciliation complete.", std::to_string(out_report.messages_added));
}

std::vector<PeerEntry> MuralNode::peers() const {
  return registry_.list_peers();
}

NodeStatusReport MuralNode::status() const {
  return {
      .node_id = config_.node_id,
      .connectivity = self_.connectivity(),
      .listen_address = listen_address(),
      .clock_counter = clock_.current(),
      .store = store_.health_report(),
      .peers = registry_.list_peers(),
      .replication = replication_->stats(),
      .reconciliation = reconciler_->stats(),
  };
}

Result MuralNode::handle_push(const Message& message, std::string_view from_node) {
  const Result ready = require_ready();
  if (!ready.ok) {
    return ready;
  }
  if (self_.offline()) {
    return Result::failure(ErrorKind::Unavailable, "node not accepting replication (simulated down)");
  }
  if (!is_well_formed(message)) {
    return Result::failure(ErrorKind::InvalidInput, "malformed message from " + std::string{from_node});
  }

  clock_.observe(message.logical_ts.counter);

  std::size_t added = 0;
  const Result merged = store_.merge({message}, added);
  if (!merged.ok) {
    logger_->error("replicated message {} from {} not stored: {}", message.id, from_node, merged.message);
    return merged;
  }
  if (added > 0) {
    logger_->info("replicated message {} received from {}", message.id, from_node);
  }
  return Result::success(added > 0 ? "added" : "already present", added > 0 ? "1" : "0");
}

Result MuralNode::handle_pull(std::string_view after_id, std::size_t limit, SnapshotPage& out) {
  const Result ready = require_ready();
  if (!ready.ok) {
    return ready;
  }
  if (self_.offline()) {
    return Result::failure(ErrorKind::Unavailable, "node not serving snapshots (simulated down)");
  }
  out = store_.page_after(after_id, limit);
  return Result::success("Snapshot page.", std::to_string(out.messages.size()));
}

void MuralNode::wait_for_replication() {
  replication_->wait_idle();
}

}  // namespace mural
