#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mural {

enum class ErrorKind {
  None,
  InvalidInput,
  Authorization,
  DuplicateId,
  PeerUnreachable,
  ReconciliationPartial,
  Persistence,
  Unavailable,
  Protocol,
};

struct Result {
  bool ok = false;
  std::string message;
  std::string data;
  ErrorKind kind = ErrorKind::None;

  static Result success(std::string msg = {}, std::string payload = {}) {
    return {true, std::move(msg), std::move(payload), ErrorKind::None};
  }

  static Result failure(ErrorKind kind, std::string msg) {
    return {false, std::move(msg), {}, kind};
  }
};

std::string error_kind_to_string(ErrorKind kind);
ErrorKind error_kind_from_string(std::string_view text);

// Lamport timestamp. Ordered by counter, then node id.
struct LogicalTimestamp {
  std::uint64_t counter = 0;
  std::string node_id;

  auto operator<=>(const LogicalTimestamp&) const = default;
  bool operator==(const LogicalTimestamp&) const = default;
};

// Immutable once created; `id` is the merge key.
struct Message {
  std::string id;
  std::string author;
  std::string content;
  LogicalTimestamp logical_ts;
  std::string origin_node;

  bool operator==(const Message&) const = default;
};

// One slice of a message set in id order. `more` means ids after the last
// returned one remain.
struct SnapshotPage {
  std::vector<Message> messages;
  bool more = false;
};

struct PeerEntry {
  std::string peer_id;
  std::string address;
  bool reachable = true;
  std::uint32_t consecutive_failures = 0;
};

enum class Connectivity {
  Online,
  Offline,
};

struct RetryPolicy {
  std::uint32_t base_delay_ms = 200;
  std::uint32_t max_delay_ms = 5000;
  std::uint32_t max_attempts = 5;
  std::uint32_t push_timeout_ms = 3000;
};

struct PushOutcome {
  std::string peer_id;
  std::string message_id;
  bool delivered = false;
  bool suppressed = false;
  std::uint32_t attempts = 0;
  std::string last_error;
};

struct PeerReconcileReport {
  std::string peer_id;
  bool reached = false;
  std::size_t received = 0;
  std::size_t added = 0;
  std::string error;
};

struct ReconcileReport {
  std::vector<PeerReconcileReport> peers;
  std::size_t messages_added = 0;

  [[nodiscard]] bool partial_failure() const {
    for (const auto& peer : peers) {
      if (!peer.reached) {
        return true;
      }
    }
    return false;
  }
};

struct ReplicationStats {
  std::uint64_t pushes_delivered = 0;
  std::uint64_t failed_attempts = 0;
  std::uint64_t pushes_abandoned = 0;
  std::uint64_t suppressed_offline = 0;
  std::uint64_t dropped_queue_full = 0;
};

struct ReconciliationStats {
  std::uint64_t rounds = 0;
  std::uint64_t peer_failures = 0;
  std::uint64_t messages_pulled = 0;
};

struct StoreHealthReport {
  bool healthy = false;
  std::string details;
  std::string log_path;
  std::size_t message_count = 0;
  std::size_t invalid_record_count = 0;
  std::uint64_t max_counter = 0;
  std::string digest;
};

struct NodeStatusReport {
  std::string node_id;
  Connectivity connectivity = Connectivity::Online;
  std::string listen_address;
  std::uint64_t clock_counter = 0;
  StoreHealthReport store;
  std::vector<PeerEntry> peers;
  ReplicationStats replication;
  ReconciliationStats reconciliation;
};

}  // namespace mural
