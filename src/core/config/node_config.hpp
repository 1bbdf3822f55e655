#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "core/auth/auth_gate.hpp"
#include "core/model/app_meta.hpp"
#include "core/model/types.hpp"
#include "core/p2p/peer_registry.hpp"

namespace mural {

// Keeps one hex-encoded message well inside a snapshot page frame.
inline constexpr std::size_t kMaxContentBytesLimit = 1U << 20U;

struct NodeConfig {
  std::string node_id;
  std::string listen_host = "127.0.0.1";
  std::uint16_t listen_port = kDefaultListenPort;
  std::string data_dir = "mural-data";
  std::vector<PeerSpec> peers;
  std::vector<UserCredential> users;
  // Users allowed to take the node offline or bring it back over the wire.
  std::vector<std::string> admin_users;

  RetryPolicy retry;
  std::uint32_t pull_timeout_ms = 4000;
  std::uint32_t failure_threshold = 3;
  std::uint32_t reconcile_interval_seconds = 0;
  std::size_t replication_workers = 4;
  std::size_t replication_queue_limit = 1024;
  std::size_t server_threads = 2;
  std::size_t max_content_bytes = 4096;  // at most kMaxContentBytesLimit
  std::string log_level = "info";
};

// Reads a `key=value` file; blank lines and `#` comments are ignored.
Result load_node_config(std::string_view path, NodeConfig& out);

// Unknown keys are rejected so typos do not silently fall back to defaults.
Result apply_config_fields(const std::unordered_map<std::string, std::string>& fields, NodeConfig& out);

// Command-line overrides: --config, --node-id, --listen host:port,
// --peers csv, --data-dir, --log-level.
Result parse_node_arguments(int argc, char** argv, NodeConfig& out);

Result validate_node_config(const NodeConfig& config);

bool is_valid_node_id(std::string_view node_id);

}  // namespace mural
