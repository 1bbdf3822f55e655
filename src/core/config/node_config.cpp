#include "core/config/node_config.hpp"

#include <algorithm>
#include <fstream>
#include <limits>
#include <set>

#include "core/transport/wire.hpp"
#include "core/util/canonical.hpp"

namespace mural {

namespace {

bool parse_bounded(std::string_view text, std::uint64_t min_value, std::uint64_t max_value,
                   std::uint64_t& out) {
  const auto parsed = util::parse_uint64(text);
  if (!parsed.has_value() || *parsed < min_value || *parsed > max_value) {
    return false;
  }
  out = *parsed;
  return true;
}

Result parse_peer_list(std::string_view csv, std::vector<PeerSpec>& out) {
  std::vector<PeerSpec> peers;
  for (const auto& item : util::split_csv(csv)) {
    const auto spec = parse_peer_spec(item);
    if (!spec.has_value()) {
      return Result::failure(ErrorKind::InvalidInput, "Invalid peer entry (expected id@host:port): " + item);
    }
    peers.push_back(*spec);
  }
  out = std::move(peers);
  return Result::success();
}

}  // namespace

bool is_valid_node_id(std::string_view node_id) {
  if (node_id.empty() || node_id.size() > 64) {
    return false;
  }
  return std::ranges::all_of(node_id, [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' ||
           c == '.' || c == '-';
  });
}

Result load_node_config(std::string_view path, NodeConfig& out) {
  std::ifstream in(std::string{path});
  if (!in) {
    return Result::failure(ErrorKind::InvalidInput, "Unable to open config file: " + std::string{path});
  }

  std::unordered_map<std::string, std::string> fields;
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(in, line)) {
    ++line_number;
    const std::string trimmed = util::trim_copy(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }

    const auto split = trimmed.find('=');
    if (split == std::string::npos) {
      return Result::failure(ErrorKind::InvalidInput,
                             "Config line " + std::to_string(line_number) + " is not key=value.");
    }

    const std::string key = util::trim_copy(trimmed.substr(0, split));
    const std::string value = util::trim_copy(trimmed.substr(split + 1));
    fields[key] = value;
  }

  return apply_config_fields(fields, out);
}

Result apply_config_fields(const std::unordered_map<std::string, std::string>& fields, NodeConfig& out) {
  constexpr std::uint64_t kMaxU32 = std::numeric_limits<std::uint32_t>::max();

  for (const auto& [key, value] : fields) {
    std::uint64_t number = 0;
    const auto bad_number = [&key, &value] {
      return Result::failure(ErrorKind::InvalidInput, "Invalid value for " + key + ": " + value);
    };

    if (key == "node_id") {
      out.node_id = value;
    } else if (key == "listen_host") {
      out.listen_host = value;
    } else if (key == "listen_port") {
      if (!parse_bounded(value, 0, 65535, number)) {
        return bad_number();
      }
      out.listen_port = static_cast<std::uint16_t>(number);
    } else if (key == "data_dir") {
      out.data_dir = value;
    } else if (key == "peers") {
      const Result parsed = parse_peer_list(value, out.peers);
      if (!parsed.ok) {
        return parsed;
      }
    } else if (key == "users") {
      out.users = parse_user_list(value);
    } else if (key == "admin_users") {
      out.admin_users = util::split_csv(value);
    } else if (key == "push_base_delay_ms") {
      if (!parse_bounded(value, 1, kMaxU32, number)) {
        return bad_number();
      }
      out.retry.base_delay_ms = static_cast<std::uint32_t>(number);
    } else if (key == "push_max_delay_ms") {
      if (!parse_bounded(value, 1, kMaxU32, number)) {
        return bad_number();
      }
      out.retry.max_delay_ms = static_cast<std::uint32_t>(number);
    } else if (key == "push_max_attempts") {
      if (!parse_bounded(value, 1, 100, number)) {
        return bad_number();
      }
      out.retry.max_attempts = static_cast<std::uint32_t>(number);
    } else if (key == "push_timeout_ms") {
      if (!parse_bounded(value, 1, kMaxU32, number)) {
        return bad_number();
      }
      out.retry.push_timeout_ms = static_cast<std::uint32_t>(number);
    } else if (key == "pull_timeout_ms") {
      if (!parse_bounded(value, 1, kMaxU32, number)) {
        return bad_number();
      }
      out.pull_timeout_ms = static_cast<std::uint32_t>(number);
    } else if (key == "failure_threshold") {
      if (!parse_bounded(value, 1, 1000, number)) {
        return bad_number();
      }
      out.failure_threshold = static_cast<std::uint32_t>(number);
    } else if (key == "reconcile_interval_seconds") {
      if (!parse_bounded(value, 0, 86400, number)) {
        return bad_number();
      }
      out.reconcile_interval_seconds = static_cast<std::uint32_t>(number);
    } else if (key == "replication_workers") {
      if (!parse_bounded(value, 1, 64, number)) {
        return bad_number();
      }
      out.replication_workers = static_cast<std::size_t>(number);
    } else if (key == "replication_queue_limit") {
      if (!parse_bounded(value, 1, 1'000'000, number)) {
        return bad_number();
      }
      out.replication_queue_limit = static_cast<std::size_t>(number);
    } else if (key == "server_threads") {
      if (!parse_bounded(value, 1, 64, number)) {
        return bad_number();
      }
      out.server_threads = static_cast<std::size_t>(number);
    } else if (key == "max_content_bytes") {
      if (!parse_bounded(value, 1, kMaxContentBytesLimit, number)) {
        return bad_number();
      }
      out.max_content_bytes = static_cast<std::size_t>(number);
    } else if (key == "log_level") {
      out.log_level = util::lowercase_copy(value);
    } else {
      return Result::failure(ErrorKind::InvalidInput, "Unknown config key: " + key);
    }
  }
  return Result::success();
}

Result parse_node_arguments(int argc, char** argv, NodeConfig& out) {
  // --config applies first so explicit flags always win over the file.
  for (int i = 1; i + 1 < argc; ++i) {
    if (std::string_view{argv[i]} == "--config") {
      const Result loaded = load_node_config(argv[i + 1], out);
      if (!loaded.ok) {
        return loaded;
      }
    }
  }

  std::unordered_map<std::string, std::string> overrides;
  for (int i = 1; i < argc; ++i) {
    const std::string_view flag{argv[i]};
    if (i + 1 >= argc) {
      return Result::failure(ErrorKind::InvalidInput, "Missing value for " + std::string{flag});
    }
    const std::string value{argv[++i]};

    if (flag == "--config") {
      continue;
    }
    if (flag == "--node-id") {
      overrides["node_id"] = value;
    } else if (flag == "--listen") {
      std::string host;
      std::uint16_t port = 0;
      if (!wire::split_host_port(value, host, port)) {
        return Result::failure(ErrorKind::InvalidInput, "Invalid --listen address: " + value);
      }
      overrides["listen_host"] = host;
      overrides["listen_port"] = std::to_string(port);
    } else if (flag == "--peers") {
      overrides["peers"] = value;
    } else if (flag == "--data-dir") {
      overrides["data_dir"] = value;
    } else if (flag == "--log-level") {
      overrides["log_level"] = value;
    } else {
      return Result::failure(ErrorKind::InvalidInput, "Unknown option: " + std::string{flag});
    }
  }

  return apply_config_fields(overrides, out);
}

Result validate_node_config(const NodeConfig& config) {
  if (!is_valid_node_id(config.node_id)) {
    return Result::failure(ErrorKind::InvalidInput,
                           "node_id must be 1-64 characters from [A-Za-z0-9_.-]: '" + config.node_id + "'");
  }
  if (config.listen_host.empty()) {
    return Result::failure(ErrorKind::InvalidInput, "listen_host is required.");
  }

  std::set<std::string, std::less<>> seen;
  for (const auto& peer : config.peers) {
    if (peer.peer_id == config.node_id) {
      return Result::failure(ErrorKind::InvalidInput, "Peer list must not include this node: " + peer.peer_id);
    }
    if (!seen.insert(peer.peer_id).second) {
      return Result::failure(ErrorKind::InvalidInput, "Duplicate peer id: " + peer.peer_id);
    }
  }

  if (config.users.empty()) {
    return Result::failure(ErrorKind::InvalidInput, "At least one user (name:password) must be configured.");
  }
  for (const auto& admin : config.admin_users) {
    const bool known = std::ranges::any_of(
        config.users, [&admin](const UserCredential& user) { return user.username == admin; });
    if (!known) {
      return Result::failure(ErrorKind::InvalidInput, "Admin is not a configured user: " + admin);
    }
  }
  if (config.retry.max_delay_ms < config.retry.base_delay_ms) {
    return Result::failure(ErrorKind::InvalidInput, "push_max_delay_ms must be >= push_base_delay_ms.");
  }

  static const std::set<std::string, std::less<>> kLevels = {"trace", "debug", "info", "warn",
                                                            "error", "critical", "off"};
  if (!kLevels.contains(config.log_level)) {
    return Result::failure(ErrorKind::InvalidInput, "Unknown log_level: " + config.log_level);
  }
  return Result::success();
}

}  // namespace mural
