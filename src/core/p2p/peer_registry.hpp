#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/logger.h>

#include "core/model/types.hpp"

namespace mural {

struct PeerSpec {
  std::string peer_id;
  std::string address;
};

// `peer_id@host:port`
std::optional<PeerSpec> parse_peer_spec(std::string_view text);
std::string format_peer_spec(const PeerEntry& peer);

// Configured peer set of one node with its believed reachability. Insertion
// order is preserved and the local node is never listed.
class PeerRegistry {
public:
  PeerRegistry(std::string self_id, std::uint32_t failure_threshold,
               std::shared_ptr<spdlog::logger> logger);

  Result add_peer(std::string_view peer_id, std::string_view address);
  Result load_peers_dat(std::string_view path);
  Result save_peers_dat(std::string_view path) const;

  [[nodiscard]] std::vector<PeerEntry> list_peers() const;
  [[nodiscard]] std::optional<PeerEntry> find(std::string_view peer_id) const;
  [[nodiscard]] std::size_t size() const;

  void mark_result(std::string_view peer_id, bool success);

  [[nodiscard]] std::uint32_t failure_threshold() const { return failure_threshold_; }

private:
  static bool is_comment_or_empty(std::string_view line);

  std::string self_id_;
  std::uint32_t failure_threshold_ = 3;
  std::shared_ptr<spdlog::logger> logger_;

  mutable std::mutex mutex_;
  std::vector<PeerEntry> peers_;
};

}  // namespace mural
