#include "core/p2p/peer_registry.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

#include "core/util/canonical.hpp"

namespace mural {

std::optional<PeerSpec> parse_peer_spec(std::string_view text) {
  const std::string trimmed = util::trim_copy(text);
  const auto at = trimmed.find('@');
  if (at == std::string::npos || at == 0 || at + 1U >= trimmed.size()) {
    return std::nullopt;
  }

  PeerSpec spec{
      .peer_id = util::trim_copy(std::string_view{trimmed}.substr(0, at)),
      .address = util::trim_copy(std::string_view{trimmed}.substr(at + 1U)),
  };
  if (spec.peer_id.empty() || spec.address.empty()) {
    return std::nullopt;
  }
  return spec;
}

std::string format_peer_spec(const PeerEntry& peer) {
  return peer.peer_id + "@" + peer.address;
}

PeerRegistry::PeerRegistry(std::string self_id, std::uint32_t failure_threshold,
                           std::shared_ptr<spdlog::logger> logger)
    : self_id_(std::move(self_id)),
      failure_threshold_(failure_threshold == 0 ? 1 : failure_threshold),
      logger_(std::move(logger)) {}

Result PeerRegistry::add_peer(std::string_view peer_id, std::string_view address) {
  const std::string id = util::trim_copy(peer_id);
  const std::string addr = util::trim_copy(address);
  if (id.empty() || addr.empty()) {
    return Result::failure(ErrorKind::InvalidInput, "Peer id and address are required.");
  }
  if (id == self_id_) {
    return Result::failure(ErrorKind::InvalidInput, "A node cannot list itself as a peer.");
  }

  std::lock_guard lock(mutex_);
  const auto existing = std::ranges::find(peers_, id, &PeerEntry::peer_id);
  if (existing != peers_.end()) {
    if (existing->address == addr) {
      return Result::success("Peer already known.");
    }
    return Result::failure(ErrorKind::InvalidInput,
                           "Peer " + id + " already registered at " + existing->address);
  }

  peers_.push_back({
      .peer_id = id,
      .address = addr,
      .reachable = true,
      .consecutive_failures = 0,
  });
  return Result::success("Peer added.");
}

Result PeerRegistry::load_peers_dat(std::string_view path) {
  std::ifstream in(std::string{path});
  if (!in) {
    return Result::success("Peers file not found yet; it will be created after first save.");
  }

  std::string line;
  std::size_t line_number = 0;
  while (std::getline(in, line)) {
    ++line_number;
    const std::string trimmed = util::trim_copy(line);
    if (is_comment_or_empty(trimmed)) {
      continue;
    }

    const auto spec = parse_peer_spec(trimmed);
    if (!spec) {
      return Result::failure(ErrorKind::InvalidInput,
                             "peers.dat line " + std::to_string(line_number) + " is not id@host:port.");
    }
    if (spec->peer_id == self_id_) {
      continue;
    }
    const Result added = add_peer(spec->peer_id, spec->address);
    if (!added.ok) {
      return added;
    }
  }

  return Result::success("Loaded peers.dat entries.");
}

Result PeerRegistry::save_peers_dat(std::string_view path) const {
  if (path.empty()) {
    return Result::failure(ErrorKind::InvalidInput, "save_peers_dat failed: empty path.");
  }

  const std::filesystem::path file_path{std::string{path}};
  std::error_code ec;
  if (file_path.has_parent_path()) {
    std::filesystem::create_directories(file_path.parent_path(), ec);
    if (ec) {
      return Result::failure(ErrorKind::Persistence,
                             "Unable to create peers.dat directory: " + ec.message());
    }
  }

  std::ofstream out(file_path, std::ios::out | std::ios::trunc);
  if (!out) {
    return Result::failure(ErrorKind::Persistence, "Unable to write peers.dat file.");
  }

  out << "# muralnet peers.dat for " << self_id_ << "\n";
  out << "# one peer per line: id@host:port\n";
  for (const auto& peer : list_peers()) {
    out << format_peer_spec(peer) << '\n';
  }

  if (!out.good()) {
    return Result::failure(ErrorKind::Persistence, "Failed writing peers.dat file.");
  }

  return Result::success("Saved peers.dat file.");
}

std::vector<PeerEntry> PeerRegistry::list_peers() const {
  std::lock_guard lock(mutex_);
  return peers_;
}

std::optional<PeerEntry> PeerRegistry::find(std::string_view peer_id) const {
  std::lock_guard lock(mutex_);
  const auto it = std::ranges::find(peers_, peer_id, &PeerEntry::peer_id);
  if (it == peers_.end()) {
    return std::nullopt;
  }
  return *it;
}

std::size_t PeerRegistry::size() const {
  std::lock_guard lock(mutex_);
  return peers_.size();
}

void PeerRegistry::mark_result(std::string_view peer_id, bool success) {
  std::lock_guard lock(mutex_);
  const auto it = std::ranges::find(peers_, peer_id, &PeerEntry::peer_id);
  if (it == peers_.end()) {
    return;
  }

  if (success) {
    if (!it->reachable && logger_) {
      logger_->info("peer {} reachable again after {} failures", it->peer_id,
                    it->consecutive_failures);
    }
    it->consecutive_failures = 0;
    it->reachable = true;
    return;
  }

  ++it->consecutive_failures;
  if (it->reachable && it->consecutive_failures >= failure_threshold_) {
    it->reachable = false;
    if (logger_) {
      logger_->info("peer {} marked unreachable after {} consecutive failures", it->peer_id,
                    it->consecutive_failures);
    }
  }
}

bool PeerRegistry::is_comment_or_empty(std::string_view line) {
  return line.empty() || line.front() == '#';
}

}  // namespace mural
