#pragma once

#include <string>
#include <string_view>

#include "core/service/mural_node.hpp"
#include "core/transport/wire.hpp"

namespace mural {

// Maps framed requests onto one node. Peer ops (push, pull) and client ops
// (login, post, list, ...) share the same socket and framing.
class NodeApi {
public:
  explicit NodeApi(MuralNode& node) : node_(node) {}

  // Never throws; malformed requests get a Protocol response.
  std::string handle(std::string_view request);

  Result dispatch(const wire::Fields& request, std::vector<std::pair<std::string, std::string>>& reply);

private:
  Result on_push(const wire::Fields& request);
  Result on_pull(const wire::Fields& request, std::vector<std::pair<std::string, std::string>>& reply);
  Result on_post(const wire::Fields& request, std::vector<std::pair<std::string, std::string>>& reply);
  Result on_list(const wire::Fields& request, std::vector<std::pair<std::string, std::string>>& reply);
  Result on_connectivity(const wire::Fields& request, bool online,
                         std::vector<std::pair<std::string, std::string>>& reply);
  Result on_reconcile(std::vector<std::pair<std::string, std::string>>& reply);
  Result on_peers(std::vector<std::pair<std::string, std::string>>& reply);
  Result on_status(std::vector<std::pair<std::string, std::string>>& reply);

  MuralNode& node_;
};

// Peers as tab-separated `id address reachable failures` lines.
std::string encode_peer_lines(const std::vector<PeerEntry>& peers);

}  // namespace mural
