#pragma once

#include "core/transport/peer_transport.hpp"

namespace mural {

class TcpPeerTransport final : public IPeerTransport {
public:
  Result push_message(const PeerEntry& peer, std::string_view from_node, const Message& message,
                      std::chrono::milliseconds timeout) override;
  Result pull_snapshot(const PeerEntry& peer, std::chrono::milliseconds timeout,
                       std::vector<Message>& out) override;
};

}  // namespace mural
