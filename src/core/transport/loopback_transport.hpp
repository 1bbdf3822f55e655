#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>

#include "core/transport/peer_transport.hpp"

namespace mural {

// In-process network used by simulations and tests. Endpoints register under
// an address; links can be cut to make a peer unreachable.
class LoopbackNetwork {
public:
  void attach(std::string_view address, std::shared_ptr<IPeerEndpoint> endpoint);
  void detach(std::string_view address);

  void set_link_down(std::string_view address, bool down);

  [[nodiscard]] std::shared_ptr<IPeerEndpoint> resolve(std::string_view address) const;
  [[nodiscard]] bool link_down(std::string_view address) const;

  void count_push(std::string_view address);
  [[nodiscard]] std::size_t push_count(std::string_view address) const;

private:
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<IPeerEndpoint>, std::less<>> endpoints_;
  std::set<std::string, std::less<>> down_links_;
  std::map<std::string, std::size_t, std::less<>> push_counts_;
};

class LoopbackTransport final : public IPeerTransport {
public:
  explicit LoopbackTransport(std::shared_ptr<LoopbackNetwork> network);

  Result push_message(const PeerEntry& peer, std::string_view from_node, const Message& message,
                      std::chrono::milliseconds timeout) override;
  Result pull_snapshot(const PeerEntry& peer, std::chrono::milliseconds timeout,
                       std::vector<Message>& out) override;

private:
  std::shared_ptr<IPeerEndpoint> reach(const PeerEntry& peer, Result& failure) const;

  std::shared_ptr<LoopbackNetwork> network_;
};

}  // namespace mural
