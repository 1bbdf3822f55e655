#include "core/transport/loopback_transport.hpp"

namespace mural {

void LoopbackNetwork::attach(std::string_view address, std::shared_ptr<IPeerEndpoint> endpoint) {
  std::lock_guard lock(mutex_);
  endpoints_.insert_or_assign(std::string{address}, std::move(endpoint));
}

void LoopbackNetwork::detach(std::string_view address) {
  std::lock_guard lock(mutex_);
  const auto it = endpoints_.find(address);
  if (it != endpoints_.end()) {
    endpoints_.erase(it);
  }
}

void LoopbackNetwork::set_link_down(std::string_view address, bool down) {
  std::lock_guard lock(mutex_);
  if (down) {
    down_links_.emplace(address);
    return;
  }
  const auto it = down_links_.find(address);
  if (it != down_links_.end()) {
    down_links_.erase(it);
  }
}

std::shared_ptr<IPeerEndpoint> LoopbackNetwork::resolve(std::string_view address) const {
  std::lock_guard lock(mutex_);
  const auto it = endpoints_.find(address);
  return it == endpoints_.end() ? nullptr : it->second;
}

bool LoopbackNetwork::link_down(std::string_view address) const {
  std::lock_guard lock(mutex_);
  return down_links_.contains(address);
}

void LoopbackNetwork::count_push(std::string_view address) {
  std::lock_guard lock(mutex_);
  const auto it = push_counts_.find(address);
  if (it == push_counts_.end()) {
    push_counts_.emplace(std::string{address}, 1U);
  } else {
    ++it->second;
  }
}

std::size_t LoopbackNetwork::push_count(std::string_view address) const {
  std::lock_guard lock(mutex_);
  const auto it = push_counts_.find(address);
  return it == push_counts_.end() ? 0U : it->second;
}

LoopbackTransport::LoopbackTransport(std::shared_ptr<LoopbackNetwork> network)
    : network_(std::move(network)) {}

Result LoopbackTransport::push_message(const PeerEntry& peer, std::string_view from_node,
                                       const Message& message,
                                       std::chrono::milliseconds timeout) {
  (void)timeout;
  Result failure;
  const auto endpoint = reach(peer, failure);
  if (endpoint == nullptr) {
    return failure;
  }
  network_->count_push(peer.address);
  return endpoint->handle_push(message, from_node);
}

Result LoopbackTransport::pull_snapshot(const PeerEntry& peer, std::chrono::milliseconds timeout,
                                        std::vector<Message>& out) {
  (void)timeout;
  Result failure;
  const auto endpoint = reach(peer, failure);
  if (endpoint == nullptr) {
    return failure;
  }
  return collect_snapshot_pages(
      [&endpoint](std::string_view after_id, SnapshotPage& page) {
        return endpoint->handle_pull(after_id, kDefaultPullPageLimit, page);
      },
      out);
}

std::shared_ptr<IPeerEndpoint> LoopbackTransport::reach(const PeerEntry& peer,
                                                        Result& failure) const {
  if (network_ == nullptr || network_->link_down(peer.address)) {
    failure = Result::failure(ErrorKind::PeerUnreachable, "Link to " + peer.address + " is down.");
    return nullptr;
  }
  auto endpoint = network_->resolve(peer.address);
  if (endpoint == nullptr) {
    failure = Result::failure(ErrorKind::PeerUnreachable,
                              "Connection refused by " + peer.address + ".");
  }
  return endpoint;
}

}  // namespace mural
