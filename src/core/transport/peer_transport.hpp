#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"

namespace mural {

inline constexpr std::size_t kDefaultPullPageLimit = 256;
inline constexpr std::size_t kMaxPullPageLimit = 1024;

// Receiving side of the node-to-node RPCs.
class IPeerEndpoint {
public:
  virtual ~IPeerEndpoint() = default;

  // Idempotent: a message whose id is already stored is acknowledged.
  virtual Result handle_push(const Message& message, std::string_view from_node) = 0;
  // Messages with ids after `after_id`, at most `limit` of them.
  virtual Result handle_pull(std::string_view after_id, std::size_t limit, SnapshotPage& out) = 0;
};

// Sending side. Failures come back as PeerUnreachable, Unavailable or
// Protocol results; nothing is thrown.
class IPeerTransport {
public:
  virtual ~IPeerTransport() = default;

  virtual Result push_message(const PeerEntry& peer, std::string_view from_node,
                              const Message& message, std::chrono::milliseconds timeout) = 0;
  virtual Result pull_snapshot(const PeerEntry& peer, std::chrono::milliseconds timeout,
                               std::vector<Message>& out) = 0;
};

// Forwards to a target that may be detached while calls are in flight;
// calls after detach() answer Unavailable.
class GuardedEndpoint final : public IPeerEndpoint {
public:
  explicit GuardedEndpoint(IPeerEndpoint* target) : target_(target) {}

  void detach();

  Result handle_push(const Message& message, std::string_view from_node) override;
  Result handle_pull(std::string_view after_id, std::size_t limit, SnapshotPage& out) override;

private:
  std::shared_mutex mutex_;
  IPeerEndpoint* target_ = nullptr;
};

using PageFetcher = std::function<Result(std::string_view after_id, SnapshotPage& page)>;

// Follows the id cursor until a page reports nothing more. A page that does
// not move the cursor forward is a Protocol failure.
Result collect_snapshot_pages(const PageFetcher& fetch, std::vector<Message>& out);

}  // namespace mural
