#include "core/transport/peer_transport.hpp"

#include <mutex>

namespace mural {

void GuardedEndpoint::detach() {
  std::unique_lock lock(mutex_);
  target_ = nullptr;
}

Result GuardedEndpoint::handle_push(const Message& message, std::string_view from_node) {
  std::shared_lock lock(mutex_);
  if (target_ == nullptr) {
    return Result::failure(ErrorKind::Unavailable, "Endpoint is shut down.");
  }
  return target_->handle_push(message, from_node);
}

Result GuardedEndpoint::handle_pull(std::string_view after_id, std::size_t limit,
                                    SnapshotPage& out) {
  std::shared_lock lock(mutex_);
  if (target_ == nullptr) {
    return Result::failure(ErrorKind::Unavailable, "Endpoint is shut down.");
  }
  return target_->handle_pull(after_id, limit, out);
}

Result collect_snapshot_pages(const PageFetcher& fetch, std::vector<Message>& out) {
  out.clear();
  std::string cursor;
  for (;;) {
    SnapshotPage page;
    const Result fetched = fetch(cursor, page);
    if (!fetched.ok) {
      out.clear();
      return fetched;
    }
    for (auto& message : page.messages) {
      if (message.id <= cursor) {
        out.clear();
        return Result::failure(ErrorKind::Protocol,
                               "Snapshot page went backwards at id " + message.id + ".");
      }
      cursor = message.id;
      out.push_back(std::move(message));
    }
    if (!page.more) {
      break;
    }
    if (page.messages.empty()) {
      out.clear();
      return Result::failure(ErrorKind::Protocol, "Empty snapshot page announced more pages.");
    }
  }
  return Result::success("Snapshot received.", std::to_string(out.size()));
}

}  // namespace mural
