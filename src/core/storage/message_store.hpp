#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"
#include "core/storage/message_log.hpp"

namespace mural {

// Authoritative message set of one node, keyed by message id. Writers are
// serialized; readers share the lock and always see a whole merge.
class MessageStore {
public:
  explicit MessageStore(std::unique_ptr<IMessageLog> log);

  Result open();

  Result insert(const Message& message);
  Result merge(const std::vector<Message>& incoming, std::size_t& out_added);

  [[nodiscard]] std::vector<Message> snapshot() const;
  [[nodiscard]] std::vector<Message> ordered_view() const;
  // Up to `limit` messages with ids strictly after `after_id` (empty = from
  // the start), in id order.
  [[nodiscard]] SnapshotPage page_after(std::string_view after_id, std::size_t limit) const;

  [[nodiscard]] bool contains(std::string_view id) const;
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::uint64_t max_counter() const;
  [[nodiscard]] std::uint64_t max_sequence_for(std::string_view origin_node) const;
  [[nodiscard]] std::string digest() const;
  [[nodiscard]] StoreHealthReport health_report() const;

private:
  void index_locked(const Message& message);
  [[nodiscard]] std::string digest_locked() const;

  mutable std::shared_mutex mutex_;
  std::unique_ptr<IMessageLog> log_;
  std::map<std::string, Message, std::less<>> messages_;
  std::uint64_t max_counter_ = 0;
  std::size_t rejected_on_load_ = 0;
  bool opened_ = false;
};

// Display order: logical timestamp ascending, ties broken by id.
bool display_before(const Message& lhs, const Message& rhs);

}  // namespace mural
